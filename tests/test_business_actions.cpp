#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/actions/business_actions.hpp"

#include "fakes.hpp"

#include <string>

using voice_bridge::actions::ActionContext;
using voice_bridge::actions::ActionRegistry;
using voice_bridge::actions::BusinessActionSettings;
using voice_bridge::actions::ClaimRecord;
using voice_bridge::actions::make_portal_link;
using voice_bridge::actions::register_business_actions;
using voice_bridge::testing::FakeDirectory;
using voice_bridge::testing::FakeSender;
using voice_bridge::testing::make_customer;
using nlohmann::json;

namespace {

struct Fixture {
    FakeDirectory directory;
    FakeSender sender;
    ActionRegistry registry;
    ActionContext context;

    Fixture() {
        BusinessActionSettings settings;
        settings.portal_base_url = "https://portal.example.co.uk";
        settings.review_url = "https://reviews.example.co.uk/rmc";
        register_business_actions(registry, directory, sender, settings);
        context.call_sid = "CA1";
        context.stream_sid = "MZ1";
        context.caller_phone = "07700900123";
        context.provider = "realtime";
    }

    json run(const std::string& action, const json& params) {
        return registry.execute(action, context, params);
    }
};

}

TEST_CASE("all business actions are registered") {
    Fixture f;
    REQUIRE(f.registry.size() == 7);
    for (const char* name : {"schedule_callback", "send_portal_link", "send_review_link",
                             "send_document_link", "check_user_details",
                             "check_claim_details", "check_requirements"}) {
        REQUIRE(f.registry.contains(name));
    }
}

TEST_CASE("schedule_callback records the request and confirms by SMS") {
    Fixture f;
    f.directory.customers["07700900123"] = make_customer("u42", "Sam", "Sam Taylor", 2);

    const auto result = f.run("schedule_callback", json{{"preferred_time", "tomorrow 2pm"}});

    REQUIRE(result["success"] == true);
    REQUIRE(result["data"]["scheduled_for"] == "tomorrow 2pm");
    REQUIRE(result["data"]["reason"] == "General inquiry");
    REQUIRE(result["data"]["confirmation_sent"] == true);
    REQUIRE(f.directory.callbacks.size() == 1);
    REQUIRE(f.directory.callbacks[0].customer_id == std::optional<std::string>("u42"));
    REQUIRE(f.sender.messages.size() == 1);
    REQUIRE(f.sender.messages[0].first == "+447700900123");
    REQUIRE(f.sender.messages[0].second.find("Hi Sam") == 0);
}

TEST_CASE("schedule_callback still succeeds when the confirmation fails") {
    Fixture f;
    f.sender.fail = true;
    const auto result = f.run("schedule_callback",
                              json{{"preferred_time", "Monday morning"}, {"reason", "PPI"}});
    REQUIRE(result["success"] == true);
    REQUIRE(result["data"]["confirmation_sent"] == false);
    REQUIRE(result["data"]["reason"] == "PPI");
}

TEST_CASE("send_portal_link needs a known customer") {
    Fixture f;
    const auto result = f.run("send_portal_link", json{{"method", "sms"}});
    REQUIRE(result["success"] == false);
    REQUIRE(result["data"]["user_found"] == false);
    REQUIRE(f.sender.messages.empty());
}

TEST_CASE("send_portal_link texts a tokenised link") {
    Fixture f;
    f.directory.customers["07700900123"] = make_customer("u42", "Sam", "Sam Taylor", 1);

    const auto result =
        f.run("send_portal_link", json{{"method", "sms"}, {"link_type", "status"}});

    REQUIRE(result["success"] == true);
    const auto url = result["data"]["portal_url"].get<std::string>();
    REQUIRE(url.find("https://portal.example.co.uk/status?token=") == 0);
    REQUIRE(url.find("&user=u42") != std::string::npos);
    REQUIRE(f.sender.messages.size() == 1);
    REQUIRE(f.sender.messages[0].second.find(url) != std::string::npos);
}

TEST_CASE("email delivery is reported as unavailable") {
    Fixture f;
    f.directory.customers["07700900123"] = make_customer("u42", "Sam", "Sam Taylor", 1);
    const auto result = f.run("send_document_link", json{{"method", "email"}});
    REQUIRE(result["success"] == false);
    REQUIRE(result["error"] == "Email sending not available in voice service yet");
    REQUIRE(result["data"]["delivery_failed"] == true);
}

TEST_CASE("send_review_link works for unidentified callers") {
    Fixture f;
    const auto result = f.run("send_review_link", json{{"method", "sms"}});
    REQUIRE(result["success"] == true);
    REQUIRE(result["data"]["review_url"] == "https://reviews.example.co.uk/rmc");
    REQUIRE(f.sender.messages[0].second.find("Hello,") == 0);
}

TEST_CASE("check_user_details reports found and missing customers") {
    Fixture f;
    f.directory.customers["07700900999"] = make_customer("u7", "Alex", "Alex Smith", 3);
    ClaimRecord claim;
    claim.found = true;
    claim.reference = "RMC-1001";
    claim.status = "under_review";
    claim.lender = "Big Bank";
    f.directory.claims["RMC-1001"] = claim;

    const auto missing = f.run("check_user_details", json{{"phone_number", "07700900000"}});
    REQUIRE(missing["success"] == true);
    REQUIRE(missing["data"]["user_found"] == false);
    REQUIRE(missing["data"]["phone_searched"] == "077****0000");

    const auto found = f.run("check_user_details",
                             json{{"phone_number", "07700900999"},
                                  {"claim_reference", "RMC-1001"}});
    REQUIRE(found["data"]["user_found"] == true);
    REQUIRE(found["data"]["claim_count"] == 3);
    REQUIRE(found["data"]["claim"]["lender"] == "Big Bank");
    REQUIRE(found["message"].get<std::string>().find("3 claims") != std::string::npos);
}

TEST_CASE("check_claim_details describes the claim status") {
    Fixture f;
    ClaimRecord claim;
    claim.found = true;
    claim.reference = "RMC-2002";
    claim.status = "approved";
    claim.lender = "Car Finance Ltd";
    claim.amount = 1250.0;
    f.directory.claims["RMC-2002"] = claim;

    const auto result = f.run("check_claim_details", json{{"claim_reference", "RMC-2002"}});
    REQUIRE(result["data"]["status_description"] == "approved for compensation");
    REQUIRE(result["data"]["estimated_amount"] == 1250.0);

    const auto missing = f.run("check_claim_details", json{{"claim_reference", "RMC-0"}});
    REQUIRE(missing["success"] == true);
    REQUIRE(missing["data"]["claim_found"] == false);
}

TEST_CASE("directory failures surface as action failures") {
    Fixture f;
    f.directory.fail_lookups = true;
    const auto result = f.run("check_claim_details", json{{"claim_reference", "RMC-1"}});
    REQUIRE(result["success"] == false);
    REQUIRE(result["error"] == "directory unavailable");
}

TEST_CASE("check_requirements lists outstanding items") {
    Fixture f;
    f.directory.requirements["RMC-3"] = {"proof of address", "signed letter of authority"};
    const auto result = f.run("check_requirements", json{{"claim_reference", "RMC-3"}});
    REQUIRE(result["data"]["outstanding_count"] == 2);
    REQUIRE(result["message"] ==
            "Claim RMC-3 still needs: proof of address and signed letter of authority.");
}

TEST_CASE("make_portal_link maps link types to portal paths") {
    const auto upload = make_portal_link("https://p.example", "documents", "u1");
    REQUIRE(upload.find("https://p.example/upload?token=") == 0);
    const auto fallback = make_portal_link("https://p.example", "unknown", "u1");
    REQUIRE(fallback.find("https://p.example/claims?token=") == 0);
    // 32 random bytes as hex.
    const auto token_start = upload.find("token=") + 6;
    const auto token_end = upload.find("&user=");
    REQUIRE(token_end - token_start == 64);
}
