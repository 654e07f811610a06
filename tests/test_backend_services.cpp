#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/backend/http_services.hpp"

#include <string>

using voice_bridge::Config;
using voice_bridge::HttpCustomerDirectory;
using voice_bridge::LoggingSmsSender;
using voice_bridge::OfflineCustomerDirectory;
using voice_bridge::ServiceClient;
using voice_bridge::ServiceRequestOptions;
using nlohmann::json;

TEST_CASE("parse_customer accepts wrapped and bare records") {
    const auto wrapped = HttpCustomerDirectory::parse_customer(
        json{{"customer",
              {{"id", 42}, {"first_name", "Sam"}, {"last_name", "Taylor"}, {"claim_count", 3}}}});
    REQUIRE(wrapped.found);
    REQUIRE(wrapped.id == "42");
    REQUIRE(wrapped.full_name == "Sam Taylor");
    REQUIRE(wrapped.claim_count == 3);

    const auto bare = HttpCustomerDirectory::parse_customer(
        json{{"id", "u1"}, {"first_name", "Alex"}, {"full_name", "Alex J Smith"}});
    REQUIRE(bare.full_name == "Alex J Smith");
    REQUIRE(bare.claim_count == 0);

    REQUIRE_FALSE(HttpCustomerDirectory::parse_customer(json{{"customer", nullptr}}).found);
    REQUIRE_FALSE(HttpCustomerDirectory::parse_customer(json::object()).found);
}

TEST_CASE("parse_claim keeps the optional amount") {
    const auto claim = HttpCustomerDirectory::parse_claim(
        json{{"claim",
              {{"reference", "RMC-1"}, {"status", "paid"}, {"lender", "Bank"}, {"amount", 99.5}}}});
    REQUIRE(claim.found);
    REQUIRE(claim.reference == "RMC-1");
    REQUIRE(claim.amount == std::optional<double>(99.5));

    const auto no_amount =
        HttpCustomerDirectory::parse_claim(json{{"reference", "RMC-2"}, {"amount", nullptr}});
    REQUIRE(no_amount.found);
    REQUIRE_FALSE(no_amount.amount);
    REQUIRE_FALSE(HttpCustomerDirectory::parse_claim(json{{"error", "x"}}).found);
}

TEST_CASE("ServiceClient joins base paths") {
    ServiceClient client("http://localhost:9000/api/v1", std::nullopt, ServiceRequestOptions{});
    REQUIRE(client.build_path("/customers") == "/api/v1/customers");
    REQUIRE(client.build_path("claims/1") == "/api/v1/claims/1");

    ServiceClient root("http://localhost:9000", std::nullopt, ServiceRequestOptions{});
    REQUIRE(root.build_path("/callbacks") == "/callbacks");
}

TEST_CASE("the offline directory finds nobody but records callbacks") {
    OfflineCustomerDirectory directory;
    REQUIRE_FALSE(directory.find_customer_by_phone("+447700900123").found);
    REQUIRE_FALSE(directory.get_claim("RMC-1").found);
    REQUIRE(directory.get_open_requirements("RMC-1").empty());

    voice_bridge::actions::CallbackRequest request;
    request.call_sid = "CA1";
    request.phone_number = "+447700900123";
    request.preferred_time = "Friday 10am";
    const auto record = directory.schedule_callback(request);
    REQUIRE(record.id.find("offline_") == 0);
    REQUIRE(record.scheduled_for == "Friday 10am");
}

TEST_CASE("the logging sender reports a mock message id") {
    LoggingSmsSender sender;
    const auto result = sender.send_sms("+447700900123", "hello");
    REQUIRE(result.success);
    REQUIRE(result.provider_message_id.find("voice_") == 0);
}

TEST_CASE("factories fall back to offline services") {
    Config config;
    REQUIRE(dynamic_cast<OfflineCustomerDirectory*>(
        voice_bridge::make_customer_directory(config).get()));
    config.enable_real_sms = true;
    REQUIRE(dynamic_cast<LoggingSmsSender*>(voice_bridge::make_message_sender(config).get()));

    config.business_api_url = "http://localhost:9000/api";
    REQUIRE(dynamic_cast<HttpCustomerDirectory*>(
        voice_bridge::make_customer_directory(config).get()));
}
