#include "voice_bridge/backend/http_services.hpp"

#include <chrono>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"
#include "voice_bridge/utils/phone.hpp"

namespace voice_bridge {

namespace {

constexpr const char* kTwilioApiUrl = "https://api.twilio.com";

std::string string_field(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

}

HttpCustomerDirectory::HttpCustomerDirectory(std::unique_ptr<ServiceClient> client)
    : client_(std::move(client)) {}

actions::CustomerRecord HttpCustomerDirectory::parse_customer(const nlohmann::json& body) {
    actions::CustomerRecord record;
    const auto& customer = body.contains("customer") ? body.at("customer") : body;
    if (!customer.is_object() || !customer.contains("id") || customer.at("id").is_null()) {
        return record;
    }
    record.found = true;
    record.id = string_field(customer, "id");
    record.first_name = string_field(customer, "first_name");
    record.full_name = string_field(customer, "full_name");
    if (record.full_name.empty()) {
        const auto last_name = string_field(customer, "last_name");
        record.full_name = last_name.empty() ? record.first_name
                                             : record.first_name + " " + last_name;
    }
    record.claim_count = customer.value("claim_count", 0);
    return record;
}

actions::ClaimRecord HttpCustomerDirectory::parse_claim(const nlohmann::json& body) {
    actions::ClaimRecord record;
    const auto& claim = body.contains("claim") ? body.at("claim") : body;
    if (!claim.is_object() || !claim.contains("reference")) {
        return record;
    }
    record.found = true;
    record.reference = string_field(claim, "reference");
    record.status = string_field(claim, "status");
    record.lender = string_field(claim, "lender");
    const auto amount = claim.find("amount");
    if (amount != claim.end() && amount->is_number()) {
        record.amount = amount->get<double>();
    }
    return record;
}

actions::CustomerRecord HttpCustomerDirectory::find_customer_by_phone(const std::string& phone) {
    try {
        return parse_customer(
            client_->get_json(utils::append_query("/customers", "phone", phone)));
    } catch (const ServicePermissionError&) {
        throw;
    } catch (const ServiceError& ex) {
        if (ex.status() == 404) {
            return actions::CustomerRecord{};
        }
        throw;
    }
}

actions::ClaimRecord HttpCustomerDirectory::get_claim(const std::string& reference) {
    try {
        return parse_claim(client_->get_json("/claims/" + utils::url_encode(reference)));
    } catch (const ServicePermissionError&) {
        throw;
    } catch (const ServiceError& ex) {
        if (ex.status() == 404) {
            return actions::ClaimRecord{};
        }
        throw;
    }
}

std::vector<std::string> HttpCustomerDirectory::get_open_requirements(
    const std::string& reference) {
    const auto body = client_->get_json("/claims/" + utils::url_encode(reference) +
                                        "/requirements");
    const auto& items = body.contains("requirements") ? body.at("requirements") : body;
    std::vector<std::string> requirements;
    if (!items.is_array()) {
        return requirements;
    }
    for (const auto& item : items) {
        if (item.is_string()) {
            requirements.push_back(item.get<std::string>());
        } else if (item.is_object()) {
            const auto name = string_field(item, "name");
            requirements.push_back(name.empty() ? string_field(item, "type") : name);
        }
    }
    return requirements;
}

actions::CallbackRecord HttpCustomerDirectory::schedule_callback(
    const actions::CallbackRequest& request) {
    nlohmann::json body{
        {"call_sid", request.call_sid},
        {"phone_number", request.phone_number},
        {"preferred_time", request.preferred_time},
        {"reason", request.reason},
        {"source", "ai_voice"}};
    if (request.customer_id) {
        body["customer_id"] = *request.customer_id;
    }
    const auto response = client_->post_json("/callbacks", body);
    const auto& callback = response.contains("callback") ? response.at("callback") : response;
    return actions::CallbackRecord{string_field(callback, "id"),
                                   string_field(callback, "scheduled_for")};
}

actions::CustomerRecord OfflineCustomerDirectory::find_customer_by_phone(const std::string&) {
    return actions::CustomerRecord{};
}

actions::ClaimRecord OfflineCustomerDirectory::get_claim(const std::string&) {
    return actions::ClaimRecord{};
}

std::vector<std::string> OfflineCustomerDirectory::get_open_requirements(const std::string&) {
    return {};
}

actions::CallbackRecord OfflineCustomerDirectory::schedule_callback(
    const actions::CallbackRequest& request) {
    logging::CallLog(request.call_sid, "").info(
        "Callback recorded without business API",
        {kv("phone", utils::mask_phone_number(request.phone_number)),
         kv("preferred_time", request.preferred_time)});
    return actions::CallbackRecord{"offline_" + utils::random_hex(4), request.preferred_time};
}

TwilioSmsSender::TwilioSmsSender(std::string account_sid, std::string auth_token,
                                 std::string from_number)
    : account_sid_(std::move(account_sid)),
      from_number_(std::move(from_number)),
      client_(kTwilioApiUrl, std::nullopt, ServiceRequestOptions{},
              BasicCredentials{account_sid_, std::move(auth_token)}) {}

actions::DeliveryResult TwilioSmsSender::send_sms(const std::string& to,
                                                  const std::string& body) {
    const auto path = "/2010-04-01/Accounts/" + account_sid_ + "/Messages.json";
    try {
        const auto response = client_.post_form(
            path, {{"To", to}, {"From", from_number_}, {"Body", body}});
        const auto sid = response.value("sid", std::string());
        logging::info(
            "SMS sent",
            {kv("to", utils::mask_phone_number(to)), kv("message_sid", sid)});
        return actions::DeliveryResult{true, sid, ""};
    } catch (const std::exception& ex) {
        logging::error(
            "SMS send failed",
            {kv("to", utils::mask_phone_number(to)), kv("error", ex.what())});
        return actions::DeliveryResult{false, "", ex.what()};
    }
}

actions::DeliveryResult LoggingSmsSender::send_sms(const std::string& to,
                                                   const std::string& body) {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    const auto message_id = "voice_" + std::to_string(now) + "_" + utils::random_hex(4);
    logging::info(
        "SMS delivery disabled, message logged only",
        {kv("to", utils::mask_phone_number(to)),
         kv("message_id", message_id),
         kv("length", body.size())});
    return actions::DeliveryResult{true, message_id, ""};
}

std::unique_ptr<actions::CustomerDirectory> make_customer_directory(const Config& config) {
    if (!config.business_api_url) {
        logging::warn("BUSINESS_API_URL not set, customer lookups disabled");
        return std::make_unique<OfflineCustomerDirectory>();
    }
    ServiceRequestOptions options;
    options.request_timeout = std::chrono::milliseconds(
        static_cast<long long>(config.business_api_timeout * 1000.0));
    return std::make_unique<HttpCustomerDirectory>(std::make_unique<ServiceClient>(
        *config.business_api_url, config.business_api_token, options));
}

std::unique_ptr<actions::MessageSender> make_message_sender(const Config& config) {
    if (config.enable_real_sms && config.twilio_account_sid && config.twilio_auth_token &&
        config.twilio_from_number) {
        return std::make_unique<TwilioSmsSender>(*config.twilio_account_sid,
                                                 *config.twilio_auth_token,
                                                 *config.twilio_from_number);
    }
    if (config.enable_real_sms) {
        logging::warn("ENABLE_REAL_SMS set but Twilio credentials are incomplete");
    }
    return std::make_unique<LoggingSmsSender>();
}

}
