#pragma once

#include <memory>
#include <string>

#include "voice_bridge/actions/services.hpp"
#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/config.hpp"

namespace voice_bridge {

// CustomerDirectory over the business REST API.
class HttpCustomerDirectory : public actions::CustomerDirectory {
public:
    explicit HttpCustomerDirectory(std::unique_ptr<ServiceClient> client);

    actions::CustomerRecord find_customer_by_phone(const std::string& phone) override;
    actions::ClaimRecord get_claim(const std::string& reference) override;
    std::vector<std::string> get_open_requirements(const std::string& reference) override;
    actions::CallbackRecord schedule_callback(const actions::CallbackRequest& request) override;

    static actions::CustomerRecord parse_customer(const nlohmann::json& body);
    static actions::ClaimRecord parse_claim(const nlohmann::json& body);

private:
    std::unique_ptr<ServiceClient> client_;
};

// Used when no business API is configured. Every lookup reports not found
// and callbacks are only logged.
class OfflineCustomerDirectory : public actions::CustomerDirectory {
public:
    actions::CustomerRecord find_customer_by_phone(const std::string& phone) override;
    actions::ClaimRecord get_claim(const std::string& reference) override;
    std::vector<std::string> get_open_requirements(const std::string& reference) override;
    actions::CallbackRecord schedule_callback(const actions::CallbackRequest& request) override;
};

class TwilioSmsSender : public actions::MessageSender {
public:
    TwilioSmsSender(std::string account_sid, std::string auth_token, std::string from_number);

    actions::DeliveryResult send_sms(const std::string& to, const std::string& body) override;

private:
    std::string account_sid_;
    std::string from_number_;
    ServiceClient client_;
};

class LoggingSmsSender : public actions::MessageSender {
public:
    actions::DeliveryResult send_sms(const std::string& to, const std::string& body) override;
};

std::unique_ptr<actions::CustomerDirectory> make_customer_directory(const Config& config);
std::unique_ptr<actions::MessageSender> make_message_sender(const Config& config);

}
