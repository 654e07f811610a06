#pragma once

#include <optional>
#include <string>
#include <vector>

namespace voice_bridge {
namespace actions {

struct CustomerRecord {
    bool found = false;
    std::string id;
    std::string full_name;
    std::string first_name;
    int claim_count = 0;
};

struct ClaimRecord {
    bool found = false;
    std::string reference;
    std::string status;
    std::string lender;
    std::optional<double> amount;
};

struct CallbackRequest {
    std::string call_sid;
    std::string phone_number;
    std::optional<std::string> customer_id;
    std::string preferred_time;
    std::string reason;
};

struct CallbackRecord {
    std::string id;
    std::string scheduled_for;
};

struct DeliveryResult {
    bool success = false;
    std::string provider_message_id;
    std::string error;
};

// Customer and claim lookups. Implementations throw on transport failure;
// "not found" is reported through the record's found flag.
class CustomerDirectory {
public:
    virtual ~CustomerDirectory() = default;

    virtual CustomerRecord find_customer_by_phone(const std::string& phone) = 0;
    virtual ClaimRecord get_claim(const std::string& reference) = 0;
    virtual std::vector<std::string> get_open_requirements(const std::string& reference) = 0;
    virtual CallbackRecord schedule_callback(const CallbackRequest& request) = 0;
};

class MessageSender {
public:
    virtual ~MessageSender() = default;

    virtual DeliveryResult send_sms(const std::string& to, const std::string& body) = 0;
};

}
}
