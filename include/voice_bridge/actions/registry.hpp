#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace actions {

class ActionParameterError : public std::runtime_error {
public:
    explicit ActionParameterError(const std::string& message) : std::runtime_error(message) {}
};

struct ActionContext {
    std::string call_sid;
    std::string stream_sid;
    std::string caller_phone;
    std::optional<std::string> customer_id;
    std::string provider;
};

struct ParameterSpec {
    std::string type = "string";
    std::string description;
    std::vector<std::string> allowed_values;
};

struct ActionSpec {
    std::string description;
    std::vector<std::string> required;
    std::vector<std::string> optional;
    std::map<std::string, ParameterSpec> properties;
};

using ActionHandler =
    std::function<nlohmann::json(const ActionContext&, const nlohmann::json&)>;

// Name to handler map for business actions. Provider and transport agnostic:
// adapters read list_capabilities() and sessions call execute().
class ActionRegistry {
public:
    void register_action(const std::string& name, ActionSpec spec, ActionHandler handler);

    // Never throws. Unknown actions, invalid parameters and handler
    // exceptions all come back as {"success": false, "error": ...}.
    nlohmann::json execute(const std::string& name,
                           const ActionContext& context,
                           const nlohmann::json& params) const;

    nlohmann::json list_capabilities() const;
    bool contains(const std::string& name) const;
    size_t size() const;

    // Returns params with null optional values removed.
    static nlohmann::json validate_parameters(const ActionSpec& spec,
                                              const nlohmann::json& params);

private:
    struct Entry {
        ActionSpec spec;
        ActionHandler handler;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> actions_;
};

}
}
