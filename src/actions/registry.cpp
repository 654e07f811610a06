#include "voice_bridge/actions/registry.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/phone.hpp"

namespace voice_bridge::actions {

namespace {

bool contains_name(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool matches_type(const std::string& type, const nlohmann::json& value) {
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    return true;
}

nlohmann::json sanitize_for_log(const nlohmann::json& params) {
    if (!params.is_object()) {
        return params;
    }
    auto sanitized = params;
    for (auto it = sanitized.begin(); it != sanitized.end(); ++it) {
        if (it.value().is_string() && it.key().find("phone") != std::string::npos) {
            it.value() = utils::mask_phone_number(it.value().get<std::string>());
        }
    }
    return sanitized;
}

nlohmann::json failure(const std::string& message) {
    return nlohmann::json{{"success", false}, {"error", message}};
}

}

void ActionRegistry::register_action(const std::string& name, ActionSpec spec,
                                     ActionHandler handler) {
    if (name.empty()) {
        throw std::invalid_argument("action name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("action handler must be set: " + name);
    }
    for (const auto& param : spec.required) {
        if (contains_name(spec.optional, param)) {
            throw std::invalid_argument("parameter declared both required and optional: " +
                                        param);
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!actions_.emplace(name, Entry{std::move(spec), std::move(handler)}).second) {
            throw std::invalid_argument("action already registered: " + name);
        }
    }
    logging::debug("Action registered", {kv("action", name)});
}

nlohmann::json ActionRegistry::validate_parameters(const ActionSpec& spec,
                                                   const nlohmann::json& params) {
    if (params.is_null()) {
        if (!spec.required.empty()) {
            throw ActionParameterError("missing required parameter: " + spec.required.front());
        }
        return nlohmann::json::object();
    }
    if (!params.is_object()) {
        throw ActionParameterError("parameters must be a JSON object");
    }

    nlohmann::json cleaned = nlohmann::json::object();
    for (auto it = params.begin(); it != params.end(); ++it) {
        const auto& key = it.key();
        const bool is_required = contains_name(spec.required, key);
        if (!is_required && !contains_name(spec.optional, key)) {
            throw ActionParameterError("unexpected parameter: " + key);
        }
        if (it.value().is_null()) {
            if (is_required) {
                throw ActionParameterError("missing required parameter: " + key);
            }
            continue;
        }
        const auto prop = spec.properties.find(key);
        if (prop != spec.properties.end()) {
            if (!matches_type(prop->second.type, it.value())) {
                throw ActionParameterError("parameter " + key + " must be of type " +
                                           prop->second.type);
            }
            const auto& allowed = prop->second.allowed_values;
            if (!allowed.empty() && it.value().is_string() &&
                !contains_name(allowed, it.value().get<std::string>())) {
                throw ActionParameterError("parameter " + key + " has unsupported value: " +
                                           it.value().get<std::string>());
            }
        }
        if (is_required && it.value().is_string() && it.value().get<std::string>().empty()) {
            throw ActionParameterError("required parameter is empty: " + key);
        }
        cleaned[key] = it.value();
    }

    for (const auto& name : spec.required) {
        if (!cleaned.contains(name)) {
            throw ActionParameterError("missing required parameter: " + name);
        }
    }
    return cleaned;
}

nlohmann::json ActionRegistry::execute(const std::string& name,
                                       const ActionContext& context,
                                       const nlohmann::json& params) const {
    const logging::CallLog log(context.call_sid, context.stream_sid);
    const auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };

    nlohmann::json result;
    std::optional<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = actions_.find(name);
        if (it != actions_.end()) {
            entry = it->second;
        }
    }

    if (!entry) {
        log.warn( "Unknown action requested", {kv("action", name)});
        result = failure("Unknown action: " + name);
    } else {
        try {
            const auto cleaned = validate_parameters(entry->spec, params);
            log.info(
                "Executing action",
                {kv("action", name),
                 kv("params", sanitize_for_log(cleaned).dump())});
            result = entry->handler(context, cleaned);
            if (!result.is_object()) {
                result = nlohmann::json{{"success", true}, {"data", result}};
            } else if (!result.contains("success")) {
                result["success"] = true;
            }
        } catch (const ActionParameterError& ex) {
            log.warn( "Action parameters rejected", {kv("action", name), kv("error", ex.what())});
            result = failure(ex.what());
            result["error_type"] = "invalid_parameters";
        } catch (const std::exception& ex) {
            log.error( "Action failed", {kv("action", name), kv("error", ex.what())});
            result = failure(ex.what());
        } catch (...) {
            log.error( "Action failed with a non-standard exception", {kv("action", name)});
            result = failure("action failed");
        }
    }

    const auto execution_ms = elapsed_ms();
    result["action"] = name;
    result["execution_time_ms"] = execution_ms;
    const bool success = result.value("success", false);
    Metrics::instance().observe_action(name, success, static_cast<double>(execution_ms) / 1000.0);
    log.info(
        "Action completed",
        {kv("action", name),
         kv("success", success),
         kv("execution_time_ms", execution_ms)});
    return result;
}

nlohmann::json ActionRegistry::list_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto capabilities = nlohmann::json::array();
    for (const auto& [name, entry] : actions_) {
        auto properties = nlohmann::json::object();
        auto describe = [&](const std::string& param) {
            nlohmann::json property{{"type", "string"}};
            const auto it = entry.spec.properties.find(param);
            if (it != entry.spec.properties.end()) {
                property["type"] = it->second.type;
                if (!it->second.description.empty()) {
                    property["description"] = it->second.description;
                }
                if (!it->second.allowed_values.empty()) {
                    property["enum"] = it->second.allowed_values;
                }
            }
            properties[param] = property;
        };
        for (const auto& param : entry.spec.required) {
            describe(param);
        }
        for (const auto& param : entry.spec.optional) {
            describe(param);
        }
        capabilities.push_back({
            {"name", name},
            {"description", entry.spec.description},
            {"parameters",
             {{"type", "object"},
              {"properties", properties},
              {"required", entry.spec.required}}}});
    }
    return capabilities;
}

bool ActionRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.count(name) > 0;
}

size_t ActionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.size();
}

}
