#pragma once

#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "voice_bridge/config.hpp"
#include "spdlog/logger.h"

namespace voice_bridge {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return {key, oss.str()};
}

template <typename Items>
inline std::string format_kv(const Items& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        bool needs_quotes = item.value.empty() || item.value.find(' ') != std::string::npos;
        result += item.key;
        result += '=';
        if (needs_quotes) {
            result += '"';
            result += item.value;
            result += '"';
        } else {
            result += item.value;
        }
    }
    return result;
}

inline std::string format_kv(std::initializer_list<KeyValue> items) {
    return format_kv<std::initializer_list<KeyValue>>(items);
}

inline std::string with_kv(const std::string& message,
                           std::initializer_list<KeyValue> items) {
    const auto context = format_kv(items);
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

// Correlation ids of one call. Every line written through a CallLog leads
// with call_sid and stream_sid, "-" until the carrier start event binds them.
class CallLog {
public:
    CallLog() = default;
    CallLog(std::string call_sid, std::string stream_sid);

    void bind(std::string call_sid, std::string stream_sid);
    bool bound() const { return !call_sid_.empty() || !stream_sid_.empty(); }
    const std::string& call_sid() const { return call_sid_; }
    const std::string& stream_sid() const { return stream_sid_; }

    std::string format(const std::string& message,
                       std::initializer_list<KeyValue> items = {}) const;

    void trace(const std::string& message, std::initializer_list<KeyValue> items = {}) const;
    void debug(const std::string& message, std::initializer_list<KeyValue> items = {}) const;
    void info(const std::string& message, std::initializer_list<KeyValue> items = {}) const;
    void warn(const std::string& message, std::initializer_list<KeyValue> items = {}) const;
    void error(const std::string& message, std::initializer_list<KeyValue> items = {}) const;

private:
    void write(spdlog::level::level_enum level,
               const std::string& message,
               std::initializer_list<KeyValue> items) const;

    std::string call_sid_;
    std::string stream_sid_;
};

}

using logging::CallLog;
using logging::kv;
using logging::with_kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
