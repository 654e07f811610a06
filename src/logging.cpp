#include "voice_bridge/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace voice_bridge::logging {

namespace {

std::string logger_name = "voice_bridge";

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            true));
    }

    logger_name = config.log_name;
    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
    spdlog::flush_on(spdlog::level::warn);
}

CallLog::CallLog(std::string call_sid, std::string stream_sid)
    : call_sid_(std::move(call_sid)), stream_sid_(std::move(stream_sid)) {}

void CallLog::bind(std::string call_sid, std::string stream_sid) {
    call_sid_ = std::move(call_sid);
    stream_sid_ = std::move(stream_sid);
}

std::string CallLog::format(const std::string& message,
                            std::initializer_list<KeyValue> items) const {
    std::vector<KeyValue> fields;
    fields.reserve(items.size() + 2);
    fields.push_back({"call_sid", call_sid_.empty() ? "-" : call_sid_});
    fields.push_back({"stream_sid", stream_sid_.empty() ? "-" : stream_sid_});
    fields.insert(fields.end(), items.begin(), items.end());
    return message + " [" + format_kv(fields) + "]";
}

void CallLog::write(spdlog::level::level_enum level,
                    const std::string& message,
                    std::initializer_list<KeyValue> items) const {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, format(message, items));
    }
}

void CallLog::trace(const std::string& message, std::initializer_list<KeyValue> items) const {
    write(spdlog::level::trace, message, items);
}

void CallLog::debug(const std::string& message, std::initializer_list<KeyValue> items) const {
    write(spdlog::level::debug, message, items);
}

void CallLog::info(const std::string& message, std::initializer_list<KeyValue> items) const {
    write(spdlog::level::info, message, items);
}

void CallLog::warn(const std::string& message, std::initializer_list<KeyValue> items) const {
    write(spdlog::level::warn, message, items);
}

void CallLog::error(const std::string& message, std::initializer_list<KeyValue> items) const {
    write(spdlog::level::err, message, items);
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (auto logger = spdlog::get(logger_name)) {
        return logger;
    }
    return spdlog::default_logger();
}

}
