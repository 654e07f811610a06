#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace carrier {

class MalformedFrameError : public std::runtime_error {
public:
    explicit MalformedFrameError(const std::string& message) : std::runtime_error(message) {}
};

enum class EventType {
    Connected,
    Start,
    Media,
    Stop,
    Mark,
    Unknown,
};

struct StartInfo {
    std::string stream_sid;
    std::string call_sid;
    std::string environment;
    std::string token;
    std::string from;
    // Base64 JSON handed over by the call-routing webhook.
    std::optional<std::string> caller_context;
};

struct CarrierEvent {
    EventType type = EventType::Unknown;
    std::string event_name;
    std::string stream_sid;
    StartInfo start;
    // Still base64; decoded by the session so bad payloads are counted there.
    std::string media_payload;
    std::string mark_name;
};

// Throws MalformedFrameError on invalid JSON, a missing event name or a
// start/media event without its required fields.
CarrierEvent parse_carrier_message(const std::string& text);

std::string build_media_message(const std::string& stream_sid, const std::string& payload);
std::string build_clear_message(const std::string& stream_sid);

}
}
