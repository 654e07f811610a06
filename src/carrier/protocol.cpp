#include "voice_bridge/carrier/protocol.hpp"

namespace voice_bridge::carrier {

namespace {

std::string optional_string(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

StartInfo parse_start(const nlohmann::json& message) {
    const auto it = message.find("start");
    if (it == message.end() || !it->is_object()) {
        throw MalformedFrameError("start event without start block");
    }
    const auto& start = *it;
    StartInfo info;
    info.stream_sid = optional_string(start, "streamSid");
    if (info.stream_sid.empty()) {
        info.stream_sid = optional_string(message, "streamSid");
    }
    if (info.stream_sid.empty()) {
        throw MalformedFrameError("start event without streamSid");
    }
    info.call_sid = optional_string(start, "callSid");

    const auto params_it = start.find("customParameters");
    if (params_it != start.end() && params_it->is_object()) {
        const auto& params = *params_it;
        info.environment = optional_string(params, "env");
        info.token = optional_string(params, "auth");
        info.from = optional_string(params, "from");
        if (info.call_sid.empty()) {
            info.call_sid = optional_string(params, "callSid");
        }
        const auto context = optional_string(params, "callerContext");
        if (!context.empty()) {
            info.caller_context = context;
        }
    }
    return info;
}

}

CarrierEvent parse_carrier_message(const std::string& text) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw MalformedFrameError(std::string("invalid JSON: ") + ex.what());
    }
    if (!message.is_object()) {
        throw MalformedFrameError("carrier message is not an object");
    }

    CarrierEvent event;
    event.event_name = optional_string(message, "event");
    if (event.event_name.empty()) {
        throw MalformedFrameError("carrier message without event name");
    }
    event.stream_sid = optional_string(message, "streamSid");

    if (event.event_name == "connected") {
        event.type = EventType::Connected;
    } else if (event.event_name == "start") {
        event.type = EventType::Start;
        event.start = parse_start(message);
        event.stream_sid = event.start.stream_sid;
    } else if (event.event_name == "media") {
        event.type = EventType::Media;
        const auto it = message.find("media");
        if (it == message.end() || !it->is_object()) {
            throw MalformedFrameError("media event without media block");
        }
        event.media_payload = optional_string(*it, "payload");
    } else if (event.event_name == "stop") {
        event.type = EventType::Stop;
    } else if (event.event_name == "mark") {
        event.type = EventType::Mark;
        const auto it = message.find("mark");
        if (it != message.end() && it->is_object()) {
            event.mark_name = optional_string(*it, "name");
        }
    }
    return event;
}

std::string build_media_message(const std::string& stream_sid, const std::string& payload) {
    return nlohmann::json{
        {"event", "media"},
        {"streamSid", stream_sid},
        {"media", {{"payload", payload}}}}
        .dump();
}

std::string build_clear_message(const std::string& stream_sid) {
    return nlohmann::json{{"event", "clear"}, {"streamSid", stream_sid}}.dump();
}

}
