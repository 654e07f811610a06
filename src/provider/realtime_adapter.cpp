#include "voice_bridge/provider/realtime_adapter.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::provider {

namespace {

nlohmann::json realtime_tools(const nlohmann::json& capabilities) {
    auto tools = nlohmann::json::array();
    for (const auto& capability : capabilities) {
        tools.push_back({
            {"type", "function"},
            {"name", capability.at("name")},
            {"description", capability.at("description")},
            {"parameters", capability.at("parameters")}});
    }
    return tools;
}

}

RealtimeAdapter::RealtimeAdapter(const Config& config,
                                 const actions::ActionRegistry& registry,
                                 TransportFactory transport_factory)
    : WebSocketProviderAdapter(config, registry, std::move(transport_factory)) {}

RealtimeAdapter::~RealtimeAdapter() {
    close();
}

std::string RealtimeAdapter::endpoint_url() const {
    return utils::append_query(config_.openai_realtime_url, "model",
                               config_.openai_realtime_model);
}

std::map<std::string, std::string> RealtimeAdapter::endpoint_headers() const {
    return {
        {"Authorization", "Bearer " + config_.openai_api_key.value_or("")},
        {"OpenAI-Beta", "realtime=v1"}};
}

nlohmann::json RealtimeAdapter::session_configuration() const {
    return {
        {"type", "session.update"},
        {"session",
         {{"modalities", {"audio", "text"}},
          {"instructions", compose_instructions()},
          {"voice", config_.openai_realtime_voice},
          {"input_audio_format", "g711_ulaw"},
          {"output_audio_format", "g711_ulaw"},
          {"input_audio_transcription", {{"model", "whisper-1"}}},
          {"turn_detection",
           {{"type", "server_vad"},
            {"threshold", config_.vad_threshold},
            {"prefix_padding_ms", config_.vad_prefix_padding_ms},
            {"silence_duration_ms", config_.vad_silence_duration_ms}}},
          {"tools", realtime_tools(registry_.list_capabilities())},
          {"tool_choice", "auto"}}}};
}

void RealtimeAdapter::send_audio(const audio::MulawBuffer& frame) {
    if (frame.empty()) {
        return;
    }
    send_json({{"type", "input_audio_buffer.append"}, {"audio", audio::base64_encode(frame)}});
}

void RealtimeAdapter::send_tool_result(const std::string& correlation_id,
                                       const nlohmann::json& result) {
    send_json({
        {"type", "conversation.item.create"},
        {"item",
         {{"type", "function_call_output"},
          {"call_id", correlation_id},
          {"output", result.dump()}}}});
    send_json({{"type", "response.create"}});
}

void RealtimeAdapter::handle_message(const nlohmann::json& message) {
    const auto type = message.value("type", std::string());
    if (type == "response.audio.delta" || type == "response.output_audio.delta") {
        const auto frame = audio::base64_decode_bytes(message.at("delta").get<std::string>());
        if (!frame.empty() && events_.on_audio_output) {
            events_.on_audio_output(frame);
        }
    } else if (type == "response.function_call_arguments.done") {
        ToolCallRequest request;
        request.correlation_id = message.value("call_id", std::string());
        request.name = message.value("name", std::string());
        const auto raw = message.value("arguments", std::string());
        try {
            request.arguments = raw.empty() ? nlohmann::json::object()
                                            : nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error&) {
            // Left as a string so the registry answers with invalid_parameters.
            request.arguments = raw;
        }
        log_.info(
            "Provider requested tool call",
            {kv("action", request.name),
             kv("call_id", request.correlation_id)});
        if (events_.on_tool_call) {
            events_.on_tool_call(request);
        }
    } else if (type == "input_audio_buffer.speech_started") {
        if (events_.on_interrupted) {
            events_.on_interrupted();
        }
    } else if (type == "response.audio_transcript.done" ||
               type == "response.output_audio_transcript.done") {
        if (events_.on_transcript) {
            events_.on_transcript("assistant", message.value("transcript", std::string()));
        }
    } else if (type == "conversation.item.input_audio_transcription.completed") {
        if (events_.on_transcript) {
            events_.on_transcript("user", message.value("transcript", std::string()));
        }
    } else if (type == "error") {
        const auto& error = message.contains("error") ? message.at("error") : message;
        log_.warn(
            "Provider reported an error",
            {kv("provider", variant()),
             kv("code", error.value("code", std::string())),
             kv("message", error.value("message", std::string()))});
    } else if (type == "session.created" || type == "session.updated") {
        log_.debug("Provider session event", {kv("type", type)});
    } else {
        log_.trace("Ignoring provider event", {kv("type", type)});
    }
}

}
