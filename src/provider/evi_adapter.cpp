#include "voice_bridge/provider/evi_adapter.hpp"

#include <algorithm>
#include <sstream>

#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::provider {

namespace {

constexpr size_t kDominantEmotions = 3;

nlohmann::json evi_tools(const nlohmann::json& capabilities) {
    auto tools = nlohmann::json::array();
    for (const auto& capability : capabilities) {
        tools.push_back({
            {"type", "function"},
            {"name", capability.at("name")},
            {"description", capability.at("description")},
            {"parameters", capability.at("parameters").dump()}});
    }
    return tools;
}

std::string message_content(const nlohmann::json& message) {
    const auto it = message.find("message");
    if (it == message.end() || !it->is_object()) {
        return {};
    }
    return it->value("content", std::string());
}

}

void EmotionTracker::add(const nlohmann::json& scores) {
    if (!scores.is_object()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = scores.begin(); it != scores.end(); ++it) {
        if (it.value().is_number()) {
            totals_[it.key()] += it.value().get<double>();
        }
    }
    ++samples_;
}

std::vector<std::pair<std::string, double>> EmotionTracker::dominant(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, double>> averages;
    if (samples_ == 0) {
        return averages;
    }
    for (const auto& [name, total] : totals_) {
        averages.emplace_back(name, total / static_cast<double>(samples_));
    }
    std::sort(averages.begin(), averages.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second > rhs.second;
    });
    if (averages.size() > count) {
        averages.resize(count);
    }
    return averages;
}

size_t EmotionTracker::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

EviAdapter::EviAdapter(const Config& config,
                       const actions::ActionRegistry& registry,
                       TransportFactory transport_factory)
    : WebSocketProviderAdapter(config, registry, std::move(transport_factory)) {}

EviAdapter::~EviAdapter() {
    close();
}

std::string EviAdapter::endpoint_url() const {
    if (!config_.hume_config_id) {
        return config_.hume_evi_url;
    }
    return utils::append_query(config_.hume_evi_url, "config_id", *config_.hume_config_id);
}

std::map<std::string, std::string> EviAdapter::endpoint_headers() const {
    return {{"X-Hume-Api-Key", config_.hume_api_key.value_or("")}};
}

nlohmann::json EviAdapter::session_configuration() const {
    return {
        {"type", "session_settings"},
        {"system_prompt", compose_instructions()},
        {"audio",
         {{"encoding", "linear16"},
          {"sample_rate", audio::kCarrierSampleRate},
          {"channels", 1}}},
        {"turn_detection",
         {{"threshold", config_.vad_threshold},
          {"prefix_padding_ms", config_.vad_prefix_padding_ms},
          {"silence_duration_ms", config_.vad_silence_duration_ms}}},
        {"tools", evi_tools(registry_.list_capabilities())}};
}

void EviAdapter::send_audio(const audio::MulawBuffer& frame) {
    if (frame.empty()) {
        return;
    }
    const auto pcm = audio::pcm_to_le_bytes(audio::mulaw_to_pcm(frame));
    send_json({{"type", "audio_input"}, {"data", audio::base64_encode(pcm)}});
}

void EviAdapter::send_tool_result(const std::string& correlation_id,
                                  const nlohmann::json& result) {
    send_json({
        {"type", "tool_response"},
        {"tool_call_id", correlation_id},
        {"content", result.dump()}});
}

void EviAdapter::handle_message(const nlohmann::json& message) {
    const auto type = message.value("type", std::string());
    if (type == "audio_output") {
        const auto wav = audio::base64_decode(message.at("data").get<std::string>());
        const auto frame = audio::wav_to_mulaw_8k(wav);
        if (!frame.empty() && events_.on_audio_output) {
            events_.on_audio_output(frame);
        }
    } else if (type == "tool_call") {
        ToolCallRequest request;
        request.correlation_id = message.value("tool_call_id", std::string());
        request.name = message.value("name", std::string());
        const auto raw = message.value("parameters", std::string());
        try {
            request.arguments = raw.empty() ? nlohmann::json::object()
                                            : nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error&) {
            request.arguments = raw;
        }
        log_.info(
            "Provider requested tool call",
            {kv("action", request.name),
             kv("call_id", request.correlation_id)});
        if (events_.on_tool_call) {
            events_.on_tool_call(request);
        }
    } else if (type == "user_interruption") {
        if (events_.on_interrupted) {
            events_.on_interrupted();
        }
    } else if (type == "user_message") {
        const auto models = message.find("models");
        if (models != message.end() && models->contains("prosody")) {
            emotions_.add(models->at("prosody").value("scores", nlohmann::json::object()));
        }
        if (events_.on_transcript) {
            events_.on_transcript("user", message_content(message));
        }
    } else if (type == "assistant_message") {
        if (events_.on_transcript) {
            events_.on_transcript("assistant", message_content(message));
        }
    } else if (type == "chat_metadata") {
        log_.info(
            "Provider chat started",
            {kv("chat_id", message.value("chat_id", std::string())),
             kv("chat_group_id", message.value("chat_group_id", std::string()))});
    } else if (type == "error") {
        log_.warn(
            "Provider reported an error",
            {kv("provider", variant()),
             kv("code", message.value("code", std::string())),
             kv("message", message.value("message", std::string()))});
    } else {
        log_.trace("Ignoring provider event", {kv("type", type)});
    }
}

void EviAdapter::on_closing() {
    const auto top = emotions_.dominant(kDominantEmotions);
    if (top.empty()) {
        return;
    }
    std::ostringstream summary;
    for (size_t i = 0; i < top.size(); ++i) {
        if (i > 0) {
            summary << ' ';
        }
        summary << top[i].first << ':' << top[i].second;
    }
    log_.info(
        "Caller emotion summary",
        {kv("samples", emotions_.samples()),
         kv("dominant", summary.str())});
}

}
