#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "voice_bridge/provider/adapter.hpp"

namespace voice_bridge {
namespace provider {

// Averages prosody scores over the user's turns.
class EmotionTracker {
public:
    void add(const nlohmann::json& scores);
    std::vector<std::pair<std::string, double>> dominant(size_t count) const;
    size_t samples() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> totals_;
    size_t samples_ = 0;
};

// Empathic voice interface: PCM16 8 kHz in, base64 WAV out, tool calls with
// JSON-string parameters.
class EviAdapter : public WebSocketProviderAdapter {
public:
    EviAdapter(const Config& config,
               const actions::ActionRegistry& registry,
               TransportFactory transport_factory);
    ~EviAdapter() override;

    void send_audio(const audio::MulawBuffer& frame) override;
    void send_tool_result(const std::string& correlation_id,
                          const nlohmann::json& result) override;
    std::string variant() const override { return "evi"; }

    const EmotionTracker& emotions() const { return emotions_; }

protected:
    std::string endpoint_url() const override;
    std::map<std::string, std::string> endpoint_headers() const override;
    nlohmann::json session_configuration() const override;
    void handle_message(const nlohmann::json& message) override;
    void on_closing() override;

private:
    EmotionTracker emotions_;
};

}
}
