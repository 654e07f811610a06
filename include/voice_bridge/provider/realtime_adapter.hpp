#pragma once

#include "voice_bridge/provider/adapter.hpp"

namespace voice_bridge {
namespace provider {

// Realtime model API: g711 mu-law both ways, server-side VAD, function tools.
class RealtimeAdapter : public WebSocketProviderAdapter {
public:
    RealtimeAdapter(const Config& config,
                    const actions::ActionRegistry& registry,
                    TransportFactory transport_factory);
    ~RealtimeAdapter() override;

    void send_audio(const audio::MulawBuffer& frame) override;
    void send_tool_result(const std::string& correlation_id,
                          const nlohmann::json& result) override;
    std::string variant() const override { return "realtime"; }

protected:
    std::string endpoint_url() const override;
    std::map<std::string, std::string> endpoint_headers() const override;
    nlohmann::json session_configuration() const override;
    void handle_message(const nlohmann::json& message) override;
};

}
}
