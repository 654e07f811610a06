#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/actions/registry.hpp"
#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/provider/transport.hpp"

namespace voice_bridge {
namespace provider {

enum class ConnectionState {
    Idle,
    Connecting,
    Open,
    Closed,
};

const char* to_string(ConnectionState state);

struct ToolCallRequest {
    std::string correlation_id;
    std::string name;
    nlohmann::json arguments;
};

struct SessionContext {
    std::string call_sid;
    std::string stream_sid;
    std::string caller_phone;
    std::optional<std::string> customer_id;
    std::optional<std::string> customer_name;
    std::optional<int> claim_count;
    std::optional<std::string> account_status;
    std::string system_prompt;
};

struct ProviderEvents {
    std::function<void()> on_connected;
    std::function<void(const audio::MulawBuffer&)> on_audio_output;
    std::function<void(const ToolCallRequest&)> on_tool_call;
    std::function<void()> on_interrupted;
    std::function<void(const std::string& role, const std::string& text)> on_transcript;
    std::function<void(const std::string&)> on_error;
    std::function<void()> on_closed;
};

// One upstream conversation. Events are delivered on the transport thread.
// on_error and on_closed are terminal and fire at most once between them.
class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    virtual void connect(const SessionContext& context, ProviderEvents events) = 0;
    virtual void send_audio(const audio::MulawBuffer& frame) = 0;
    virtual void send_tool_result(const std::string& correlation_id,
                                  const nlohmann::json& result) = 0;
    virtual void close() = 0;

    virtual ConnectionState state() const = 0;
    virtual std::string variant() const = 0;
};

// Shared plumbing for the websocket-backed variants: transport lifecycle,
// state flag and terminal event delivery. Subclasses call close() from their
// destructor so no handler runs against a half-destroyed adapter.
class WebSocketProviderAdapter : public ProviderAdapter {
public:
    WebSocketProviderAdapter(const Config& config,
                             const actions::ActionRegistry& registry,
                             TransportFactory transport_factory);
    ~WebSocketProviderAdapter() override;

    void connect(const SessionContext& context, ProviderEvents events) override;
    void close() override;
    ConnectionState state() const override;

protected:
    virtual std::string endpoint_url() const = 0;
    virtual std::map<std::string, std::string> endpoint_headers() const = 0;
    virtual nlohmann::json session_configuration() const = 0;
    virtual void handle_message(const nlohmann::json& message) = 0;
    virtual void on_closing() {}

    bool send_json(const nlohmann::json& payload);
    std::string compose_instructions() const;
    void emit_error(const std::string& message);

    const Config& config_;
    const actions::ActionRegistry& registry_;
    SessionContext context_;
    ProviderEvents events_;
    logging::CallLog log_;

private:
    void handle_open();
    void handle_text(const std::string& payload);
    void handle_closed();
    void notify_closing();

    TransportFactory transport_factory_;
    std::unique_ptr<UpstreamTransport> transport_;
    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Idle;
    std::atomic<bool> terminal_sent_{false};
    std::atomic<bool> closing_notified_{false};
};

std::unique_ptr<ProviderAdapter> make_provider_adapter(const Config& config,
                                                       const actions::ActionRegistry& registry,
                                                       TransportFactory transport_factory);

}
}
