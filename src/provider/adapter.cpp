#include "voice_bridge/provider/adapter.hpp"

#include <sstream>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/provider/evi_adapter.hpp"
#include "voice_bridge/provider/realtime_adapter.hpp"

namespace voice_bridge::provider {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:
            return "idle";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Open:
            return "open";
        case ConnectionState::Closed:
            return "closed";
    }
    return "unknown";
}

WebSocketProviderAdapter::WebSocketProviderAdapter(const Config& config,
                                                   const actions::ActionRegistry& registry,
                                                   TransportFactory transport_factory)
    : config_(config),
      registry_(registry),
      transport_factory_(std::move(transport_factory)) {}

WebSocketProviderAdapter::~WebSocketProviderAdapter() {
    std::unique_ptr<UpstreamTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = std::move(transport_);
    }
    if (transport) {
        transport->close();
    }
}

void WebSocketProviderAdapter::connect(const SessionContext& context, ProviderEvents events) {
    UpstreamTransport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Idle) {
            throw std::logic_error("provider adapter already connected");
        }
        context_ = context;
        events_ = std::move(events);
        log_.bind(context.call_sid, context.stream_sid);
        state_ = ConnectionState::Connecting;
        transport_ = transport_factory_();
        transport_->set_call_log(log_);
        transport = transport_.get();
    }

    log_.info("Connecting to provider", {kv("provider", variant())});

    TransportHandlers handlers;
    handlers.on_open = [this]() { handle_open(); };
    handlers.on_message = [this](const std::string& payload) { handle_text(payload); };
    handlers.on_error = [this](const std::string& message) { emit_error(message); };
    handlers.on_close = [this]() { handle_closed(); };
    try {
        transport->open(endpoint_url(), endpoint_headers(), std::move(handlers),
                        std::chrono::milliseconds(config_.upstream_connect_timeout_ms));
    } catch (const std::exception& ex) {
        emit_error(std::string("upstream connect failed: ") + ex.what());
    }
}

void WebSocketProviderAdapter::close() {
    std::unique_ptr<UpstreamTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Closed && !transport_) {
            return;
        }
        state_ = ConnectionState::Closed;
        transport = std::move(transport_);
    }
    terminal_sent_ = true;
    notify_closing();
    if (transport) {
        transport->close();
    }
    log_.debug("Provider adapter closed", {kv("provider", variant())});
}

ConnectionState WebSocketProviderAdapter::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool WebSocketProviderAdapter::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transport_ || state_ == ConnectionState::Closed) {
        return false;
    }
    return transport_->send_text(payload.dump());
}

std::string WebSocketProviderAdapter::compose_instructions() const {
    std::ostringstream out;
    out << context_.system_prompt;
    if (context_.customer_name || context_.customer_id) {
        out << "\n\nCaller context:";
        if (context_.customer_name) {
            out << "\n- Name: " << *context_.customer_name;
        }
        if (context_.customer_id) {
            out << "\n- Customer id: " << *context_.customer_id;
        }
        if (context_.claim_count) {
            out << "\n- Claims on file: " << *context_.claim_count;
        }
        if (context_.account_status) {
            out << "\n- Account status: " << *context_.account_status;
        }
    } else {
        out << "\n\nThe caller has not been identified yet.";
    }
    return out.str();
}

void WebSocketProviderAdapter::emit_error(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Closed;
    }
    if (terminal_sent_.exchange(true)) {
        return;
    }
    log_.error("Provider connection error", {kv("provider", variant()), kv("error", message)});
    if (events_.on_error) {
        events_.on_error(message);
    }
}

void WebSocketProviderAdapter::notify_closing() {
    if (!closing_notified_.exchange(true)) {
        on_closing();
    }
}

void WebSocketProviderAdapter::handle_open() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Connecting) {
            return;
        }
    }
    if (!send_json(session_configuration())) {
        emit_error("failed to send session configuration");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Open;
    }
    log_.info("Provider connected", {kv("provider", variant())});
    if (events_.on_connected) {
        events_.on_connected();
    }
}

void WebSocketProviderAdapter::handle_text(const std::string& payload) {
    if (terminal_sent_) {
        return;
    }
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& ex) {
        log_.warn("Dropping unparseable provider message",
                  {kv("provider", variant()), kv("error", ex.what())});
        return;
    }
    if (!message.is_object()) {
        log_.warn("Dropping non-object provider message",
                  {kv("provider", variant()), kv("kind", message.type_name())});
        return;
    }
    const auto type_it = message.find("type");
    const std::string type =
        type_it != message.end() && type_it->is_string() ? type_it->get<std::string>() : "";
    try {
        handle_message(message);
    } catch (const std::exception& ex) {
        log_.warn("Dropping provider message",
                  {kv("provider", variant()), kv("type", type), kv("error", ex.what())});
    }
}

void WebSocketProviderAdapter::handle_closed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Closed;
    }
    if (terminal_sent_.exchange(true)) {
        return;
    }
    notify_closing();
    log_.info("Provider closed the connection", {kv("provider", variant())});
    if (events_.on_closed) {
        events_.on_closed();
    }
}

std::unique_ptr<ProviderAdapter> make_provider_adapter(const Config& config,
                                                       const actions::ActionRegistry& registry,
                                                       TransportFactory transport_factory) {
    if (config.provider == "realtime") {
        return std::make_unique<RealtimeAdapter>(config, registry, std::move(transport_factory));
    }
    if (config.provider == "evi") {
        return std::make_unique<EviAdapter>(config, registry, std::move(transport_factory));
    }
    throw std::invalid_argument("unknown provider: " + config.provider);
}

}
