#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "voice_bridge/carrier/protocol.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/session/call_session.hpp"
#include "voice_bridge/session/manager.hpp"

namespace voice_bridge {
namespace carrier {

// Event dispatch for one carrier websocket connection, independent of the
// socket library.
class StreamHandler {
public:
    StreamHandler(session::SessionManager& manager,
                  std::shared_ptr<session::CarrierChannel> channel);

    void handle_message(const std::string& text);
    void handle_disconnect();

    std::shared_ptr<session::CallSession> session() const;
    // Unbound until the first start event.
    logging::CallLog call_log() const;

private:
    void handle_start(const StartInfo& start);

    session::SessionManager& manager_;
    std::shared_ptr<session::CarrierChannel> channel_;
    mutable std::mutex mutex_;
    std::shared_ptr<session::CallSession> session_;
    logging::CallLog log_;
    bool started_ = false;
};

// websocketpp server accepting carrier media streams on one path.
class CarrierServer {
public:
    CarrierServer(const Config& config, session::SessionManager& manager);
    ~CarrierServer();

    void start();
    void stop();
    size_t connection_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
