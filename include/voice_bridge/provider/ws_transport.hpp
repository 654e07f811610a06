#pragma once

#include <memory>
#include <string>
#include <thread>

#include "voice_bridge/provider/transport.hpp"

namespace voice_bridge {
namespace provider {

struct WsTransportState;

// websocketpp client (TLS for wss://) running its io loop on a dedicated
// thread. close() suppresses every handler that has not fired yet.
class WsTransport : public UpstreamTransport {
public:
    WsTransport();
    ~WsTransport() override;

    void open(const std::string& url,
              const std::map<std::string, std::string>& headers,
              TransportHandlers handlers,
              std::chrono::milliseconds connect_timeout) override;
    bool send_text(const std::string& payload) override;
    void close() override;

private:
    std::shared_ptr<WsTransportState> state_;
    std::thread worker_;
};

TransportFactory make_ws_transport_factory();

}
}
