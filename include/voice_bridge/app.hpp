#pragma once

#include <atomic>
#include <memory>

#include "voice_bridge/actions/registry.hpp"
#include "voice_bridge/actions/services.hpp"
#include "voice_bridge/carrier/server.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/server/status_server.hpp"
#include "voice_bridge/session/manager.hpp"

namespace voice_bridge {

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    // Blocks until stop() or SIGINT/SIGTERM.
    void run();
    void stop();

private:
    Config config_;
    actions::ActionRegistry registry_;
    std::unique_ptr<actions::CustomerDirectory> directory_;
    std::unique_ptr<actions::MessageSender> sender_;
    std::unique_ptr<session::SessionManager> manager_;
    std::unique_ptr<carrier::CarrierServer> carrier_server_;
    std::unique_ptr<StatusServer> status_server_;
    std::atomic<bool> quitting_{false};
    std::atomic<bool> stopped_{false};
};

}
