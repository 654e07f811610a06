#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_bridge/config.hpp"
#include "voice_bridge/session/manager.hpp"

namespace voice_bridge {

nlohmann::json health_payload(const session::ManagerStatus& status);

// Health and Prometheus endpoints on STATUS_PORT.
class StatusServer {
public:
    using StatusProvider = std::function<session::ManagerStatus()>;

    StatusServer(const Config& config, StatusProvider status_provider);
    ~StatusServer();

    void start();
    void stop();

private:
    const Config& config_;
    StatusProvider status_provider_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
