#include "voice_bridge/server/status_server.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge {

nlohmann::json health_payload(const session::ManagerStatus& status) {
    return nlohmann::json{
        {"ok", true},
        {"provider", status.provider},
        {"env", status.environment},
        {"activeStreams", status.active_sessions},
        {"maxStreams", status.capacity},
        {"providerConfigured", status.provider_configured}};
}

StatusServer::StatusServer(const Config& config, StatusProvider status_provider)
    : config_(config), status_provider_(std::move(status_provider)) {}

StatusServer::~StatusServer() {
    stop();
}

void StatusServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        try {
            res.set_content(health_payload(status_provider_()).dump(), "application/json");
        } catch (const std::exception& ex) {
            logging::error("Failed to build health payload", {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"ok":false})", "application/json");
            return;
        }
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "Status server listening",
            {kv("port", config_.status_port)});
        if (!server_->listen("0.0.0.0", config_.status_port)) {
            logging::error("Status server failed to bind", {kv("port", config_.status_port)});
        }
    });
}

void StatusServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

}
