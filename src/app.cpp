#include "voice_bridge/app.hpp"

#include <chrono>
#include <csignal>
#include <thread>

#include "voice_bridge/actions/business_actions.hpp"
#include "voice_bridge/backend/http_services.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/provider/ws_transport.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {

namespace {

volatile std::sig_atomic_t g_signal = 0;

void handle_signal(int signal) {
    g_signal = signal;
}

}

BridgeApp::BridgeApp(Config config) : config_(std::move(config)) {}

BridgeApp::~BridgeApp() {
    stop();
}

void BridgeApp::init() {
    directory_ = make_customer_directory(config_);
    sender_ = make_message_sender(config_);

    actions::BusinessActionSettings settings;
    settings.portal_base_url = config_.portal_base_url;
    settings.review_url = config_.review_url;
    actions::register_business_actions(registry_, *directory_, *sender_, settings);
    logging::info("Actions registered", {kv("count", registry_.size())});

    auto transport_factory = provider::make_ws_transport_factory();
    manager_ = std::make_unique<session::SessionManager>(
        config_, registry_, directory_.get(),
        [this, transport_factory]() {
            return provider::make_provider_adapter(config_, registry_, transport_factory);
        },
        [](std::function<void()> task) { utils::run_async(std::move(task)); });

    status_server_ = std::make_unique<StatusServer>(
        config_, [this]() { return manager_->status(); });
    status_server_->start();

    carrier_server_ = std::make_unique<carrier::CarrierServer>(config_, *manager_);
    carrier_server_->start();
}

void BridgeApp::run() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    while (!quitting_ && g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_signal != 0) {
        logging::info("Shutdown signal received", {kv("signal", static_cast<int>(g_signal))});
    }
    stop();
}

void BridgeApp::stop() {
    quitting_ = true;
    if (stopped_.exchange(true)) {
        return;
    }
    if (carrier_server_) {
        carrier_server_->stop();
    }
    if (manager_) {
        manager_->close_all("shutdown");
    }
    if (status_server_) {
        status_server_->stop();
    }
    logging::info("voice-bridge stopped");
}

}
