#include "voice_bridge/carrier/server.hpp"

#include <map>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge::carrier {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

class WsCarrierChannel : public session::CarrierChannel {
public:
    WsCarrierChannel(WsServer& server, websocketpp::connection_hdl hdl)
        : server_(server), hdl_(std::move(hdl)) {}

    bool send_text(const std::string& payload) override {
        websocketpp::lib::error_code ec;
        server_.send(hdl_, payload, websocketpp::frame::opcode::text, ec);
        return !ec;
    }

    void close(int code, const std::string& reason) override {
        websocketpp::lib::error_code ec;
        auto con = server_.get_con_from_hdl(hdl_, ec);
        if (ec || con->get_state() != websocketpp::session::state::open) {
            return;
        }
        // Close reasons are limited to 123 bytes on the wire.
        server_.close(hdl_, static_cast<websocketpp::close::status::value>(code),
                      reason.substr(0, 120), ec);
        if (ec) {
            log_.debug("Carrier close failed", {kv("error", ec.message())});
        }
    }

private:
    WsServer& server_;
    websocketpp::connection_hdl hdl_;
};

}

StreamHandler::StreamHandler(session::SessionManager& manager,
                             std::shared_ptr<session::CarrierChannel> channel)
    : manager_(manager), channel_(std::move(channel)) {}

void StreamHandler::handle_message(const std::string& text) {
    CarrierEvent event;
    try {
        event = parse_carrier_message(text);
    } catch (const MalformedFrameError& ex) {
        Metrics::instance().increment_frames_dropped("malformed");
        call_log().warn("Dropping malformed carrier message", {kv("error", ex.what())});
        return;
    }

    switch (event.type) {
        case EventType::Connected:
            call_log().debug("Carrier connected event");
            break;
        case EventType::Start:
            handle_start(event.start);
            break;
        case EventType::Media: {
            auto current = session();
            if (current) {
                current->handle_carrier_media(event.media_payload);
            }
            break;
        }
        case EventType::Stop: {
            auto current = session();
            call_log().info("Carrier stop event");
            if (current) {
                current->close("carrier stop");
            }
            break;
        }
        case EventType::Mark:
            call_log().trace("Carrier mark event", {kv("name", event.mark_name)});
            break;
        case EventType::Unknown:
            call_log().debug("Ignoring carrier event", {kv("event", event.event_name)});
            break;
    }
}

void StreamHandler::handle_start(const StartInfo& start) {
    logging::CallLog log;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            log_.warn("Ignoring repeated start event",
                      {kv("repeated_stream_sid", start.stream_sid)});
            return;
        }
        started_ = true;
        log_.bind(start.call_sid, start.stream_sid);
        log = log_;
    }
    channel_->set_call_log(log);
    try {
        auto opened = manager_.open_session(start, channel_);
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = std::move(opened);
    } catch (const session::AuthorizationError& ex) {
        channel_->close(ex.close_code(), ex.what());
    } catch (const session::CapacityExceededError& ex) {
        channel_->close(ex.close_code(), ex.what());
    } catch (const std::exception& ex) {
        log.error("Failed to open session", {kv("error", ex.what())});
        channel_->close(session::kCloseUpstreamFailure, "session setup failed");
    }
}

void StreamHandler::handle_disconnect() {
    auto current = session();
    call_log().debug("Carrier socket disconnected", {kv("had_session", current != nullptr)});
    if (current) {
        current->close("carrier disconnected");
    }
}

std::shared_ptr<session::CallSession> StreamHandler::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

logging::CallLog StreamHandler::call_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

struct CarrierServer::Impl {
    const Config& config;
    session::SessionManager& manager;
    WsServer server;
    std::thread thread;
    mutable std::mutex mutex;
    std::map<websocketpp::connection_hdl, std::shared_ptr<StreamHandler>,
             std::owner_less<websocketpp::connection_hdl>>
        handlers;

    Impl(const Config& cfg, session::SessionManager& mgr) : config(cfg), manager(mgr) {}

    std::shared_ptr<StreamHandler> handler_for(const websocketpp::connection_hdl& hdl) const {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = handlers.find(hdl);
        return it == handlers.end() ? nullptr : it->second;
    }

    std::shared_ptr<StreamHandler> take_handler(const websocketpp::connection_hdl& hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = handlers.find(hdl);
        if (it == handlers.end()) {
            return nullptr;
        }
        auto handler = it->second;
        handlers.erase(it);
        return handler;
    }
};

CarrierServer::CarrierServer(const Config& config, session::SessionManager& manager)
    : impl_(std::make_unique<Impl>(config, manager)) {}

CarrierServer::~CarrierServer() {
    stop();
}

void CarrierServer::start() {
    auto& server = impl_->server;
    auto* impl = impl_.get();

    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([impl](websocketpp::connection_hdl hdl) {
        auto con = impl->server.get_con_from_hdl(hdl);
        const auto resource = con->get_resource();
        const auto path = resource.substr(0, resource.find('?'));
        if (path != impl->config.carrier_ws_path) {
            logging::warn("Rejecting websocket on unknown path", {kv("path", path)});
            con->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    });
    server.set_http_handler([impl](websocketpp::connection_hdl hdl) {
        auto con = impl->server.get_con_from_hdl(hdl);
        con->set_status(websocketpp::http::status_code::upgrade_required);
        con->set_body("websocket endpoint");
    });
    server.set_open_handler([impl](websocketpp::connection_hdl hdl) {
        auto channel = std::make_shared<WsCarrierChannel>(impl->server, hdl);
        auto handler = std::make_shared<StreamHandler>(impl->manager, channel);
        std::lock_guard<std::mutex> lock(impl->mutex);
        impl->handlers[hdl] = handler;
        handler->call_log().debug("Carrier connection opened");
    });
    server.set_message_handler([impl](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            return;
        }
        auto handler = impl->handler_for(hdl);
        if (handler) {
            handler->handle_message(msg->get_payload());
        }
    });
    server.set_close_handler([impl](websocketpp::connection_hdl hdl) {
        auto handler = impl->take_handler(hdl);
        if (handler) {
            handler->handle_disconnect();
        }
    });
    server.set_fail_handler([impl](websocketpp::connection_hdl hdl) {
        auto handler = impl->take_handler(hdl);
        if (handler) {
            handler->handle_disconnect();
        }
    });

    server.listen(static_cast<uint16_t>(impl_->config.port));
    server.start_accept();
    impl_->thread = std::thread([impl]() {
        logging::info(
            "Carrier websocket server listening",
            {kv("port", impl->config.port), kv("path", impl->config.carrier_ws_path)});
        try {
            impl->server.run();
        } catch (const std::exception& ex) {
            logging::error("Carrier websocket server stopped", {kv("error", ex.what())});
        }
    });
}

void CarrierServer::stop() {
    if (!impl_->thread.joinable()) {
        return;
    }
    websocketpp::lib::error_code ec;
    impl_->server.stop_listening(ec);
    impl_->manager.close_all("shutdown");
    impl_->server.stop();
    impl_->thread.join();
}

size_t CarrierServer::connection_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->handlers.size();
}

}
