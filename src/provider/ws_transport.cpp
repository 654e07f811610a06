#include "voice_bridge/provider/ws_transport.hpp"

#include <atomic>
#include <mutex>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::provider {

namespace {

using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using SslContext = websocketpp::lib::asio::ssl::context;

void configure_tls(PlainClient&, const std::string&) {}

void configure_tls(TlsClient& client, const std::string& host) {
    client.set_tls_init_handler([host](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
        context->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                             SslContext::no_sslv3);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        context->set_verify_callback(websocketpp::lib::asio::ssl::rfc2818_verification(host));
        return context;
    });
}

}

struct WsTransportState {
    TransportHandlers handlers;
    logging::CallLog log;
    std::atomic<bool> opened{false};
    std::atomic<bool> finished{false};
    std::mutex mutex;
    std::function<bool(const std::string&)> send;
    std::function<void()> close;

    void fail(const std::string& message) {
        if (finished.exchange(true)) {
            return;
        }
        log.debug("Upstream websocket failed", {kv("error", message)});
        if (handlers.on_error) {
            handlers.on_error(message);
        }
    }

    void closed() {
        if (finished.exchange(true)) {
            return;
        }
        if (handlers.on_close) {
            handlers.on_close();
        }
    }
};

namespace {

template <typename Client>
void run_client(const std::shared_ptr<WsTransportState>& state,
                const std::string& url,
                const std::string& host,
                const std::map<std::string, std::string>& headers,
                std::chrono::milliseconds connect_timeout) {
    auto client = std::make_shared<Client>();
    Client* raw = client.get();
    client->clear_access_channels(websocketpp::log::alevel::all);
    client->clear_error_channels(websocketpp::log::elevel::all);
    client->init_asio();
    configure_tls(*client, host);

    typename Client::timer_ptr connect_timer;

    client->set_open_handler([state, raw, &connect_timer](websocketpp::connection_hdl hdl) {
        state->opened = true;
        if (connect_timer) {
            connect_timer->cancel();
        }
        if (state->finished) {
            websocketpp::lib::error_code ec;
            raw->close(hdl, websocketpp::close::status::normal, "closed", ec);
            return;
        }
        if (state->handlers.on_open) {
            state->handlers.on_open();
        }
    });
    client->set_message_handler(
        [state](websocketpp::connection_hdl, typename Client::message_ptr msg) {
            if (state->finished || !state->handlers.on_message) {
                return;
            }
            state->handlers.on_message(msg->get_payload());
        });
    client->set_fail_handler([state, raw, &connect_timer](websocketpp::connection_hdl hdl) {
        if (connect_timer) {
            connect_timer->cancel();
        }
        websocketpp::lib::error_code ec;
        auto con = raw->get_con_from_hdl(hdl, ec);
        state->fail(con ? con->get_ec().message() : std::string("upstream connection failed"));
    });
    client->set_close_handler([state, raw, &connect_timer](websocketpp::connection_hdl hdl) {
        if (connect_timer) {
            connect_timer->cancel();
        }
        websocketpp::lib::error_code ec;
        auto con = raw->get_con_from_hdl(hdl, ec);
        if (con) {
            state->log.debug("Upstream websocket closed",
                             {kv("code", con->get_remote_close_code()),
                              kv("reason", con->get_remote_close_reason())});
        }
        state->closed();
    });

    websocketpp::lib::error_code ec;
    auto con = client->get_connection(url, ec);
    if (ec) {
        state->fail("invalid upstream url: " + ec.message());
        return;
    }
    for (const auto& [name, value] : headers) {
        con->append_header(name, value);
    }
    // connect_timer below reports the timeout; the library's own handshake
    // timer is only a backstop.
    con->set_open_handshake_timeout(static_cast<long>(connect_timeout.count()) * 2);

    const auto hdl = con->get_handle();
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->finished) {
            return;
        }
        state->send = [client, hdl](const std::string& payload) {
            websocketpp::lib::error_code send_ec;
            client->send(hdl, payload, websocketpp::frame::opcode::text, send_ec);
            return !send_ec;
        };
        state->close = [client, hdl]() {
            websocketpp::lib::error_code close_ec;
            client->close(hdl, websocketpp::close::status::going_away, "client closing",
                          close_ec);
            if (close_ec) {
                client->stop();
            }
        };
    }

    client->connect(con);
    connect_timer = client->set_timer(
        static_cast<long>(connect_timeout.count()),
        [state, raw](const websocketpp::lib::error_code& timer_ec) {
            if (timer_ec || state->opened) {
                return;
            }
            state->fail("upstream connect timed out");
            raw->stop();
        });
    client->run();

    std::lock_guard<std::mutex> lock(state->mutex);
    state->send = nullptr;
    state->close = nullptr;
}

}

WsTransport::WsTransport() : state_(std::make_shared<WsTransportState>()) {}

WsTransport::~WsTransport() {
    close();
}

void WsTransport::open(const std::string& url,
                       const std::map<std::string, std::string>& headers,
                       TransportHandlers handlers,
                       std::chrono::milliseconds connect_timeout) {
    if (worker_.joinable()) {
        throw UpstreamConnectError("transport already opened");
    }
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    utils::parse_url(url, scheme, host, port, path);
    if (scheme != "ws" && scheme != "wss") {
        throw UpstreamConnectError("unsupported upstream scheme: " + scheme);
    }

    state_->handlers = std::move(handlers);
    state_->log = log_;
    auto state = state_;
    const bool secure = scheme == "wss";
    worker_ = std::thread([state, url, host, headers, connect_timeout, secure]() {
        try {
            if (secure) {
                run_client<TlsClient>(state, url, host, headers, connect_timeout);
            } else {
                run_client<PlainClient>(state, url, host, headers, connect_timeout);
            }
        } catch (const std::exception& ex) {
            state->fail(ex.what());
        }
    });
}

bool WsTransport::send_text(const std::string& payload) {
    if (state_->finished) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->send) {
        return false;
    }
    return state_->send(payload);
}

void WsTransport::close() {
    state_->finished = true;
    std::function<void()> close_connection;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        close_connection = state_->close;
    }
    if (close_connection) {
        close_connection();
    }
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

TransportFactory make_ws_transport_factory() {
    return []() -> std::unique_ptr<UpstreamTransport> {
        return std::make_unique<WsTransport>();
    };
}

}
