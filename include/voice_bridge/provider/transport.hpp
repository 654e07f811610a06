#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "voice_bridge/logging.hpp"

namespace voice_bridge {
namespace provider {

class UpstreamConnectError : public std::runtime_error {
public:
    explicit UpstreamConnectError(const std::string& message) : std::runtime_error(message) {}
};

struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_message;
    std::function<void(const std::string&)> on_error;
    std::function<void()> on_close;
};

// One outbound websocket. Handlers run on the transport's own thread.
// After on_error or on_close nothing else is delivered.
class UpstreamTransport {
public:
    virtual ~UpstreamTransport() = default;

    virtual void open(const std::string& url,
                      const std::map<std::string, std::string>& headers,
                      TransportHandlers handlers,
                      std::chrono::milliseconds connect_timeout) = 0;
    virtual bool send_text(const std::string& payload) = 0;
    virtual void close() = 0;

    // Correlation ids for the transport's own log lines. Set before open().
    void set_call_log(logging::CallLog log) { log_ = std::move(log); }
    const logging::CallLog& call_log() const { return log_; }

protected:
    logging::CallLog log_;
};

using TransportFactory = std::function<std::unique_ptr<UpstreamTransport>()>;

}
}
