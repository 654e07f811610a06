#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "voice_bridge/actions/registry.hpp"
#include "voice_bridge/actions/services.hpp"
#include "voice_bridge/carrier/protocol.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/provider/adapter.hpp"
#include "voice_bridge/session/call_session.hpp"
#include "voice_bridge/session/capacity.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {
namespace session {

constexpr int kCloseBadEnvironment = 4001;
constexpr int kCloseBadToken = 4003;
constexpr int kCloseDuplicateStream = 1008;
constexpr int kCloseTooManyStreams = 1013;

// Both rejections carry the websocket close code the gateway answers with.
class AuthorizationError : public std::runtime_error {
public:
    AuthorizationError(const std::string& message, int close_code)
        : std::runtime_error(message), close_code_(close_code) {}

    int close_code() const { return close_code_; }

private:
    int close_code_;
};

class CapacityExceededError : public std::runtime_error {
public:
    CapacityExceededError() : std::runtime_error("Too many streams") {}

    int close_code() const { return kCloseTooManyStreams; }
};

struct ManagerStatus {
    int active_sessions = 0;
    int capacity = 0;
    bool provider_configured = false;
    std::string provider;
    std::string environment;
};

using AdapterFactory = std::function<std::unique_ptr<provider::ProviderAdapter>()>;

class SessionManager {
public:
    SessionManager(const Config& config,
                   const actions::ActionRegistry& registry,
                   actions::CustomerDirectory* directory,
                   AdapterFactory adapter_factory,
                   utils::TaskRunner runner);
    ~SessionManager();

    // Checks environment, token, duplicate stream and capacity in that
    // order. Throws AuthorizationError or CapacityExceededError without
    // registering anything or holding a slot.
    std::shared_ptr<CallSession> open_session(const carrier::StartInfo& start,
                                              std::shared_ptr<CarrierChannel> channel);
    void close_session(const std::string& stream_sid, const std::string& reason);
    void close_all(const std::string& reason);

    std::shared_ptr<CallSession> find(const std::string& stream_sid) const;
    size_t session_count() const;
    ManagerStatus status() const;

private:
    void authorize(const carrier::StartInfo& start) const;
    void unregister(const CallSession& session);

    const Config& config_;
    const actions::ActionRegistry& registry_;
    actions::CustomerDirectory* directory_;
    AdapterFactory adapter_factory_;
    utils::TaskRunner runner_;
    std::shared_ptr<CapacityPool> pool_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CallSession>> sessions_;
};

}
}
