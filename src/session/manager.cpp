#include "voice_bridge/session/manager.hpp"

#include <algorithm>
#include <vector>

#include <openssl/crypto.h>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/phone.hpp"

namespace voice_bridge::session {

namespace {

bool tokens_equal(const std::string& expected, const std::string& provided) {
    if (expected.size() != provided.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), provided.data(), expected.size()) == 0;
}

}

SessionManager::SessionManager(const Config& config,
                               const actions::ActionRegistry& registry,
                               actions::CustomerDirectory* directory,
                               AdapterFactory adapter_factory,
                               utils::TaskRunner runner)
    : config_(config),
      registry_(registry),
      directory_(directory),
      adapter_factory_(std::move(adapter_factory)),
      runner_(std::move(runner)),
      pool_(CapacityPool::create(config.max_concurrent_streams)) {}

SessionManager::~SessionManager() {
    close_all("shutdown");
}

void SessionManager::authorize(const carrier::StartInfo& start) const {
    const auto& allowed = config_.allowed_environments;
    if (std::find(allowed.begin(), allowed.end(), config_.environment_name) == allowed.end()) {
        throw AuthorizationError("environment not allowed: " + config_.environment_name,
                                 kCloseBadEnvironment);
    }
    if (start.environment != config_.environment_name) {
        throw AuthorizationError("environment mismatch: " + start.environment,
                                 kCloseBadEnvironment);
    }
    if (config_.stream_token && !tokens_equal(*config_.stream_token, start.token)) {
        throw AuthorizationError("invalid stream token", kCloseBadToken);
    }
}

std::shared_ptr<CallSession> SessionManager::open_session(
    const carrier::StartInfo& start, std::shared_ptr<CarrierChannel> channel) {
    const logging::CallLog log(start.call_sid, start.stream_sid);
    try {
        authorize(start);
    } catch (const AuthorizationError& ex) {
        Metrics::instance().increment_sessions_rejected("unauthorized");
        log.warn("Rejecting stream", {kv("reason", ex.what()), kv("close_code", ex.close_code())});
        throw;
    }

    SessionOptions options;
    options.preconnect_buffer_frames = static_cast<size_t>(config_.preconnect_buffer_frames);
    options.system_prompt = config_.system_prompt;

    // The duplicate check, the slot and the registration form one step so
    // two starts for the same stream cannot both get through.
    std::shared_ptr<CallSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(start.stream_sid) > 0) {
            Metrics::instance().increment_sessions_rejected("duplicate");
            log.warn("Rejecting stream, already active", {kv("close_code", kCloseDuplicateStream)});
            throw AuthorizationError("stream already active: " + start.stream_sid,
                                     kCloseDuplicateStream);
        }
        std::shared_ptr<CapacityTicket> ticket = pool_->try_acquire();
        if (!ticket) {
            Metrics::instance().increment_sessions_rejected("capacity");
            log.warn("Rejecting stream, capacity exhausted",
                     {kv("active", pool_->active()), kv("capacity", pool_->capacity())});
            throw CapacityExceededError();
        }

        session = std::make_shared<CallSession>(start, std::move(channel), adapter_factory_(),
                                                registry_, directory_, options, runner_);
        session->set_on_closed(
            [this, ticket, log](const CallSession& closed, const std::string& reason) {
                unregister(closed);
                ticket->release();
                log.info("Stream released", {kv("reason", reason), kv("active", pool_->active())});
            });
        sessions_[start.stream_sid] = session;
    }

    Metrics::instance().increment_sessions_started();
    log.info("Stream accepted",
             {kv("from", utils::mask_phone_number(start.from)),
              kv("active", pool_->active()),
              kv("capacity", pool_->capacity())});

    session->start();
    return session;
}

void SessionManager::unregister(const CallSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(session.stream_sid());
    if (it != sessions_.end() && it->second.get() == &session) {
        sessions_.erase(it);
    }
}

void SessionManager::close_session(const std::string& stream_sid, const std::string& reason) {
    auto session = find(stream_sid);
    if (session) {
        session->close(reason);
    }
}

void SessionManager::close_all(const std::string& reason) {
    std::vector<std::shared_ptr<CallSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [stream_sid, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    for (const auto& session : sessions) {
        session->close(reason);
    }
}

std::shared_ptr<CallSession> SessionManager::find(const std::string& stream_sid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(stream_sid);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

ManagerStatus SessionManager::status() const {
    ManagerStatus status;
    status.active_sessions = pool_->active();
    status.capacity = pool_->capacity();
    status.provider_configured = config_.provider_configured();
    status.provider = config_.provider;
    status.environment = config_.environment_name;
    return status;
}

}
