#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "voice_bridge/actions/registry.hpp"
#include "voice_bridge/actions/services.hpp"
#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/carrier/protocol.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/provider/adapter.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {
namespace session {

constexpr int kCloseNormal = 1000;
constexpr int kCloseUpstreamFailure = 1011;

// The carrier side of one call, as seen by the session.
class CarrierChannel {
public:
    virtual ~CarrierChannel() = default;

    virtual bool send_text(const std::string& payload) = 0;
    virtual void close(int code, const std::string& reason) = 0;

    void set_call_log(logging::CallLog log) { log_ = std::move(log); }
    const logging::CallLog& call_log() const { return log_; }

protected:
    logging::CallLog log_;
};

// Clears the in-flight tool flag when the tool call ends, however it ends.
class ToolCallGuard {
public:
    explicit ToolCallGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ToolCallGuard() { flag_ = false; }

    ToolCallGuard(const ToolCallGuard&) = delete;
    ToolCallGuard& operator=(const ToolCallGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

enum class SessionState {
    Created,
    ConnectingUpstream,
    Active,
    Closing,
    Closed,
};

const char* to_string(SessionState state);

struct CallerIdentity {
    std::string phone;
    bool found = false;
    std::optional<std::string> customer_id;
    std::optional<std::string> customer_name;
    std::optional<int> claim_count;
    std::optional<std::string> status;
};

struct SessionOptions {
    size_t preconnect_buffer_frames = 500;
    std::string system_prompt;
};

class CallSession : public std::enable_shared_from_this<CallSession> {
public:
    using ClosedHook = std::function<void(const CallSession&, const std::string& reason)>;

    // directory may be null; the caller is then resolved from the start
    // event alone.
    CallSession(carrier::StartInfo start,
                std::shared_ptr<CarrierChannel> channel,
                std::unique_ptr<provider::ProviderAdapter> adapter,
                const actions::ActionRegistry& registry,
                actions::CustomerDirectory* directory,
                SessionOptions options,
                utils::TaskRunner runner);
    ~CallSession();

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    void set_on_closed(ClosedHook hook);

    // Resolves the caller and connects upstream on the task runner.
    void start();
    // Base64 mu-law payload of one carrier media event.
    void handle_carrier_media(const std::string& payload);
    // Idempotent. Closes the provider and the carrier channel, then runs the
    // closed hook once.
    void close(const std::string& reason, int code = kCloseNormal);

    SessionState state() const;
    size_t buffered_frames() const;
    size_t dropped_frames() const;
    bool tool_call_in_flight() const { return tool_in_flight_; }
    CallerIdentity caller() const;

    const std::string& call_sid() const { return start_.call_sid; }
    const std::string& stream_sid() const { return start_.stream_sid; }
    std::chrono::steady_clock::time_point created_at() const { return created_at_; }

    // Decodes the base64 JSON callerContext custom parameter.
    static std::optional<CallerIdentity> decode_caller_context(
        const std::string& encoded,
        const std::string& phone,
        const logging::CallLog& log = logging::CallLog());

private:
    void run_start();
    CallerIdentity resolve_caller() const;
    provider::ProviderEvents make_events();

    void on_provider_connected();
    void on_provider_audio(const audio::MulawBuffer& frame);
    void on_tool_call(const provider::ToolCallRequest& request);
    void on_interrupted();
    void on_transcript(const std::string& role, const std::string& text);

    carrier::StartInfo start_;
    std::shared_ptr<CarrierChannel> channel_;
    std::unique_ptr<provider::ProviderAdapter> adapter_;
    const actions::ActionRegistry& registry_;
    actions::CustomerDirectory* directory_;
    SessionOptions options_;
    utils::TaskRunner runner_;
    std::chrono::steady_clock::time_point created_at_;
    logging::CallLog log_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Created;
    std::deque<audio::MulawBuffer> buffer_;
    size_t dropped_frames_ = 0;
    CallerIdentity caller_;
    ClosedHook on_closed_;
    std::atomic<bool> tool_in_flight_{false};
};

}
}
