#include "voice_bridge/session/call_session.hpp"

#include <initializer_list>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/phone.hpp"

namespace voice_bridge::session {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& object,
                                           std::initializer_list<const char*> keys) {
    for (const auto* key : keys) {
        const auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            continue;
        }
        if (it->is_string()) {
            if (!it->get<std::string>().empty()) {
                return it->get<std::string>();
            }
            continue;
        }
        if (it->is_number()) {
            return it->dump();
        }
    }
    return std::nullopt;
}

}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::ConnectingUpstream:
            return "connecting_upstream";
        case SessionState::Active:
            return "active";
        case SessionState::Closing:
            return "closing";
        case SessionState::Closed:
            return "closed";
    }
    return "unknown";
}

CallSession::CallSession(carrier::StartInfo start,
                         std::shared_ptr<CarrierChannel> channel,
                         std::unique_ptr<provider::ProviderAdapter> adapter,
                         const actions::ActionRegistry& registry,
                         actions::CustomerDirectory* directory,
                         SessionOptions options,
                         utils::TaskRunner runner)
    : start_(std::move(start)),
      channel_(std::move(channel)),
      adapter_(std::move(adapter)),
      registry_(registry),
      directory_(directory),
      options_(std::move(options)),
      runner_(std::move(runner)),
      created_at_(std::chrono::steady_clock::now()),
      log_(start_.call_sid, start_.stream_sid) {
    caller_.phone = start_.from;
    if (options_.preconnect_buffer_frames == 0) {
        options_.preconnect_buffer_frames = 1;
    }
}

CallSession::~CallSession() {
    log_.debug("Call session destroyed");
}

void CallSession::set_on_closed(ClosedHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_closed_ = std::move(hook);
}

void CallSession::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Created) {
            return;
        }
    }
    auto self = shared_from_this();
    runner_([self]() { self->run_start(); });
}

std::optional<CallerIdentity> CallSession::decode_caller_context(const std::string& encoded,
                                                                 const std::string& phone,
                                                                 const logging::CallLog& log) {
    nlohmann::json context;
    try {
        context = nlohmann::json::parse(audio::base64_decode(encoded));
    } catch (const std::exception& ex) {
        log.warn("Ignoring undecodable caller context", {kv("error", ex.what())});
        return std::nullopt;
    }
    if (!context.is_object()) {
        return std::nullopt;
    }
    CallerIdentity identity;
    identity.phone = optional_string(context, {"phone"}).value_or(phone);
    identity.found = context.value("found", false);
    identity.customer_id = optional_string(context, {"userId", "customerId", "id"});
    identity.customer_name = optional_string(context, {"fullName", "name"});
    identity.status = optional_string(context, {"status"});
    const auto claims = context.find("claimsCount");
    if (claims != context.end() && claims->is_number_integer()) {
        identity.claim_count = claims->get<int>();
    }
    if (identity.customer_id) {
        identity.found = true;
    }
    return identity;
}

CallerIdentity CallSession::resolve_caller() const {
    if (start_.caller_context) {
        if (auto identity = decode_caller_context(*start_.caller_context, start_.from, log_)) {
            return *identity;
        }
    }
    CallerIdentity identity;
    identity.phone = start_.from;
    if (!directory_ || start_.from.empty()) {
        return identity;
    }
    try {
        const auto customer = directory_->find_customer_by_phone(start_.from);
        if (customer.found) {
            identity.found = true;
            identity.customer_id = customer.id;
            identity.customer_name = customer.full_name;
            identity.claim_count = customer.claim_count;
        }
    } catch (const std::exception& ex) {
        log_.warn(
            "Caller lookup failed, continuing anonymously",
            {kv("phone", utils::mask_phone_number(start_.from)),
             kv("error", ex.what())});
    }
    return identity;
}

void CallSession::run_start() {
    const auto identity = resolve_caller();

    provider::SessionContext context;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Created) {
            return;
        }
        caller_ = identity;
        state_ = SessionState::ConnectingUpstream;
    }
    context.call_sid = start_.call_sid;
    context.stream_sid = start_.stream_sid;
    context.caller_phone = identity.phone;
    context.customer_id = identity.customer_id;
    context.customer_name = identity.customer_name;
    context.claim_count = identity.claim_count;
    context.account_status = identity.status;
    context.system_prompt = options_.system_prompt;

    log_.info(
        "Call session starting",
        {kv("provider", adapter_->variant()),
         kv("caller", utils::mask_phone_number(identity.phone)),
         kv("identified", identity.found)});

    try {
        adapter_->connect(context, make_events());
    } catch (const std::exception& ex) {
        log_.error("Provider connect failed", {kv("error", ex.what())});
        close(std::string("upstream connect failed: ") + ex.what(), kCloseUpstreamFailure);
    }
}

provider::ProviderEvents CallSession::make_events() {
    std::weak_ptr<CallSession> weak = shared_from_this();
    provider::ProviderEvents events;
    events.on_connected = [weak]() {
        if (auto self = weak.lock()) {
            self->on_provider_connected();
        }
    };
    events.on_audio_output = [weak](const audio::MulawBuffer& frame) {
        if (auto self = weak.lock()) {
            self->on_provider_audio(frame);
        }
    };
    events.on_tool_call = [weak](const provider::ToolCallRequest& request) {
        if (auto self = weak.lock()) {
            self->on_tool_call(request);
        }
    };
    events.on_interrupted = [weak]() {
        if (auto self = weak.lock()) {
            self->on_interrupted();
        }
    };
    events.on_transcript = [weak](const std::string& role, const std::string& text) {
        if (auto self = weak.lock()) {
            self->on_transcript(role, text);
        }
    };
    events.on_error = [weak](const std::string& message) {
        if (auto self = weak.lock()) {
            self->close("upstream error: " + message, kCloseUpstreamFailure);
        }
    };
    events.on_closed = [weak]() {
        if (auto self = weak.lock()) {
            self->close("upstream closed");
        }
    };
    return events;
}

void CallSession::handle_carrier_media(const std::string& payload) {
    audio::MulawBuffer frame;
    try {
        frame = audio::base64_decode_bytes(payload);
    } catch (const audio::CodecError& ex) {
        Metrics::instance().increment_frames_dropped("malformed");
        log_.warn("Dropping malformed carrier frame", {kv("error", ex.what())});
        return;
    }
    if (frame.empty()) {
        Metrics::instance().increment_frames_dropped("malformed");
        log_.debug("Dropping empty carrier frame");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case SessionState::Created:
        case SessionState::ConnectingUpstream:
            if (buffer_.size() >= options_.preconnect_buffer_frames) {
                buffer_.pop_front();
                ++dropped_frames_;
                Metrics::instance().increment_frames_dropped("buffer_overflow");
            }
            buffer_.push_back(std::move(frame));
            break;
        case SessionState::Active:
            adapter_->send_audio(frame);
            break;
        case SessionState::Closing:
        case SessionState::Closed:
            break;
    }
}

void CallSession::on_provider_connected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::ConnectingUpstream) {
        return;
    }
    const auto flushed = buffer_.size();
    while (!buffer_.empty()) {
        adapter_->send_audio(buffer_.front());
        buffer_.pop_front();
    }
    state_ = SessionState::Active;
    log_.info(
        "Call session active",
        {kv("flushed_frames", flushed),
         kv("dropped_frames", dropped_frames_)});
}

void CallSession::on_provider_audio(const audio::MulawBuffer& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Active) {
        return;
    }
    channel_->send_text(
        carrier::build_media_message(start_.stream_sid, audio::base64_encode(frame)));
}

void CallSession::on_tool_call(const provider::ToolCallRequest& request) {
    if (state() != SessionState::Active) {
        log_.warn("Ignoring tool call on inactive session", {kv("action", request.name)});
        return;
    }
    if (tool_in_flight_.exchange(true)) {
        log_.warn("Rejecting overlapping tool call", {kv("action", request.name)});
        adapter_->send_tool_result(
            request.correlation_id,
            nlohmann::json{
                {"success", false},
                {"error", "another action is already in progress"},
                {"action", request.name}});
        return;
    }

    actions::ActionContext context;
    context.call_sid = start_.call_sid;
    context.stream_sid = start_.stream_sid;
    context.provider = adapter_->variant();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        context.caller_phone = caller_.phone;
        context.customer_id = caller_.customer_id;
    }

    auto self = shared_from_this();
    runner_([self, request, context]() {
        const ToolCallGuard guard(self->tool_in_flight_);
        const auto result = self->registry_.execute(request.name, context, request.arguments);
        if (self->state() == SessionState::Active) {
            self->adapter_->send_tool_result(request.correlation_id, result);
        }
    });
}

void CallSession::on_interrupted() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Active) {
        return;
    }
    log_.debug("Caller barged in, clearing playback");
    channel_->send_text(carrier::build_clear_message(start_.stream_sid));
}

void CallSession::on_transcript(const std::string& role, const std::string& text) {
    if (text.empty()) {
        return;
    }
    log_.info("Transcript", {kv("role", role), kv("text", text)});
}

void CallSession::close(const std::string& reason, int code) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closing || state_ == SessionState::Closed) {
            return;
        }
        state_ = SessionState::Closing;
        buffer_.clear();
    }

    const auto duration = std::chrono::duration_cast<std::chrono::seconds>(
                              std::chrono::steady_clock::now() - created_at_)
                              .count();
    log_.info("Closing call session", {kv("reason", reason), kv("duration_s", duration)});

    adapter_->close();
    channel_->close(code, reason);

    ClosedHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = std::move(on_closed_);
        on_closed_ = nullptr;
    }
    if (hook) {
        hook(*this, reason);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::Closed;
}

SessionState CallSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t CallSession::buffered_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

size_t CallSession::dropped_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_frames_;
}

CallerIdentity CallSession::caller() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caller_;
}

}
