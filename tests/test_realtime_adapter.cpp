#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/provider/realtime_adapter.hpp"

#include "fakes.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using voice_bridge::Config;
using voice_bridge::actions::ActionContext;
using voice_bridge::actions::ActionRegistry;
using voice_bridge::actions::ActionSpec;
using voice_bridge::actions::ParameterSpec;
using voice_bridge::audio::MulawBuffer;
using voice_bridge::audio::base64_encode;
using voice_bridge::provider::ConnectionState;
using voice_bridge::provider::ProviderEvents;
using voice_bridge::provider::RealtimeAdapter;
using voice_bridge::provider::SessionContext;
using voice_bridge::provider::ToolCallRequest;
using voice_bridge::testing::FakeTransportLog;
using voice_bridge::testing::RefusingTransport;
using voice_bridge::testing::fake_transport_factory;
using nlohmann::json;

namespace {

Config realtime_config() {
    Config config;
    config.provider = "realtime";
    config.openai_api_key = "sk-test";
    config.upstream_connect_timeout_ms = 2500;
    return config;
}

struct Recorder {
    int connected = 0;
    int interrupted = 0;
    int closed = 0;
    std::vector<std::string> errors;
    std::vector<MulawBuffer> audio;
    std::vector<ToolCallRequest> tool_calls;
    std::vector<std::pair<std::string, std::string>> transcripts;

    ProviderEvents events() {
        ProviderEvents events;
        events.on_connected = [this]() { ++connected; };
        events.on_audio_output = [this](const MulawBuffer& frame) { audio.push_back(frame); };
        events.on_tool_call = [this](const ToolCallRequest& request) {
            tool_calls.push_back(request);
        };
        events.on_interrupted = [this]() { ++interrupted; };
        events.on_transcript = [this](const std::string& role, const std::string& text) {
            transcripts.emplace_back(role, text);
        };
        events.on_error = [this](const std::string& message) { errors.push_back(message); };
        events.on_closed = [this]() { ++closed; };
        return events;
    }
};

SessionContext known_caller() {
    SessionContext context;
    context.call_sid = "CA9";
    context.stream_sid = "MZ9";
    context.caller_phone = "+447700900123";
    context.customer_id = "u9";
    context.customer_name = "Sam Taylor";
    context.claim_count = 2;
    context.system_prompt = "You answer claim calls.";
    return context;
}

struct Harness {
    Config config = realtime_config();
    ActionRegistry registry;
    std::shared_ptr<FakeTransportLog> transport = std::make_shared<FakeTransportLog>();
    Recorder recorder;
    std::unique_ptr<RealtimeAdapter> adapter;

    Harness() {
        registry.register_action(
            "schedule_callback",
            ActionSpec{"Schedule a callback",
                       {"preferred_time"},
                       {},
                       {{"preferred_time", ParameterSpec{"string", "When", {}}}}},
            [](const ActionContext&, const json&) { return json::object(); });
        adapter = std::make_unique<RealtimeAdapter>(config, registry,
                                                    fake_transport_factory(transport));
    }

    void open() {
        adapter->connect(known_caller(), recorder.events());
        transport->handlers.on_open();
    }
};

}

TEST_CASE("realtime connect targets the model endpoint with auth headers") {
    Harness h;
    h.adapter->connect(known_caller(), h.recorder.events());

    REQUIRE(h.transport->opened == 1);
    REQUIRE(h.transport->url ==
            "wss://api.openai.com/v1/realtime?model=gpt-4o-realtime-preview");
    REQUIRE(h.transport->headers.at("Authorization") == "Bearer sk-test");
    REQUIRE(h.transport->headers.at("OpenAI-Beta") == "realtime=v1");
    REQUIRE(h.transport->timeout == std::chrono::milliseconds(2500));
    REQUIRE(h.adapter->state() == ConnectionState::Connecting);
    REQUIRE(h.recorder.connected == 0);
    REQUIRE(h.transport->call_log.call_sid() == "CA9");
    REQUIRE(h.transport->call_log.stream_sid() == "MZ9");
}

TEST_CASE("realtime sends the session configuration before reporting ready") {
    Harness h;
    h.open();

    REQUIRE(h.recorder.connected == 1);
    REQUIRE(h.adapter->state() == ConnectionState::Open);
    const auto sent = h.transport->sent_json();
    REQUIRE(sent.size() == 1);
    const auto& session = sent[0]["session"];
    REQUIRE(sent[0]["type"] == "session.update");
    REQUIRE(session["input_audio_format"] == "g711_ulaw");
    REQUIRE(session["output_audio_format"] == "g711_ulaw");
    REQUIRE(session["turn_detection"]["type"] == "server_vad");
    REQUIRE(session["turn_detection"]["silence_duration_ms"] == 500);
    REQUIRE(session["tools"].size() == 1);
    REQUIRE(session["tools"][0]["type"] == "function");
    REQUIRE(session["tools"][0]["name"] == "schedule_callback");
    REQUIRE(session["tools"][0]["parameters"]["required"] == json::array({"preferred_time"}));

    const auto instructions = session["instructions"].get<std::string>();
    REQUIRE(instructions.find("You answer claim calls.") == 0);
    REQUIRE(instructions.find("Sam Taylor") != std::string::npos);
    REQUIRE(instructions.find("Claims on file: 2") != std::string::npos);
}

TEST_CASE("realtime forwards caller audio unchanged") {
    Harness h;
    h.open();
    h.adapter->send_audio(MulawBuffer{0xFF, 0x7F, 0x00, 0x80});
    h.adapter->send_audio(MulawBuffer{});

    const auto sent = h.transport->sent_json();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[1] == json{{"type", "input_audio_buffer.append"}, {"audio", "/38AgA=="}});
}

TEST_CASE("realtime decodes model audio deltas") {
    Harness h;
    h.open();
    h.transport->deliver({{"type", "response.audio.delta"}, {"delta", "/38="}});
    h.transport->deliver({{"type", "response.output_audio.delta"}, {"delta", "AA=="}});

    REQUIRE(h.recorder.audio.size() == 2);
    REQUIRE(h.recorder.audio[0] == MulawBuffer{0xFF, 0x7F});
    REQUIRE(h.recorder.audio[1] == MulawBuffer{0x00});
}

TEST_CASE("realtime surfaces function calls and answers them") {
    Harness h;
    h.open();
    h.transport->deliver({{"type", "response.function_call_arguments.done"},
                          {"call_id", "call_42"},
                          {"name", "schedule_callback"},
                          {"arguments", R"({"preferred_time":"tomorrow 2pm"})"}});

    REQUIRE(h.recorder.tool_calls.size() == 1);
    REQUIRE(h.recorder.tool_calls[0].correlation_id == "call_42");
    REQUIRE(h.recorder.tool_calls[0].arguments["preferred_time"] == "tomorrow 2pm");

    h.adapter->send_tool_result("call_42", json{{"success", true}});
    const auto sent = h.transport->sent_json();
    REQUIRE(sent.size() == 3);
    REQUIRE(sent[1]["type"] == "conversation.item.create");
    REQUIRE(sent[1]["item"]["type"] == "function_call_output");
    REQUIRE(sent[1]["item"]["call_id"] == "call_42");
    REQUIRE(json::parse(sent[1]["item"]["output"].get<std::string>())["success"] == true);
    REQUIRE(sent[2] == json{{"type", "response.create"}});
}

TEST_CASE("realtime keeps unparseable arguments for the registry to reject") {
    Harness h;
    h.open();
    h.transport->deliver({{"type", "response.function_call_arguments.done"},
                          {"call_id", "call_1"},
                          {"name", "schedule_callback"},
                          {"arguments", "{broken"}});
    REQUIRE(h.recorder.tool_calls.size() == 1);
    REQUIRE(h.recorder.tool_calls[0].arguments.is_string());
}

TEST_CASE("realtime reports barge-in and transcripts") {
    Harness h;
    h.open();
    h.transport->deliver({{"type", "input_audio_buffer.speech_started"}});
    h.transport->deliver({{"type", "response.audio_transcript.done"}, {"transcript", "Hello"}});
    h.transport->deliver({{"type", "conversation.item.input_audio_transcription.completed"},
                          {"transcript", "Hi there"}});

    REQUIRE(h.recorder.interrupted == 1);
    REQUIRE(h.recorder.transcripts.size() == 2);
    REQUIRE(h.recorder.transcripts[0].first == "assistant");
    REQUIRE(h.recorder.transcripts[1].second == "Hi there");
}

TEST_CASE("realtime treats provider error events as non-fatal") {
    Harness h;
    h.open();
    h.transport->deliver(
        {{"type", "error"}, {"error", {{"code", "invalid_value"}, {"message", "bad"}}}});
    h.transport->handlers.on_message("not json at all");
    h.transport->deliver({{"type", "response.audio.delta"}, {"delta", "###"}});

    REQUIRE(h.recorder.errors.empty());
    REQUIRE(h.adapter->state() == ConnectionState::Open);
}

TEST_CASE("realtime drops frames that are valid JSON but not objects") {
    Harness h;
    h.open();
    for (const char* frame : {"42", "\"text\"", "[1,2]", "null", "true"}) {
        REQUIRE_NOTHROW(h.transport->handlers.on_message(frame));
    }
    REQUIRE_NOTHROW(h.transport->handlers.on_message(R"({"type":7,"delta":"AA=="})"));
    h.transport->deliver({{"type", "response.audio.delta"}, {"delta", "AA=="}});

    REQUIRE(h.recorder.errors.empty());
    REQUIRE(h.recorder.closed == 0);
    REQUIRE(h.adapter->state() == ConnectionState::Open);
    REQUIRE(h.recorder.audio.size() == 1);
}

TEST_CASE("realtime delivers exactly one terminal event") {
    Harness h;
    h.open();
    h.transport->handlers.on_error("connection reset");
    h.transport->handlers.on_close();
    h.transport->deliver({{"type", "input_audio_buffer.speech_started"}});

    REQUIRE(h.recorder.errors == std::vector<std::string>{"connection reset"});
    REQUIRE(h.recorder.closed == 0);
    REQUIRE(h.recorder.interrupted == 0);
    REQUIRE(h.adapter->state() == ConnectionState::Closed);
}

TEST_CASE("realtime remote close is reported once") {
    Harness h;
    h.open();
    h.transport->handlers.on_close();
    h.transport->handlers.on_close();
    REQUIRE(h.recorder.closed == 1);
    REQUIRE(h.recorder.errors.empty());
}

TEST_CASE("realtime local close suppresses further events") {
    Harness h;
    h.open();
    h.adapter->close();
    REQUIRE(h.transport->closed);
    REQUIRE(h.adapter->state() == ConnectionState::Closed);

    h.transport->handlers.on_close();
    h.adapter->send_audio(MulawBuffer{1});
    REQUIRE(h.recorder.closed == 0);
    REQUIRE(h.transport->sent.size() == 1);
    h.adapter->close();
}

TEST_CASE("realtime rejects a second connect") {
    Harness h;
    h.open();
    REQUIRE_THROWS_AS(h.adapter->connect(known_caller(), h.recorder.events()), std::logic_error);
}

TEST_CASE("realtime reports an unreachable endpoint as an error") {
    Config config = realtime_config();
    ActionRegistry registry;
    Recorder recorder;
    RealtimeAdapter adapter(config, registry, []() {
        return std::make_unique<RefusingTransport>();
    });
    adapter.connect(known_caller(), recorder.events());

    REQUIRE(recorder.errors.size() == 1);
    REQUIRE(recorder.errors[0].find("upstream connect failed") == 0);
    REQUIRE(adapter.state() == ConnectionState::Closed);
}

TEST_CASE("make_provider_adapter selects the configured variant") {
    Config config = realtime_config();
    ActionRegistry registry;
    auto log = std::make_shared<FakeTransportLog>();
    REQUIRE(voice_bridge::provider::make_provider_adapter(config, registry,
                                                          fake_transport_factory(log))
                ->variant() == "realtime");
    config.provider = "evi";
    REQUIRE(voice_bridge::provider::make_provider_adapter(config, registry,
                                                          fake_transport_factory(log))
                ->variant() == "evi");
    config.provider = "dialogflow";
    REQUIRE_THROWS_AS(voice_bridge::provider::make_provider_adapter(
                          config, registry, fake_transport_factory(log)),
                      std::invalid_argument);
}
