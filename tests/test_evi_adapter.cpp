#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/provider/evi_adapter.hpp"

#include "fakes.hpp"

#include <memory>
#include <string>
#include <vector>

using voice_bridge::Config;
using voice_bridge::actions::ActionContext;
using voice_bridge::actions::ActionRegistry;
using voice_bridge::actions::ActionSpec;
using voice_bridge::actions::ParameterSpec;
using voice_bridge::audio::MulawBuffer;
using voice_bridge::audio::PcmBuffer;
using voice_bridge::provider::EmotionTracker;
using voice_bridge::provider::EviAdapter;
using voice_bridge::provider::ProviderEvents;
using voice_bridge::provider::SessionContext;
using voice_bridge::provider::ToolCallRequest;
using voice_bridge::testing::FakeTransportLog;
using voice_bridge::testing::fake_transport_factory;
using nlohmann::json;
namespace audio = voice_bridge::audio;

namespace {

Config evi_config() {
    Config config;
    config.provider = "evi";
    config.hume_api_key = "hume-key";
    config.hume_config_id = "cfg-123";
    return config;
}

struct Harness {
    Config config = evi_config();
    ActionRegistry registry;
    std::shared_ptr<FakeTransportLog> transport = std::make_shared<FakeTransportLog>();
    std::vector<MulawBuffer> audio_out;
    std::vector<ToolCallRequest> tool_calls;
    std::vector<std::pair<std::string, std::string>> transcripts;
    int interrupted = 0;
    int connected = 0;
    std::unique_ptr<EviAdapter> adapter;

    Harness() {
        registry.register_action(
            "send_review_link",
            ActionSpec{"Send a review link",
                       {"method"},
                       {},
                       {{"method", ParameterSpec{"string", "How", {"sms", "email"}}}}},
            [](const ActionContext&, const json&) { return json::object(); });
        adapter =
            std::make_unique<EviAdapter>(config, registry, fake_transport_factory(transport));
    }

    void open() {
        ProviderEvents events;
        events.on_connected = [this]() { ++connected; };
        events.on_audio_output = [this](const MulawBuffer& frame) { audio_out.push_back(frame); };
        events.on_tool_call = [this](const ToolCallRequest& request) {
            tool_calls.push_back(request);
        };
        events.on_interrupted = [this]() { ++interrupted; };
        events.on_transcript = [this](const std::string& role, const std::string& text) {
            transcripts.emplace_back(role, text);
        };
        SessionContext context;
        context.call_sid = "CA7";
        context.stream_sid = "MZ7";
        context.system_prompt = "Claims assistant.";
        adapter->connect(context, std::move(events));
        transport->handlers.on_open();
    }
};

}

TEST_CASE("evi connects with the api key header and config id") {
    Harness h;
    h.open();
    REQUIRE(h.transport->url == "wss://api.hume.ai/v0/evi/chat?config_id=cfg-123");
    REQUIRE(h.transport->headers.at("X-Hume-Api-Key") == "hume-key");
    REQUIRE(h.connected == 1);
}

TEST_CASE("evi session settings declare 8 kHz linear PCM and string tool schemas") {
    Harness h;
    h.open();
    const auto sent = h.transport->sent_json();
    REQUIRE(sent.size() == 1);
    const auto& settings = sent[0];
    REQUIRE(settings["type"] == "session_settings");
    REQUIRE(settings["audio"] == json{{"encoding", "linear16"}, {"sample_rate", 8000}, {"channels", 1}});
    REQUIRE(settings["system_prompt"].get<std::string>().find("Claims assistant.") == 0);
    REQUIRE(settings["system_prompt"].get<std::string>().find("not been identified") !=
            std::string::npos);

    const auto& tool = settings["tools"][0];
    REQUIRE(tool["name"] == "send_review_link");
    REQUIRE(tool["parameters"].is_string());
    const auto schema = json::parse(tool["parameters"].get<std::string>());
    REQUIRE(schema["properties"]["method"]["enum"] == json::array({"sms", "email"}));
}

TEST_CASE("evi transcodes caller audio to PCM16") {
    Harness h;
    h.open();
    h.adapter->send_audio(MulawBuffer{0xFF, 0x80});

    const auto sent = h.transport->sent_json();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[1]["type"] == "audio_input");
    const auto pcm = audio::le_bytes_to_pcm(audio::base64_decode(sent[1]["data"].get<std::string>()));
    REQUIRE(pcm == PcmBuffer{0, 32124});
}

TEST_CASE("evi converts WAV output to carrier mu-law") {
    Harness h;
    h.open();
    const PcmBuffer samples(960, 1000);
    h.transport->deliver({{"type", "audio_output"},
                          {"data", audio::base64_encode(audio::encode_wav(samples, 48000))}});

    REQUIRE(h.audio_out.size() == 1);
    REQUIRE(h.audio_out[0].size() == 160);
    REQUIRE(h.audio_out[0][0] == audio::mulaw_encode(1000));
}

TEST_CASE("evi drops undecodable audio without failing the call") {
    Harness h;
    h.open();
    h.transport->deliver({{"type", "audio_output"}, {"data", audio::base64_encode(std::string("junk"))}});
    h.transport->deliver({{"type", "user_interruption"}});
    REQUIRE(h.audio_out.empty());
    REQUIRE(h.interrupted == 1);
}

TEST_CASE("evi drops scalar frames and keeps the conversation going") {
    Harness h;
    h.open();
    REQUIRE_NOTHROW(h.transport->handlers.on_message("42"));
    REQUIRE_NOTHROW(h.transport->handlers.on_message("\"text\""));
    REQUIRE_NOTHROW(h.transport->handlers.on_message(R"({"type":["user_interruption"]})"));
    h.transport->deliver({{"type", "user_interruption"}});

    REQUIRE(h.interrupted == 1);
    REQUIRE(h.adapter->state() == voice_bridge::provider::ConnectionState::Open);
}

TEST_CASE("evi tool calls parse string parameters and answer with tool_response") {
    Harness h;
    h.open();
    h.transport->deliver({{"type", "tool_call"},
                          {"tool_call_id", "tc_1"},
                          {"name", "send_review_link"},
                          {"parameters", R"({"method":"sms"})"}});

    REQUIRE(h.tool_calls.size() == 1);
    REQUIRE(h.tool_calls[0].correlation_id == "tc_1");
    REQUIRE(h.tool_calls[0].arguments == json{{"method", "sms"}});

    h.adapter->send_tool_result("tc_1", json{{"success", false}, {"error", "no phone"}});
    const auto sent = h.transport->sent_json();
    REQUIRE(sent.back()["type"] == "tool_response");
    REQUIRE(sent.back()["tool_call_id"] == "tc_1");
    REQUIRE(json::parse(sent.back()["content"].get<std::string>())["error"] == "no phone");
}

TEST_CASE("evi tracks prosody from user messages") {
    Harness h;
    h.open();
    h.transport->deliver(
        {{"type", "user_message"},
         {"message", {{"role", "user"}, {"content", "I'm worried about my claim"}}},
         {"models", {{"prosody", {{"scores", {{"Anxiety", 0.8}, {"Calmness", 0.1}, {"Joy", 0.0}}}}}}}});
    h.transport->deliver(
        {{"type", "user_message"},
         {"message", {{"role", "user"}, {"content", "Thanks"}}},
         {"models", {{"prosody", {{"scores", {{"Anxiety", 0.2}, {"Calmness", 0.5}, {"Joy", 0.4}}}}}}}});
    h.transport->deliver({{"type", "assistant_message"},
                          {"message", {{"role", "assistant"}, {"content", "Of course."}}}});

    REQUIRE(h.adapter->emotions().samples() == 2);
    const auto top = h.adapter->emotions().dominant(2);
    REQUIRE(top.size() == 2);
    REQUIRE(top[0].first == "Anxiety");
    REQUIRE(top[1].first == "Calmness");
    REQUIRE(h.transcripts.size() == 3);
    REQUIRE(h.transcripts[2] == std::make_pair(std::string("assistant"), std::string("Of course.")));
}

TEST_CASE("EmotionTracker averages and ignores non-numeric scores") {
    EmotionTracker tracker;
    REQUIRE(tracker.dominant(3).empty());
    tracker.add(json{{"Joy", 1.0}, {"label", "x"}});
    tracker.add(json{{"Joy", 0.0}, {"Sadness", 0.9}});
    tracker.add(json::array());

    const auto top = tracker.dominant(5);
    REQUIRE(tracker.samples() == 2);
    REQUIRE(top.size() == 2);
    REQUIRE(top[0].first == "Joy");
    REQUIRE(top[0].second == 0.5);
    REQUIRE(top[1].second == 0.45);
}

TEST_CASE("evi connects without a config id") {
    Config config = evi_config();
    config.hume_config_id.reset();
    ActionRegistry registry;
    auto log = std::make_shared<FakeTransportLog>();
    EviAdapter adapter(config, registry, fake_transport_factory(log));
    adapter.connect(SessionContext{}, ProviderEvents{});
    REQUIRE(log->url == "wss://api.hume.ai/v0/evi/chat");
}
