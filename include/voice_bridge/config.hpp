#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace voice_bridge {

struct Config {
    int port = 8080;
    int status_port = 8081;
    std::string carrier_ws_path = "/twilio/media";
    std::string environment_name = "staging-development";
    std::vector<std::string> allowed_environments;
    std::optional<std::string> stream_token;
    int max_concurrent_streams = 2;

    std::string provider = "realtime";
    std::optional<std::string> openai_api_key;
    std::string openai_realtime_url = "wss://api.openai.com/v1/realtime";
    std::string openai_realtime_model = "gpt-4o-realtime-preview";
    std::string openai_realtime_voice = "alloy";
    std::optional<std::string> hume_api_key;
    std::optional<std::string> hume_config_id;
    std::string hume_evi_url = "wss://api.hume.ai/v0/evi/chat";
    std::string system_prompt;

    double vad_threshold = 0.5;
    int vad_prefix_padding_ms = 300;
    int vad_silence_duration_ms = 500;
    int preconnect_buffer_frames = 500;
    int upstream_connect_timeout_ms = 10000;

    std::optional<std::string> business_api_url;
    std::optional<std::string> business_api_token;
    double business_api_timeout = 10.0;
    std::optional<std::string> twilio_account_sid;
    std::optional<std::string> twilio_auth_token;
    std::optional<std::string> twilio_from_number;
    bool enable_real_sms = false;
    std::string portal_base_url = "https://dev.example.co.uk";
    std::string review_url = "https://uk.trustpilot.com/review/example.co.uk";

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_bridge";

    static Config load();
    void validate() const;
    bool provider_configured() const;
};

}
