#include "voice_bridge/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_bridge {

namespace {

const char* kDefaultSystemPrompt =
    "You are a warm, professional British customer service agent answering phone calls "
    "about motor finance claims. Keep answers short and conversational. Use the available "
    "functions to look up the caller, check claims, send links and schedule callbacks. "
    "Never read out full links or reference numbers unless asked.";

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::optional<std::string> get_env_trimmed(const char* name) {
    auto value = get_env_optional(name);
    if (!value) {
        return std::nullopt;
    }
    auto trimmed = trim(*value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error("Cannot open SYSTEM_PROMPT_FILE: " + path.string());
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Real environment wins over .env.
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.port = get_env_int("PORT", 8080);
    config.status_port = get_env_int("STATUS_PORT", 8081);
    config.carrier_ws_path = get_env_str("CARRIER_WS_PATH", "/twilio/media");
    config.environment_name = get_env_str("ENVIRONMENT_NAME", "staging-development");
    config.allowed_environments =
        split_csv(get_env_str("AI_VOICE_ALLOWED_ENVIRONMENTS", "staging-development"));
    config.stream_token = get_env_optional("VOICE_STREAM_TOKEN");
    config.max_concurrent_streams = get_env_int("VOICE_MAX_CONCURRENT_STREAMS", 2);

    config.provider = trim(get_env_str("VOICE_PROVIDER", "realtime"));
    std::transform(config.provider.begin(), config.provider.end(), config.provider.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    config.openai_api_key = get_env_trimmed("OPENAI_API_KEY");
    config.openai_realtime_url =
        get_env_str("OPENAI_REALTIME_URL", "wss://api.openai.com/v1/realtime");
    config.openai_realtime_model = get_env_str("OPENAI_REALTIME_MODEL", "gpt-4o-realtime-preview");
    config.openai_realtime_voice = get_env_str("OPENAI_REALTIME_VOICE", "alloy");
    config.hume_api_key = get_env_trimmed("HUME_API_KEY");
    config.hume_config_id = get_env_trimmed("HUME_CONFIG_ID");
    config.hume_evi_url = get_env_str("HUME_EVI_URL", "wss://api.hume.ai/v0/evi/chat");

    if (const auto prompt_file = get_env_optional("SYSTEM_PROMPT_FILE")) {
        config.system_prompt = trim(read_file(*prompt_file));
    } else {
        config.system_prompt = get_env_str("SYSTEM_PROMPT", kDefaultSystemPrompt);
    }

    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.5);
    config.vad_prefix_padding_ms = get_env_int("VAD_PREFIX_PADDING_MS", 300);
    config.vad_silence_duration_ms = get_env_int("VAD_SILENCE_DURATION_MS", 500);
    config.preconnect_buffer_frames = get_env_int("PRECONNECT_BUFFER_FRAMES", 500);
    config.upstream_connect_timeout_ms = get_env_int("UPSTREAM_CONNECT_TIMEOUT_MS", 10000);

    config.business_api_url = get_env_optional("BUSINESS_API_URL");
    config.business_api_token = get_env_optional("BUSINESS_API_TOKEN");
    config.business_api_timeout = get_env_double("BUSINESS_API_TIMEOUT", 10.0);
    config.twilio_account_sid = get_env_optional("TWILIO_ACCOUNT_SID");
    config.twilio_auth_token = get_env_optional("TWILIO_AUTH_TOKEN");
    config.twilio_from_number = get_env_optional("TWILIO_FROM_NUMBER");
    config.enable_real_sms = get_env_bool("ENABLE_REAL_SMS", false);
    config.portal_base_url = get_env_str("PORTAL_BASE_URL", "https://dev.example.co.uk");
    config.review_url =
        get_env_str("REVIEW_URL", "https://uk.trustpilot.com/review/example.co.uk");

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_bridge");

    return config;
}

void Config::validate() const {
    if (port <= 0) {
        throw std::runtime_error("PORT must be positive");
    }
    if (status_port <= 0) {
        throw std::runtime_error("STATUS_PORT must be positive");
    }
    if (status_port == port) {
        throw std::runtime_error("STATUS_PORT must differ from PORT");
    }
    if (carrier_ws_path.empty() || carrier_ws_path.front() != '/') {
        throw std::runtime_error("CARRIER_WS_PATH must start with '/'");
    }
    if (environment_name.empty()) {
        throw std::runtime_error("ENVIRONMENT_NAME is required");
    }
    if (max_concurrent_streams <= 0) {
        throw std::runtime_error("VOICE_MAX_CONCURRENT_STREAMS must be positive");
    }
    if (preconnect_buffer_frames <= 0) {
        throw std::runtime_error("PRECONNECT_BUFFER_FRAMES must be positive");
    }
    if (upstream_connect_timeout_ms <= 0) {
        throw std::runtime_error("UPSTREAM_CONNECT_TIMEOUT_MS must be positive");
    }
    if (vad_threshold < 0.0 || vad_threshold > 1.0) {
        throw std::runtime_error("VAD_THRESHOLD must be within [0, 1]");
    }
    if (provider == "realtime") {
        if (!openai_api_key) {
            throw std::runtime_error("OPENAI_API_KEY is required for VOICE_PROVIDER=realtime");
        }
    } else if (provider == "evi") {
        if (!hume_api_key) {
            throw std::runtime_error("HUME_API_KEY is required for VOICE_PROVIDER=evi");
        }
    } else {
        throw std::runtime_error("VOICE_PROVIDER must be 'realtime' or 'evi'");
    }
    if (enable_real_sms &&
        (!twilio_account_sid || !twilio_auth_token || !twilio_from_number)) {
        throw std::runtime_error(
            "ENABLE_REAL_SMS requires TWILIO_ACCOUNT_SID, TWILIO_AUTH_TOKEN and "
            "TWILIO_FROM_NUMBER");
    }
}

bool Config::provider_configured() const {
    if (provider == "evi") {
        return hume_api_key.has_value();
    }
    return openai_api_key.has_value();
}

}
