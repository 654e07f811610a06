#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <string>

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        voice_bridge::info(
            "Starting voice-bridge",
            {voice_bridge::kv("provider", config.provider),
             voice_bridge::kv("env", config.environment_name),
             voice_bridge::kv("port", config.port),
             voice_bridge::kv("status_port", config.status_port),
             voice_bridge::kv("max_streams", config.max_concurrent_streams),
             voice_bridge::kv("real_sms", config.enable_real_sms)});
        voice_bridge::BridgeApp app(config);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
