#include "voice_bridge/utils/async.hpp"

#include <exception>
#include <thread>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::utils {

void run_async(std::function<void()> task) {
    std::thread worker([task = std::move(task)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Async task failed", {kv("error", ex.what())});
        } catch (...) {
            logging::error("Async task failed with a non-standard exception");
        }
    });
    worker.detach();
}

}
