#pragma once

#include <functional>

namespace voice_bridge {
namespace utils {

using TaskRunner = std::function<void(std::function<void()>)>;

void run_async(std::function<void()> task);

}
}
