#include "platform.h"

#include <chrono>
#include <thread>

namespace {
const std::chrono::steady_clock::time_point bootTime = std::chrono::steady_clock::now();
}

namespace Platform {

uint32_t millis() {
  auto elapsed = std::chrono::steady_clock::now() - bootTime;
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void delay(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace Platform
