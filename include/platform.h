#pragma once
#include <stdint.h>

// Arduino-style timing on Linux. millis() is monotonic from first call.
namespace Platform {
  uint32_t millis();
  void delay(uint32_t ms);
}
