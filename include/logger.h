#pragma once

#include <stdarg.h>
#include <stdint.h>

namespace Logger {

void begin(bool debug = false);
bool debugEnabled();
void print(const char* msg);
void println(const char* msg);
void vprintf(const char* fmt, va_list args);
void printf(const char* fmt, ...);

}  // namespace Logger

// Module logger guide:
// - MainLog: startup, config, shutdown (src/main.cpp)
// - ServiceLog: polling loop, ticks, peer signals (src/display_service.cpp)
// - RefreshLog: full/partial commits, ghost suppression (src/refresh_coordinator.cpp)
// - PanelLog: SSD1680 / mock panel I/O (src/epd_panel.cpp, src/mock_panel.cpp)
// - NavLog: menu transitions, throttle, failure recovery (src/menu_state_machine.cpp)
// - MenuLog: per-menu actions (src/*_menu.cpp)
// - ButtonLog: GPIO / console button events (src/button_source.cpp)
// - GpioLog: GPIO chardev line requests (src/gpio_line.cpp)
// - AnimLog: mood/frame changes, sprite loading (src/animation_scheduler.cpp)
// - StoreLog: JSON persistence (src/json_store.cpp and providers)
// debugf() is silent unless Logger::begin(true) (DEBUG_MODE=true).
#define DEFINE_MODULE_LOGGER(Name)                      \
  namespace Name {                                      \
    inline void print(const char* msg) {                \
      Logger::print(msg);                               \
    }                                                   \
    inline void println(const char* msg) {              \
      Logger::println(msg);                             \
    }                                                   \
    inline void printf(const char* fmt, ...) {          \
      va_list args;                                     \
      va_start(args, fmt);                              \
      Logger::vprintf(fmt, args);                       \
      va_end(args);                                     \
    }                                                   \
    inline void debugf(const char* fmt, ...) {          \
      if (!Logger::debugEnabled()) return;              \
      va_list args;                                     \
      va_start(args, fmt);                              \
      Logger::vprintf(fmt, args);                       \
      va_end(args);                                     \
    }                                                   \
  }
