#pragma once
#include <stdint.h>
#include <atomic>
#include <thread>

#include "button_queue.h"
#include "gpio_line.h"
#include "panel_pins.h"

namespace InkPet {

enum class ButtonId : uint8_t {
  Return = 0,
  Action,
  Go,
  COUNT
};

// Turns raw press/release edges into ButtonEvents.
// Return and Go fire on press. Action fires on release, unless it was held
// past the long-press time, in which case ActionHold fired once while held.
class ButtonTracker {
public:
  struct Config {
    uint32_t debounceMs  = 200;
    uint32_t longPressMs = 2000;
  };

  explicit ButtonTracker(ButtonQueue &queue) : _queue(queue) {}

  void configure(const Config &cfg) { _cfg = cfg; }

  void onEdge(ButtonId id, bool pressed, uint32_t nowMs);
  // Long-press detection; call at least every 100 ms.
  void poll(uint32_t nowMs);

private:
  struct LineState {
    bool     down = false;
    bool     accepted = false;   // current press passed debounce
    bool     holdFired = false;
    bool     everPressed = false;
    uint32_t pressMs = 0;
  };

  void emit(ButtonEvent ev);

  ButtonQueue &_queue;
  Config _cfg;
  LineState _lines[static_cast<int>(ButtonId::COUNT)];
};

class ButtonSource {
public:
  virtual ~ButtonSource() = default;
  virtual bool begin() = 0;
  virtual void stop() = 0;
  virtual const char* name() const = 0;
};

// Three buttons to GND on GPIO chardev lines, read on a background thread.
class GpioButtons : public ButtonSource {
public:
  struct Config {
    const char* gpioChip = GPIO_CHIP_PATH;
    int pinReturn = PIN_BTN_RETURN;
    int pinAction = PIN_BTN_ACTION;
    int pinGo     = PIN_BTN_GO;
    ButtonTracker::Config tracker;
  };

  GpioButtons(ButtonQueue &queue, const Config &cfg);
  ~GpioButtons() override;

  bool begin() override;
  void stop() override;
  const char* name() const override { return "gpio"; }

private:
  void run();

  Config _cfg;
  ButtonTracker _tracker;
  GpioLine _lines[static_cast<int>(ButtonId::COUNT)];
  std::atomic<bool> _running{false};
  std::thread _thread;
};

// Mock mode: r / a / g / h + Enter on stdin.
class ConsoleButtons : public ButtonSource {
public:
  explicit ConsoleButtons(ButtonQueue &queue) : _queue(queue) {}
  ~ConsoleButtons() override;

  bool begin() override;
  void stop() override;
  const char* name() const override { return "console"; }

private:
  void run();

  ButtonQueue &_queue;
  std::atomic<bool> _running{false};
  std::thread _thread;
};

}  // namespace InkPet
