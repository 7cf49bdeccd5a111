#pragma once
#include <stdint.h>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace InkPet {

enum class ButtonEvent : uint8_t {
  ReturnPress,
  ActionPress,
  ActionHold,   // Action held past the long-press time (fires once)
  GoPress
};

const char* buttonEventName(ButtonEvent ev);

// Capacity-1 handoff from the button thread to the polling loop.
// tryPush never blocks and drops the event while the slot is occupied.
class ButtonQueue {
public:
  bool tryPush(ButtonEvent ev);
  std::optional<ButtonEvent> pop(uint32_t timeoutMs);
  bool hasEvent() const;
  uint32_t droppedCount() const;

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::optional<ButtonEvent> _slot;
  uint32_t _dropped = 0;
};

}  // namespace InkPet
