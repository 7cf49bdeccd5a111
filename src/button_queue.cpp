#include "button_queue.h"

#include <chrono>

#include "logger.h"
DEFINE_MODULE_LOGGER(ButtonLog)

namespace InkPet {

const char* buttonEventName(ButtonEvent ev) {
  switch (ev) {
    case ButtonEvent::ReturnPress: return "RETURN";
    case ButtonEvent::ActionPress: return "ACTION";
    case ButtonEvent::ActionHold:  return "ACTION_HOLD";
    case ButtonEvent::GoPress:     return "GO";
  }
  return "?";
}

bool ButtonQueue::tryPush(ButtonEvent ev) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_slot) {
      _dropped++;
      ButtonLog::debugf("[Buttons] %s dropped, %s still pending\n",
                        buttonEventName(ev), buttonEventName(*_slot));
      return false;
    }
    _slot = ev;
  }
  _cv.notify_one();
  return true;
}

std::optional<ButtonEvent> ButtonQueue::pop(uint32_t timeoutMs) {
  std::unique_lock<std::mutex> lock(_mutex);
  if (!_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return _slot.has_value(); })) {
    return std::nullopt;
  }
  std::optional<ButtonEvent> ev = _slot;
  _slot.reset();
  return ev;
}

bool ButtonQueue::hasEvent() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _slot.has_value();
}

uint32_t ButtonQueue::droppedCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _dropped;
}

}  // namespace InkPet
