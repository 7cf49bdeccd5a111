#include "menu_state_machine.h"

#include <exception>
#include <utility>

#include "logger.h"
DEFINE_MODULE_LOGGER(NavLog)

namespace {

// Raises a busy flag for the lifetime of the scope.
class ScopedFlag {
public:
  explicit ScopedFlag(std::atomic<bool> &flag) : _flag(flag) { _flag = true; }
  ~ScopedFlag() { _flag = false; }
  ScopedFlag(const ScopedFlag&) = delete;
  ScopedFlag& operator=(const ScopedFlag&) = delete;

private:
  std::atomic<bool> &_flag;
};

}  // namespace

namespace InkPet {

const char* transitionResultName(TransitionResult r) {
  switch (r) {
    case TransitionResult::Applied:   return "applied";
    case TransitionResult::Skipped:   return "skipped";
    case TransitionResult::Dropped:   return "dropped";
    case TransitionResult::Throttled: return "throttled";
    case TransitionResult::Failed:    return "failed";
    case TransitionResult::Recovered: return "recovered";
    case TransitionResult::Fatal:     return "fatal";
  }
  return "?";
}

MenuStateMachine::MenuStateMachine(RefreshCoordinator &refresh, AnimationScheduler &animation,
                                   std::function<Mood()> moodSource,
                                   std::vector<std::unique_ptr<Menu>> menus)
  : _refresh(refresh),
    _animation(animation),
    _moodSource(std::move(moodSource)),
    _menus(std::move(menus)) {}

NavigationState MenuStateMachine::navigation() const {
  NavigationState s;
  s.activeMenuIndex = _activeIndex;
  s.needsRender = _needsRender;
  s.inTransition = _inTransition;
  s.rendering = _rendering;
  s.renderFailureCount = _renderFailureCount;
  s.lastButtonMs = _lastButtonMs;
  return s;
}

bool MenuStateMachine::setup(uint32_t nowMs) {
  if (_menus.empty()) {
    NavLog::println("[Nav] setup() with no menus");
    return false;
  }
  std::lock_guard<std::mutex> lock(_guard);
  _activeIndex = HOME;
  _refresh.invalidateBaseImage();
  if (!renderActive(true, nowMs)) {
    NavLog::println("[Nav] initial render of Home failed");
    return false;
  }
  onRenderSuccess();
  NavLog::printf("[Nav] ready, %u menus\n", static_cast<unsigned>(_menus.size()));
  return true;
}

bool MenuStateMachine::runRender(const std::function<bool()> &draw) {
  ScopedFlag rendering(_rendering);
  try {
    return draw();
  } catch (const std::exception &e) {
    NavLog::printf("[Nav] render of %s threw: %s\n", _menus[_activeIndex]->name(), e.what());
    return false;
  }
}

bool MenuStateMachine::renderActive(bool full, uint32_t nowMs) {
  Menu &m = *_menus[_activeIndex];
  return runRender([&] { return m.render(full, nowMs); });
}

void MenuStateMachine::onRenderSuccess() {
  _renderFailureCount = 0;
  _needsRender = false;
  _needsFull = false;
}

TransitionResult MenuStateMachine::onRenderFailure(uint32_t nowMs) {
  uint32_t failures = ++_renderFailureCount;
  _needsRender = true;
  _needsFull = true;
  NavLog::printf("[Nav] render of %s failed (%u/%u)\n",
                 _menus[_activeIndex]->name(), failures, _cfg.failureThreshold);
  if (failures < _cfg.failureThreshold) return TransitionResult::Failed;

  if (_activeIndex != HOME) {
    NavLog::println("[Nav] failure threshold reached, forcing Home");
    _activeIndex = HOME;
    _renderFailureCount = 0;
    _refresh.invalidateBaseImage();
    if (renderActive(true, nowMs)) {
      onRenderSuccess();
      return TransitionResult::Recovered;
    }
    NavLog::println("[Nav] recovery render of Home failed");
  }
  _escalated = true;
  NavLog::println("[Nav] FATAL: display cannot be recovered");
  return TransitionResult::Fatal;
}

TransitionResult MenuStateMachine::renderChecked(bool full, uint32_t nowMs) {
  if (renderActive(full, nowMs)) {
    onRenderSuccess();
    return TransitionResult::Applied;
  }
  return onRenderFailure(nowMs);
}

TransitionResult MenuStateMachine::actionChecked(const std::function<bool()> &action,
                                                 uint32_t nowMs) {
  if (runRender(action)) {
    onRenderSuccess();
    return TransitionResult::Applied;
  }
  return onRenderFailure(nowMs);
}

TransitionResult MenuStateMachine::switchTo(size_t index, uint32_t nowMs) {
  NavLog::printf("[Nav] %s -> %s\n", _menus[_activeIndex]->name(), _menus[index]->name());
  _activeIndex = index;
  _refresh.invalidateBaseImage();
  return renderChecked(true, nowMs);
}

TransitionResult MenuStateMachine::handleButton(ButtonEvent ev, uint32_t nowMs) {
  if (_escalated) return TransitionResult::Fatal;
  if (busy()) {
    NavLog::debugf("[Nav] %s dropped (busy)\n", buttonEventName(ev));
    return TransitionResult::Dropped;
  }
  if (_anyButton && nowMs - _lastButtonMs < _cfg.throttleMs) {
    NavLog::debugf("[Nav] %s throttled (%ums since last)\n",
                   buttonEventName(ev), nowMs - _lastButtonMs);
    return TransitionResult::Throttled;
  }
  _anyButton = true;
  _lastButtonMs = nowMs;

  switch (ev) {
    case ButtonEvent::ReturnPress: return dispatch(NavEvent::Back, nowMs);
    case ButtonEvent::ActionPress: return dispatch(NavEvent::Next, nowMs);
    case ButtonEvent::GoPress:     return dispatch(NavEvent::Activate, nowMs);
    case ButtonEvent::ActionHold:  return forceFullRedraw(nowMs);
  }
  return TransitionResult::Skipped;
}

TransitionResult MenuStateMachine::dispatch(NavEvent ev, uint32_t nowMs) {
  if (_escalated) return TransitionResult::Fatal;
  if (busy()) {
    NavLog::debugf("[Nav] reentrant dispatch rejected\n");
    return TransitionResult::Dropped;
  }

  std::lock_guard<std::mutex> lock(_guard);
  ScopedFlag transition(_inTransition);
  TransitionResult result = TransitionResult::Skipped;
  switch (ev) {
    case NavEvent::Next:
      result = switchTo((_activeIndex + 1) % _menus.size(), nowMs);
      break;
    case NavEvent::Back:
      if (_activeIndex == HOME) {
        result = actionChecked([&] { return _menus[HOME]->onBack(nowMs); }, nowMs);
      } else {
        result = switchTo(HOME, nowMs);
      }
      break;
    case NavEvent::Activate: {
      Menu &m = *_menus[_activeIndex];
      result = actionChecked([&] { return m.onActivate(nowMs); }, nowMs);
      break;
    }
  }
  return result;
}

TransitionResult MenuStateMachine::forceFullRedraw(uint32_t nowMs) {
  if (_escalated) return TransitionResult::Fatal;
  if (busy()) return TransitionResult::Dropped;

  std::lock_guard<std::mutex> lock(_guard);
  ScopedFlag transition(_inTransition);
  NavLog::printf("[Nav] manual full refresh of %s\n", _menus[_activeIndex]->name());
  _refresh.invalidateBaseImage();
  return renderChecked(true, nowMs);
}

void MenuStateMachine::requestRender(bool full) {
  if (full) _needsFull = true;
  _needsRender = true;
}

TransitionResult MenuStateMachine::renderCurrent(uint32_t nowMs) {
  if (_escalated) return TransitionResult::Fatal;
  if (!_needsRender || busy()) return TransitionResult::Skipped;

  std::unique_lock<std::mutex> lock(_guard, std::try_to_lock);
  if (!lock.owns_lock() || !_needsRender) return TransitionResult::Skipped;
  return renderChecked(_needsFull, nowMs);
}

TransitionResult MenuStateMachine::updateClock(uint32_t nowMs) {
  if (_escalated) return TransitionResult::Fatal;
  if (busy()) return TransitionResult::Skipped;

  std::unique_lock<std::mutex> lock(_guard, std::try_to_lock);
  if (!lock.owns_lock()) return TransitionResult::Skipped;
  if (_needsRender) return renderChecked(_needsFull, nowMs);

  Menu &m = *_menus[_activeIndex];
  if (!runRender([&] { return m.updateClockField(nowMs); })) {
    NavLog::println("[Nav] clock update failed, full redraw queued");
    requestRender(true);
    return TransitionResult::Skipped;
  }
  return TransitionResult::Applied;
}

TransitionResult MenuStateMachine::animationTick(uint32_t nowMs) {
  if (_escalated || _activeIndex != HOME || busy()) return TransitionResult::Skipped;
  if (!_animation.tickDue(nowMs)) return TransitionResult::Skipped;

  std::unique_lock<std::mutex> lock(_guard, std::try_to_lock);
  if (!lock.owns_lock() || _needsRender || _activeIndex != HOME) return TransitionResult::Skipped;

  if (!_animation.tick(nowMs, _moodSource())) return TransitionResult::Skipped;

  Menu &home = *_menus[HOME];
  if (!runRender([&] { return home.updateSpriteField(nowMs); })) {
    NavLog::debugf("[Nav] sprite update failed, full redraw queued\n");
    requestRender(true);
    return TransitionResult::Skipped;
  }
  return TransitionResult::Applied;
}

void MenuStateMachine::checkRefreshDue(uint32_t nowMs) {
  if (_escalated || _needsRender || busy()) return;
  std::unique_lock<std::mutex> lock(_guard, std::try_to_lock);
  if (!lock.owns_lock()) return;
  const RefreshState &st = _refresh.state();
  if (!st.baseImageEstablished ||
      nowMs - st.lastFullMs >= _refresh.config().fullRefreshTimeLimitMs) {
    NavLog::debugf("[Nav] periodic full refresh due\n");
    requestRender(true);
  }
}

}  // namespace InkPet
