#pragma once
#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "animation_scheduler.h"
#include "button_queue.h"
#include "menu.h"
#include "refresh_coordinator.h"

namespace InkPet {

enum class NavEvent : uint8_t {
  Back,
  Next,
  Activate
};

enum class TransitionResult : uint8_t {
  Applied,
  Skipped,     // nothing to do, or a periodic call found the guard busy
  Dropped,     // rejected: a render or transition is in progress
  Throttled,   // button arrived inside the throttle window
  Failed,      // render failed and was counted
  Recovered,   // failure threshold hit, returned to Home and re-rendered
  Fatal        // recovery impossible; the process should exit
};

const char* transitionResultName(TransitionResult r);

struct NavigationState {
  size_t   activeMenuIndex = 0;
  bool     needsRender = true;
  bool     inTransition = false;
  bool     rendering = false;
  uint32_t renderFailureCount = 0;
  uint32_t lastButtonMs = 0;
};

// Owns the menus and serializes every render behind one guard.
// Transitions block on the guard; periodic work only try-locks and skips.
class MenuStateMachine {
public:
  static constexpr size_t HOME = 0;

  struct Config {
    uint32_t throttleMs       = 300;
    uint32_t failureThreshold = 3;
  };

  MenuStateMachine(RefreshCoordinator &refresh, AnimationScheduler &animation,
                   std::function<Mood()> moodSource,
                   std::vector<std::unique_ptr<Menu>> menus);

  void configure(const Config &cfg) { _cfg = cfg; }

  // First full render of Home. False if the panel could not show it.
  bool setup(uint32_t nowMs);

  // Button entry point: throttle, then map to a navigation event.
  TransitionResult handleButton(ButtonEvent ev, uint32_t nowMs);
  TransitionResult dispatch(NavEvent ev, uint32_t nowMs);
  // Redraws the active menu in full (manual ghost clear).
  TransitionResult forceFullRedraw(uint32_t nowMs);

  // Renders only if requested. Non-blocking.
  TransitionResult renderCurrent(uint32_t nowMs);
  void requestRender(bool full = false);
  // Minute tick: clock field on Home, partial redraw elsewhere. Non-blocking.
  TransitionResult updateClock(uint32_t nowMs);
  // 0.5 s tick, Home only. Non-blocking.
  TransitionResult animationTick(uint32_t nowMs);
  // Queues a full redraw when the base image is gone or too old.
  void checkRefreshDue(uint32_t nowMs);

  size_t activeIndex() const { return _activeIndex; }
  Menu& menu(size_t index) { return *_menus[index]; }
  Menu& activeMenu() { return *_menus[_activeIndex]; }
  NavigationState navigation() const;
  bool isEscalated() const { return _escalated; }

private:
  bool busy() const { return _rendering || _inTransition; }
  // Runs a draw with the rendering flag up; a throw counts as a failed render.
  bool runRender(const std::function<bool()> &draw);
  bool renderActive(bool full, uint32_t nowMs);
  TransitionResult renderChecked(bool full, uint32_t nowMs);
  TransitionResult actionChecked(const std::function<bool()> &action, uint32_t nowMs);
  TransitionResult switchTo(size_t index, uint32_t nowMs);
  TransitionResult onRenderFailure(uint32_t nowMs);
  void onRenderSuccess();

  RefreshCoordinator &_refresh;
  AnimationScheduler &_animation;
  std::function<Mood()> _moodSource;
  std::vector<std::unique_ptr<Menu>> _menus;
  Config _cfg;

  std::mutex _guard;
  std::atomic<bool> _rendering{false};
  std::atomic<bool> _inTransition{false};
  std::atomic<size_t> _activeIndex{HOME};
  std::atomic<bool> _escalated{false};

  std::atomic<bool> _needsRender{true};
  std::atomic<bool> _needsFull{true};
  std::atomic<uint32_t> _renderFailureCount{0};
  std::atomic<uint32_t> _lastButtonMs{0};
  bool _anyButton = false;
};

}  // namespace InkPet
