#include "refresh_coordinator.h"

#include "logger.h"
DEFINE_MODULE_LOGGER(RefreshLog)

namespace InkPet {

RefreshCoordinator::RefreshCoordinator(Panel &panel)
  : _panel(panel), _fb(DISPLAY_WIDTH, DISPLAY_HEIGHT) {}

bool RefreshCoordinator::begin() {
  if (!_fb.begin()) return false;
  if (!_panel.begin()) {
    RefreshLog::printf("[Refresh] panel '%s' init failed\n", _panel.name());
    return false;
  }
  _state = RefreshState();
  RefreshLog::printf("[Refresh] ready on '%s' (full every %u cycles / %us)\n",
                     _panel.name(), _cfg.fullRefreshCycleLimit,
                     _cfg.fullRefreshTimeLimitMs / 1000);
  return true;
}

bool RefreshCoordinator::fullRefreshDue(uint32_t nowMs) const {
  if (!_state.baseImageEstablished) return true;
  if (_state.cyclesSinceFull >= _cfg.fullRefreshCycleLimit) return true;
  return (nowMs - _state.lastFullMs) >= _cfg.fullRefreshTimeLimitMs;
}

CommitResult RefreshCoordinator::commit(bool requestPartial, uint32_t nowMs) {
  return doCommit(requestPartial, Layout::SCREEN, nowMs);
}

CommitResult RefreshCoordinator::commitRegion(const Rect &region, uint32_t nowMs) {
  return doCommit(true, region, nowMs);
}

CommitResult RefreshCoordinator::doCommit(bool wantPartial, const Rect &region, uint32_t nowMs) {
  CommitResult result;
  bool full = !wantPartial || fullRefreshDue(nowMs);

  if (full) {
    if (wantPartial) {
      RefreshLog::debugf("[Refresh] partial upgraded to full (base=%d cycles=%u age=%ums)\n",
                         _state.baseImageEstablished ? 1 : 0, _state.cyclesSinceFull,
                         nowMs - _state.lastFullMs);
    }
    result.full = true;
    result.ok = _panel.fullRefresh(_fb);
    if (!result.ok) {
      _state.baseImageEstablished = false;
      RefreshLog::println("[Refresh] full commit failed, base image invalidated");
      return result;
    }
    _state.baseImageEstablished = true;
    _state.cyclesSinceFull = 0;
    _state.lastFullMs = nowMs;
    _fullCommits++;
    RefreshLog::debugf("[Refresh] full commit #%u\n", _fullCommits);
    return result;
  }

  result.ok = _panel.partialRefresh(_fb, region);
  if (!result.ok) {
    _state.baseImageEstablished = false;
    RefreshLog::printf("[Refresh] partial commit (%d,%d %dx%d) failed, base image invalidated\n",
                       region.x, region.y, region.w, region.h);
    return result;
  }
  _state.cyclesSinceFull++;
  _partialCommits++;
  return result;
}

CommitResult RefreshCoordinator::updateField(const Rect &rect,
                                             const std::function<void(FrameBuffer&)> &draw,
                                             uint32_t nowMs) {
  if (!_state.baseImageEstablished) {
    CommitResult refused;
    refused.needsFullRender = true;
    return refused;
  }
  _fb.clearRect(rect);
  draw(_fb);
  return commitRegion(rect, nowMs);
}

void RefreshCoordinator::invalidateBaseImage() {
  _state.baseImageEstablished = false;
}

void RefreshCoordinator::setCycleLimit(uint32_t cycles) {
  _cfg.fullRefreshCycleLimit = cycles > 0 ? cycles : 1;
}

void RefreshCoordinator::applyRefreshMode(RefreshMode mode) {
  switch (mode) {
    case RefreshMode::Fast:     setCycleLimit(20); break;
    case RefreshMode::Balanced: setCycleLimit(10); break;
    case RefreshMode::Slow:     setCycleLimit(5);  break;
  }
  RefreshLog::printf("[Refresh] mode %s -> full every %u cycles\n",
                     refreshModeName(mode), _cfg.fullRefreshCycleLimit);
}

bool RefreshCoordinator::sleep() {
  _state.baseImageEstablished = false;
  return _panel.sleep();
}

}  // namespace InkPet
