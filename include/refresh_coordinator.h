#pragma once
#include <stdint.h>
#include <functional>

#include "frame_buffer.h"
#include "panel.h"
#include "user_settings.h"

namespace InkPet {

struct RefreshState {
  bool     baseImageEstablished = false;
  uint32_t cyclesSinceFull = 0;   // partial commits since the last full one
  uint32_t lastFullMs = 0;
};

struct CommitResult {
  bool ok = false;
  bool full = false;              // a full refresh was actually performed
  bool needsFullRender = false;   // updateField refused: no base image
};

// Owns the framebuffer and decides full vs partial for every commit.
// Not thread-safe; callers serialize through MenuStateMachine.
class RefreshCoordinator {
public:
  struct Config {
    uint32_t fullRefreshCycleLimit  = 10;
    uint32_t fullRefreshTimeLimitMs = 5UL * 60UL * 1000UL;
  };

  explicit RefreshCoordinator(Panel &panel);

  void configure(const Config &cfg) { _cfg = cfg; }
  const Config& config() const { return _cfg; }

  // Allocates the framebuffer and initializes the panel.
  bool begin();

  FrameBuffer& canvas() { return _fb; }
  const RefreshState& state() const { return _state; }

  // Whole-screen commit. requestPartial is a hint: it is upgraded to full
  // when there is no base image or a full refresh is due.
  CommitResult commit(bool requestPartial, uint32_t nowMs);
  // Partial commit limited to region (same upgrade rules).
  CommitResult commitRegion(const Rect &region, uint32_t nowMs);
  // Clears rect, lets draw paint it, then commits just that region.
  // Refuses (needsFullRender) while no base image exists.
  CommitResult updateField(const Rect &rect, const std::function<void(FrameBuffer&)> &draw,
                           uint32_t nowMs);

  void invalidateBaseImage();
  bool fullRefreshDue(uint32_t nowMs) const;
  // Refresh-mode cycle limits: fast 20, balanced 10, slow 5.
  void applyRefreshMode(RefreshMode mode);
  void setCycleLimit(uint32_t cycles);

  bool sleep();

  uint32_t fullCommits() const { return _fullCommits; }
  uint32_t partialCommits() const { return _partialCommits; }

private:
  CommitResult doCommit(bool wantPartial, const Rect &region, uint32_t nowMs);

  Panel &_panel;
  Config _cfg;
  FrameBuffer _fb;
  RefreshState _state;
  uint32_t _fullCommits = 0;
  uint32_t _partialCommits = 0;
};

}  // namespace InkPet
