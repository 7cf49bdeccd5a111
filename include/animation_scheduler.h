#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "pet_state.h"

namespace InkPet {

struct AnimationState {
  Mood mood = Mood::Neutral;
  std::vector<std::string> frames;   // sprite ids, e.g. "neutral_3"
  size_t frameIndex = 0;
  uint32_t lastTickMs = 0;
};

// Mood-indexed frame counter. Only advances; drawing is the Home menu's job.
class AnimationScheduler {
public:
  struct Config {
    uint32_t tickIntervalMs = 500;
  };

  AnimationScheduler();

  void configure(const Config &cfg) { _cfg = cfg; }

  // Sprite prefix and frame count for a mood (hungry uses the "excited" set).
  static const char* spritePrefix(Mood mood);
  static size_t frameCount(Mood mood);
  static std::vector<std::string> framesFor(Mood mood);

  bool tickDue(uint32_t nowMs) const;
  // A mood change swaps the sequence and resets to frame 0 without advancing;
  // otherwise the index moves one step, wrapping. True when the frame changed.
  bool tick(uint32_t nowMs, Mood mood);
  // Sets the mood without a tick (used when Home renders in full).
  void sync(Mood mood, uint32_t nowMs);

  const AnimationState& state() const { return _state; }
  const std::string& currentFrame() const;

private:
  void setMood(Mood mood);

  Config _cfg;
  AnimationState _state;
};

}  // namespace InkPet
