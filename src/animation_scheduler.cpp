#include "animation_scheduler.h"

#include <stdio.h>

#include "logger.h"
DEFINE_MODULE_LOGGER(AnimLog)

namespace {

struct MoodFrames {
  const char* prefix;
  size_t count;
};

// Indexed by Mood
const MoodFrames MOOD_FRAMES[] = {
  {"happy",    5},
  {"neutral",  8},
  {"sad",      6},
  {"excited",  6},   // hungry
  {"sick",     4},
  {"sleeping", 4},
  {"dead",     1},
};

static_assert(sizeof(MOOD_FRAMES) / sizeof(MOOD_FRAMES[0]) ==
              static_cast<size_t>(InkPet::Mood::COUNT), "one entry per mood");

const MoodFrames& entryFor(InkPet::Mood mood) {
  size_t i = static_cast<size_t>(mood);
  if (i >= static_cast<size_t>(InkPet::Mood::COUNT)) i = static_cast<size_t>(InkPet::Mood::Neutral);
  return MOOD_FRAMES[i];
}

}  // namespace

namespace InkPet {

AnimationScheduler::AnimationScheduler() {
  setMood(Mood::Neutral);
}

const char* AnimationScheduler::spritePrefix(Mood mood) {
  return entryFor(mood).prefix;
}

size_t AnimationScheduler::frameCount(Mood mood) {
  return entryFor(mood).count;
}

std::vector<std::string> AnimationScheduler::framesFor(Mood mood) {
  const MoodFrames &e = entryFor(mood);
  std::vector<std::string> frames;
  frames.reserve(e.count);
  char id[32];
  for (size_t i = 0; i < e.count; i++) {
    snprintf(id, sizeof(id), "%s_%zu", e.prefix, i);
    frames.emplace_back(id);
  }
  return frames;
}

void AnimationScheduler::setMood(Mood mood) {
  _state.mood = mood;
  _state.frames = framesFor(mood);
  _state.frameIndex = 0;
}

bool AnimationScheduler::tickDue(uint32_t nowMs) const {
  return (nowMs - _state.lastTickMs) >= _cfg.tickIntervalMs;
}

bool AnimationScheduler::tick(uint32_t nowMs, Mood mood) {
  _state.lastTickMs = nowMs;
  if (mood != _state.mood) {
    AnimLog::printf("[Anim] mood %s -> %s, frame reset\n", moodName(_state.mood), moodName(mood));
    setMood(mood);
    return true;
  }
  if (_state.frames.size() <= 1) return false;
  _state.frameIndex = (_state.frameIndex + 1) % _state.frames.size();
  return true;
}

void AnimationScheduler::sync(Mood mood, uint32_t nowMs) {
  if (mood != _state.mood) setMood(mood);
  _state.lastTickMs = nowMs;
}

const std::string& AnimationScheduler::currentFrame() const {
  return _state.frames[_state.frameIndex];
}

}  // namespace InkPet
