#pragma once
#include <stdint.h>
#include <time.h>
#include <functional>

#include "animation_scheduler.h"
#include "app_config.h"
#include "device_stats.h"
#include "message_log.h"
#include "pet_state.h"
#include "refresh_coordinator.h"
#include "sprite_library.h"
#include "user_settings.h"

namespace InkPet {

// Everything a menu may touch, handed over explicitly.
struct MenuContext {
  RefreshCoordinator &refresh;
  AnimationScheduler &animation;
  SpriteLibrary      &sprites;
  PetState           &pet;
  MessageLog         &messages;
  UserSettings       &settings;
  DeviceStats        &stats;
  const AppConfig    &config;

  // Wall clock for the displayed time; replaceable in tests.
  std::function<time_t()> wallTime = [] { return time(nullptr); };
  // Forwards a poke to the companion device; empty when unavailable.
  std::function<bool()> sendPoke;

  struct tm localTime() const;
  // Pet mood including the sleep window.
  Mood mood() const;
};

}  // namespace InkPet
