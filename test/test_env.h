#pragma once
#include <stdlib.h>
#include <time.h>

#include <gtest/gtest.h>

#include <string>

#include "animation_scheduler.h"
#include "app_config.h"
#include "device_stats.h"
#include "fake_panel.h"
#include "menu_context.h"
#include "message_log.h"
#include "pet_state.h"
#include "refresh_coordinator.h"
#include "sprite_library.h"
#include "user_settings.h"

// Fresh temporary directory per test.
inline std::string makeTempDir() {
  std::string tmpl = ::testing::TempDir() + "inkpet_XXXXXX";
  char* dir = mkdtemp(&tmpl[0]);
  EXPECT_NE(dir, nullptr);
  return tmpl;
}

// 2026-03-14 09:30:00 local time
inline time_t fixedWallTime() {
  struct tm t = {};
  t.tm_year = 2026 - 1900;
  t.tm_mon = 2;
  t.tm_mday = 14;
  t.tm_hour = 9;
  t.tm_min = 30;
  t.tm_isdst = -1;
  return mktime(&t);
}

// Providers on disk, a fake panel and a ready RefreshCoordinator.
struct TestEnv {
  TestEnv()
    : dir(makeTempDir()),
      pet(dir + "/pet_state.json", "Fluffy", "bunny"),
      messages(dir + "/messages.jsonl"),
      settings(dir + "/settings.json", 24),
      stats(dir + "/stats.json"),
      refresh(panel),
      sprites(dir + "/sprites"),
      ctx{refresh, animation, sprites, pet, messages, settings, stats, config} {
    config.dataDir = dir;
    config.deviceName = "test_clock";
    ctx.wallTime = [this] { return wallTime; };
    EXPECT_TRUE(pet.load());
    EXPECT_TRUE(settings.load());
    EXPECT_TRUE(stats.load());
    EXPECT_TRUE(refresh.begin());
  }

  std::string dir;
  time_t wallTime = fixedWallTime();
  InkPet::AppConfig config;
  FakePanel panel;
  InkPet::PetState pet;
  InkPet::MessageLog messages;
  InkPet::UserSettings settings;
  InkPet::DeviceStats stats;
  InkPet::RefreshCoordinator refresh;
  InkPet::AnimationScheduler animation;
  InkPet::SpriteLibrary sprites;
  InkPet::MenuContext ctx;
};
