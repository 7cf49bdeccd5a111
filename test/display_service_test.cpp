#include <gtest/gtest.h>
#include <time.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <string>

#include "display_service.h"
#include "json_store.h"
#include "test_env.h"

using namespace InkPet;

namespace {

class DisplayServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string root = makeTempDir();
    cfg.dataDir = root + "/data";
    cfg.assetsDir = root + "/assets";
    cfg.flagDir = root + "/flags";
    service = std::make_unique<DisplayService>(cfg, panel);
    service->setWallClock([this] { return wallTime; });
  }

  void start() {
    ASSERT_TRUE(service->setup(0, nullptr));
  }

  bool hasCallFor(const Rect &region) const {
    return std::any_of(panel.calls.begin(), panel.calls.end(),
                       [&](const FakePanel::Call &c) { return !c.full && c.region == region; });
  }

  AppConfig cfg;
  FakePanel panel;
  time_t wallTime = fixedWallTime();
  std::unique_ptr<DisplayService> service;
};

}  // namespace

TEST_F(DisplayServiceTest, SetupShowsHome) {
  start();
  EXPECT_EQ(panel.fullCount(), 1);
  EXPECT_EQ(service->stateMachine().activeIndex(), MenuStateMachine::HOME);
  EXPECT_TRUE(JsonStore::fileExists(cfg.dataDir + "/pet_state.json"));
  EXPECT_TRUE(JsonStore::fileExists(cfg.dataDir + "/settings.json"));
  EXPECT_TRUE(JsonStore::fileExists(cfg.dataDir + "/stats.json"));
}

TEST_F(DisplayServiceTest, SetupFailsWhenPanelCannotStart) {
  panel.beginOk = false;
  EXPECT_FALSE(service->setup(0, nullptr));
}

TEST_F(DisplayServiceTest, SavedRefreshModeApplied) {
  ASSERT_TRUE(JsonStore::ensureDir(cfg.dataDir));
  std::ofstream(cfg.dataDir + "/settings.json") << R"({"refresh_mode": "fast"})";
  start();
  EXPECT_EQ(service->refresh().config().fullRefreshCycleLimit, 20u);
}

TEST_F(DisplayServiceTest, ButtonsNavigateAndAreCounted) {
  start();
  EXPECT_TRUE(service->step(1000, ButtonEvent::ActionPress));
  EXPECT_EQ(service->stateMachine().activeIndex(), 1u);
  EXPECT_TRUE(service->step(1100, ButtonEvent::ActionPress));   // throttled
  EXPECT_EQ(service->stateMachine().activeIndex(), 1u);
  EXPECT_EQ(service->stats().get(StatKey::BUTTON_PRESSES), 1);

  EXPECT_TRUE(service->step(2000, ButtonEvent::ReturnPress));
  EXPECT_EQ(service->stateMachine().activeIndex(), MenuStateMachine::HOME);
  EXPECT_EQ(service->stats().get(StatKey::BUTTON_PRESSES), 2);
}

TEST_F(DisplayServiceTest, FeedFlagReloadsPetAndRedraws) {
  start();
  ASSERT_TRUE(service->step(100, std::nullopt));
  size_t before = panel.calls.size();

  PetState api(cfg.dataDir + "/pet_state.json", "Fluffy", "bunny");
  ASSERT_TRUE(api.load());
  ASSERT_TRUE(api.feed(static_cast<int64_t>(wallTime)));
  { std::ofstream f(cfg.flagDir + "/feed_pet.flag"); }

  // Flags are scanned every 5 s
  ASSERT_TRUE(service->step(5200, std::nullopt));
  EXPECT_FALSE(JsonStore::fileExists(cfg.flagDir + "/feed_pet.flag"));
  EXPECT_EQ(service->pet().totalFeeds(), 1);
  ASSERT_GT(panel.calls.size(), before);
  EXPECT_EQ(panel.last().region, Layout::SCREEN);
}

TEST_F(DisplayServiceTest, MinuteChangeUpdatesClockField) {
  start();
  wallTime += 60;
  ASSERT_TRUE(service->step(2000, std::nullopt));
  EXPECT_TRUE(hasCallFor(Layout::CLOCK));
}

TEST_F(DisplayServiceTest, HomeAnimates) {
  start();
  ASSERT_TRUE(service->step(600, std::nullopt));
  EXPECT_TRUE(hasCallFor(Layout::SPRITE));
}

TEST_F(DisplayServiceTest, PetDecaysOnSchedule) {
  DisplayService::Config sc;
  sc.petUpdateIntervalMs = 1000;
  service->configure(sc);
  wallTime = time(nullptr);
  start();
  int hunger = service->pet().hunger();

  wallTime += 3 * 3600 + 60;
  ASSERT_TRUE(service->step(1000, std::nullopt));
  EXPECT_EQ(service->pet().hunger(), std::min(10, hunger + 3));
}

TEST_F(DisplayServiceTest, PokeRaisesOutboundFlag) {
  start();
  ASSERT_TRUE(service->step(1000, ButtonEvent::GoPress));
  EXPECT_TRUE(JsonStore::fileExists(cfg.flagDir + "/send_poke.flag"));
  EXPECT_EQ(service->pet().messagesSent(), 1);
}

TEST_F(DisplayServiceTest, PersistentPanelFailureEndsLoop) {
  start();
  panel.failAlways(true);
  bool alive = true;
  uint32_t now = 1000;
  for (int i = 0; i < 5 && alive; i++) {
    alive = service->step(now, ButtonEvent::ActionHold);
    now += 1000;
  }
  EXPECT_FALSE(alive);
  EXPECT_TRUE(service->stateMachine().isEscalated());
}

TEST_F(DisplayServiceTest, RunReturnsWhenStopped) {
  start();
  std::atomic<bool> stop{true};
  EXPECT_EQ(service->run(stop), 0);
}

TEST_F(DisplayServiceTest, ShutdownSleepsPanelAndFlushesStats) {
  start();
  ASSERT_TRUE(service->step(1000, ButtonEvent::ActionPress));
  service->shutdown(2000);
  EXPECT_TRUE(panel.asleep);
  EXPECT_TRUE(panel.last().full);

  DeviceStats onDisk(cfg.dataDir + "/stats.json");
  ASSERT_TRUE(onDisk.load());
  EXPECT_EQ(onDisk.get(StatKey::BUTTON_PRESSES), 1);
  EXPECT_GE(onDisk.get(StatKey::DISPLAY_UPDATES), 2);
}
