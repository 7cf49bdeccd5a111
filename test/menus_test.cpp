#include <gtest/gtest.h>

#include <string>

#include "home_menu.h"
#include "messages_menu.h"
#include "settings_menu.h"
#include "stats_menu.h"
#include "test_env.h"

using namespace InkPet;

namespace {

class MenusTest : public ::testing::Test {
protected:
  TestEnv env;
};

}  // namespace

// ---------------------------------------------------------------------------
// Home

TEST_F(MenusTest, HomeRenderDrawsClockAndSprite) {
  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.render(true, 0));
  FrameBuffer &fb = env.refresh.canvas();
  EXPECT_GT(fb.countInk(Layout::CLOCK), 0u);
  EXPECT_GT(fb.countInk(Layout::SPRITE), 0u);
  EXPECT_TRUE(env.panel.last().full);
  EXPECT_EQ(env.stats.get(StatKey::DISPLAY_UPDATES), 1);
}

TEST_F(MenusTest, HomeClockFieldNeedsBaseImage) {
  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.updateClockField(0));
  ASSERT_EQ(env.panel.calls.size(), 1u);
  EXPECT_TRUE(env.panel.last().full);

  env.wallTime += 60;
  ASSERT_TRUE(home.updateClockField(60000));
  ASSERT_EQ(env.panel.calls.size(), 2u);
  EXPECT_FALSE(env.panel.last().full);
  EXPECT_EQ(env.panel.last().region, Layout::CLOCK);
}

TEST_F(MenusTest, HomeDateChangeRedrawsWholeScreen) {
  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.render(true, 0));
  env.wallTime += 24 * 3600;
  ASSERT_TRUE(home.updateClockField(60000));
  EXPECT_EQ(env.panel.last().region, Layout::SCREEN);
}

TEST_F(MenusTest, HomeSpriteFieldIsPartial) {
  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.render(true, 0));
  ASSERT_TRUE(home.updateSpriteField(500));
  EXPECT_FALSE(env.panel.last().full);
  EXPECT_EQ(env.panel.last().region, Layout::SPRITE);
}

TEST_F(MenusTest, HomeRenderSyncsAnimationMood) {
  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.render(true, 0));
  EXPECT_EQ(env.animation.state().mood, Mood::Happy);
  EXPECT_EQ(env.animation.currentFrame(), "happy_0");
}

TEST_F(MenusTest, HomeActivatePokesCompanion) {
  int pokes = 0;
  env.ctx.sendPoke = [&] { pokes++; return true; };
  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.render(true, 0));
  ASSERT_TRUE(home.onActivate(1000));
  EXPECT_EQ(pokes, 1);
  EXPECT_EQ(env.pet.messagesSent(), 1);
  EXPECT_EQ(env.pet.totalInteractions(), 1);
  EXPECT_EQ(env.stats.get(StatKey::MESSAGES_SENT), 1);
  EXPECT_FALSE(env.stats.hasError());
}

TEST_F(MenusTest, HomeFailedPokeRecordsError) {
  env.ctx.sendPoke = [] { return false; };
  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.render(true, 0));
  ASSERT_TRUE(home.onActivate(1000));
  EXPECT_EQ(env.pet.messagesSent(), 0);
  EXPECT_TRUE(env.stats.hasError());
  EXPECT_EQ(env.stats.get(StatKey::NETWORK_ERRORS), 1);
}

TEST_F(MenusTest, HomeRenderFailsWhenPanelFails) {
  HomeMenu home(env.ctx);
  env.panel.failNext(1);
  EXPECT_FALSE(home.render(true, 0));
  EXPECT_EQ(env.stats.get(StatKey::DISPLAY_UPDATES), 0);
}

// ---------------------------------------------------------------------------
// Messages

TEST_F(MenusTest, MessagesTruncation) {
  EXPECT_EQ(MessagesMenu::truncateText("short"), "short");
  EXPECT_EQ(MessagesMenu::truncateText("exactly twenty chars"), "exactly twenty chars");
  EXPECT_EQ(MessagesMenu::truncateText("this one is definitely too long"), "this one is defin...");
}

TEST_F(MenusTest, MessagesEmptyInbox) {
  MessagesMenu menu(env.ctx);
  ASSERT_TRUE(menu.render(true, 0));
  EXPECT_TRUE(menu.onActivate(100));
  EXPECT_EQ(menu.selectedIndex(), 0u);
  EXPECT_EQ(env.panel.calls.size(), 1u);
}

TEST_F(MenusTest, MessagesCursorWrapsOverVisibleRows) {
  for (int i = 0; i < 5; i++) ASSERT_TRUE(env.messages.add("peer", "hello"));
  MessagesMenu menu(env.ctx);
  ASSERT_TRUE(menu.render(true, 0));

  const size_t expected[] = {1, 2, 0, 1};
  uint32_t now = 1000;
  for (size_t want : expected) {
    ASSERT_TRUE(menu.onActivate(now));
    EXPECT_EQ(menu.selectedIndex(), want);
    now += 1000;
  }
  EXPECT_EQ(env.messages.unreadCount(), 0u);
  EXPECT_TRUE(env.panel.last().full);
}

TEST_F(MenusTest, MessagesCursorWithTwoMessages) {
  ASSERT_TRUE(env.messages.add("a", "one"));
  ASSERT_TRUE(env.messages.add("b", "two"));
  MessagesMenu menu(env.ctx);
  ASSERT_TRUE(menu.onActivate(0));
  EXPECT_EQ(menu.selectedIndex(), 1u);
  ASSERT_TRUE(menu.onActivate(1000));
  EXPECT_EQ(menu.selectedIndex(), 0u);
}

// ---------------------------------------------------------------------------
// Stats

TEST_F(MenusTest, StatsActivateFlipsPage) {
  StatsMenu menu(env.ctx);
  ASSERT_TRUE(menu.render(true, 0));
  EXPECT_EQ(menu.page(), 0);
  ASSERT_TRUE(menu.onActivate(1000));
  EXPECT_EQ(menu.page(), 1);
  EXPECT_TRUE(env.panel.last().full);
  ASSERT_TRUE(menu.onActivate(2000));
  EXPECT_EQ(menu.page(), 0);
}

// ---------------------------------------------------------------------------
// Settings

TEST_F(MenusTest, SettingsActivateChangesHighlightedItem) {
  SettingsMenu menu(env.ctx);
  ASSERT_TRUE(menu.render(true, 0));
  ASSERT_EQ(menu.selectedItem(), SettingsMenu::ITEM_TIME_FORMAT);

  ASSERT_TRUE(menu.onActivate(1000));
  EXPECT_EQ(env.settings.timeFormat(), 12);
  EXPECT_EQ(menu.selectedItem(), SettingsMenu::ITEM_BRIGHTNESS);

  ASSERT_TRUE(menu.onActivate(2000));
  EXPECT_EQ(env.settings.brightness(), 4);
  EXPECT_EQ(menu.selectedItem(), SettingsMenu::ITEM_REFRESH_MODE);

  ASSERT_TRUE(menu.onActivate(3000));
  EXPECT_EQ(env.settings.refreshMode(), RefreshMode::Slow);
  EXPECT_EQ(env.refresh.config().fullRefreshCycleLimit, 5u);
  EXPECT_EQ(menu.selectedItem(), SettingsMenu::ITEM_TIME_FORMAT);
}

TEST_F(MenusTest, SettingsSurviveReload) {
  SettingsMenu menu(env.ctx);
  ASSERT_TRUE(menu.onActivate(0));
  UserSettings reread(env.dir + "/settings.json", 24);
  ASSERT_TRUE(reread.load());
  EXPECT_EQ(reread.timeFormat(), 12);
}

TEST_F(MenusTest, HomeShowsSleepingPetInsideSleepWindow) {
  SleepWindow w;
  w.enabled = true;
  w.startMin = 9 * 60;
  w.endMin = 10 * 60;
  ASSERT_TRUE(env.settings.setSleepWindow(w));
  EXPECT_EQ(env.ctx.mood(), Mood::Sleeping);

  HomeMenu home(env.ctx);
  ASSERT_TRUE(home.render(true, 0));
  EXPECT_EQ(env.animation.currentFrame(), "sleeping_0");
}
