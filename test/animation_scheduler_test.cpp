#include <gtest/gtest.h>

#include "animation_scheduler.h"

using namespace InkPet;

TEST(AnimationScheduler, FrameTables) {
  EXPECT_EQ(AnimationScheduler::frameCount(Mood::Happy), 5u);
  EXPECT_EQ(AnimationScheduler::frameCount(Mood::Neutral), 8u);
  EXPECT_EQ(AnimationScheduler::frameCount(Mood::Sad), 6u);
  EXPECT_EQ(AnimationScheduler::frameCount(Mood::Hungry), 6u);
  EXPECT_EQ(AnimationScheduler::frameCount(Mood::Sick), 4u);
  EXPECT_EQ(AnimationScheduler::frameCount(Mood::Sleeping), 4u);
  EXPECT_EQ(AnimationScheduler::frameCount(Mood::Dead), 1u);
  EXPECT_STREQ(AnimationScheduler::spritePrefix(Mood::Hungry), "excited");

  std::vector<std::string> frames = AnimationScheduler::framesFor(Mood::Sick);
  ASSERT_EQ(frames.size(), 4u);
  EXPECT_EQ(frames.front(), "sick_0");
  EXPECT_EQ(frames.back(), "sick_3");
}

TEST(AnimationScheduler, StartsAtNeutralFrameZero) {
  AnimationScheduler anim;
  EXPECT_EQ(anim.state().mood, Mood::Neutral);
  EXPECT_EQ(anim.state().frameIndex, 0u);
  EXPECT_EQ(anim.currentFrame(), "neutral_0");
}

TEST(AnimationScheduler, AdvancesAndWraps) {
  AnimationScheduler anim;
  uint32_t now = 0;
  for (size_t i = 1; i < 8; i++) {
    now += 500;
    EXPECT_TRUE(anim.tick(now, Mood::Neutral));
    EXPECT_EQ(anim.state().frameIndex, i);
  }
  now += 500;
  EXPECT_TRUE(anim.tick(now, Mood::Neutral));
  EXPECT_EQ(anim.state().frameIndex, 0u);
}

TEST(AnimationScheduler, MoodChangeResetsSequence) {
  AnimationScheduler anim;
  uint32_t now = 0;
  for (int i = 0; i < 6; i++) {
    now += 500;
    anim.tick(now, Mood::Neutral);
  }
  ASSERT_EQ(anim.state().frameIndex, 6u);

  EXPECT_TRUE(anim.tick(now + 500, Mood::Happy));
  EXPECT_EQ(anim.state().mood, Mood::Happy);
  EXPECT_EQ(anim.state().frameIndex, 0u);
  EXPECT_EQ(anim.state().frames.size(), 5u);
  EXPECT_EQ(anim.currentFrame(), "happy_0");
}

TEST(AnimationScheduler, SingleFrameMoodNeverChanges) {
  AnimationScheduler anim;
  EXPECT_TRUE(anim.tick(500, Mood::Dead));
  EXPECT_FALSE(anim.tick(1000, Mood::Dead));
  EXPECT_FALSE(anim.tick(1500, Mood::Dead));
  EXPECT_EQ(anim.currentFrame(), "dead_0");
}

TEST(AnimationScheduler, TickInterval) {
  AnimationScheduler anim;
  anim.sync(Mood::Neutral, 1000);
  EXPECT_FALSE(anim.tickDue(1499));
  EXPECT_TRUE(anim.tickDue(1500));

  AnimationScheduler::Config cfg;
  cfg.tickIntervalMs = 200;
  anim.configure(cfg);
  EXPECT_TRUE(anim.tickDue(1200));
}

TEST(AnimationScheduler, SyncKeepsIndexForSameMood) {
  AnimationScheduler anim;
  anim.tick(500, Mood::Neutral);
  anim.tick(1000, Mood::Neutral);
  anim.sync(Mood::Neutral, 1200);
  EXPECT_EQ(anim.state().frameIndex, 2u);
  anim.sync(Mood::Sad, 1300);
  EXPECT_EQ(anim.state().frameIndex, 0u);
  EXPECT_EQ(anim.state().lastTickMs, 1300u);
}
