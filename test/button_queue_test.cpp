#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "button_queue.h"

using namespace InkPet;

TEST(ButtonQueue, SecondEventIsDroppedWhileSlotFull) {
  ButtonQueue q;
  EXPECT_TRUE(q.tryPush(ButtonEvent::ActionPress));
  EXPECT_FALSE(q.tryPush(ButtonEvent::GoPress));
  EXPECT_EQ(q.droppedCount(), 1u);

  std::optional<ButtonEvent> ev = q.pop(0);
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(*ev, ButtonEvent::ActionPress);
  EXPECT_FALSE(q.hasEvent());
  EXPECT_FALSE(q.pop(10).has_value());
}

TEST(ButtonQueue, SlotFreesAfterPop) {
  ButtonQueue q;
  ASSERT_TRUE(q.tryPush(ButtonEvent::ReturnPress));
  ASSERT_TRUE(q.pop(0).has_value());
  EXPECT_TRUE(q.tryPush(ButtonEvent::GoPress));
  EXPECT_EQ(*q.pop(0), ButtonEvent::GoPress);
}

TEST(ButtonQueue, PopWakesOnPushFromAnotherThread) {
  ButtonQueue q;
  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(q.tryPush(ButtonEvent::ActionHold));
  });
  std::optional<ButtonEvent> ev = q.pop(2000);
  producer.join();
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(*ev, ButtonEvent::ActionHold);
}

TEST(ButtonQueue, PopTimesOut) {
  ButtonQueue q;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(q.pop(30).has_value());
  auto waited = std::chrono::steady_clock::now() - start;
  EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(waited).count(), 25);
}

TEST(ButtonQueue, EventNames) {
  EXPECT_STREQ(buttonEventName(ButtonEvent::ReturnPress), "RETURN");
  EXPECT_STREQ(buttonEventName(ButtonEvent::ActionHold), "ACTION_HOLD");
}
