#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "device_stats.h"
#include "json_store.h"
#include "message_log.h"
#include "test_env.h"
#include "user_settings.h"

using namespace InkPet;

// ---------------------------------------------------------------------------
// MessageLog

TEST(MessageLog, RecentIsNewestFirst) {
  MessageLog log(makeTempDir() + "/messages.jsonl");
  ASSERT_TRUE(log.add("alice", "first"));
  ASSERT_TRUE(log.add("bob", "second"));
  ASSERT_TRUE(log.add("carol", "third"));

  std::vector<Message> recent = log.recent(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].text, "third");
  EXPECT_EQ(recent[0].from, "carol");
  EXPECT_EQ(recent[1].text, "second");
  EXPECT_EQ(log.unreadCount(), 3u);
}

TEST(MessageLog, MarkAllRead) {
  MessageLog log(makeTempDir() + "/messages.jsonl");
  ASSERT_TRUE(log.add("alice", "hi"));
  ASSERT_TRUE(log.add("alice", "there"));
  ASSERT_TRUE(log.markAllRead());
  EXPECT_EQ(log.unreadCount(), 0u);
  EXPECT_TRUE(log.recent(10, true).empty());
  EXPECT_EQ(log.recent(10).size(), 2u);
}

TEST(MessageLog, KeepsOnlyNewestFifty) {
  MessageLog log(makeTempDir() + "/messages.jsonl");
  for (int i = 0; i < 55; i++) {
    ASSERT_TRUE(log.add("peer", "msg " + std::to_string(i)));
  }
  std::vector<Message> all = log.recent(100);
  ASSERT_EQ(all.size(), MessageLog::MAX_MESSAGES);
  EXPECT_EQ(all.front().text, "msg 54");
  EXPECT_EQ(all.back().text, "msg 5");
}

TEST(MessageLog, DeleteMostRecent) {
  MessageLog log(makeTempDir() + "/messages.jsonl");
  EXPECT_FALSE(log.deleteMostRecent());
  ASSERT_TRUE(log.add("a", "keep"));
  ASSERT_TRUE(log.add("b", "drop"));
  ASSERT_TRUE(log.deleteMostRecent());
  std::vector<Message> all = log.recent();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].text, "keep");
}

TEST(MessageLog, DeleteById) {
  std::string path = makeTempDir() + "/messages.jsonl";
  std::ofstream(path) << R"({"id": 7, "from": "a", "message": "x", "read": false})" "\n"
                      << R"({"id": 9, "from": "b", "message": "y", "read": true})" "\n";
  MessageLog log(path);
  EXPECT_FALSE(log.deleteMessage(8));
  ASSERT_TRUE(log.deleteMessage(7));
  std::vector<Message> all = log.recent();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].id, 9);
  EXPECT_TRUE(all[0].read);
}

TEST(MessageLog, MalformedLinesAreSkipped) {
  std::string path = makeTempDir() + "/messages.jsonl";
  std::ofstream(path) << R"({"id": 1, "from": "a", "message": "ok"})" "\n"
                      << "not json\n"
                      << R"({"id": 2, "message": "anon"})" "\n";
  MessageLog log(path);
  std::vector<Message> all = log.recent();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].from, "Unknown");
  EXPECT_EQ(all[1].text, "ok");
}

TEST(MessageLog, LongMessageSurvivesRewrite) {
  std::string path = makeTempDir() + "/messages.jsonl";
  std::string longText(1200, 'a');
  std::ofstream(path) << R"({"id": 7, "from": "api", "message": ")" << longText
                      << R"(", "read": false})" "\n";
  MessageLog log(path);
  ASSERT_TRUE(log.add("bob", "short"));
  ASSERT_TRUE(log.markAllRead());

  std::vector<Message> all = log.recent();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[1].id, 7);
  EXPECT_EQ(all[1].text, longText);
  EXPECT_TRUE(all[1].read);
  EXPECT_EQ(log.unreadCount(), 0u);
}

TEST(MessageLog, UnreadableLinesAreKeptOnRewrite) {
  std::string path = makeTempDir() + "/messages.jsonl";
  std::ofstream(path) << R"({"id": 1, "message": "one"})" "\n"
                      << "{broken\n"
                      << R"({"id": 2, "message": "two"})" "\n";
  MessageLog log(path);
  ASSERT_TRUE(log.markAllRead());
  ASSERT_TRUE(log.deleteMostRecent());

  std::vector<std::string> lines;
  ASSERT_TRUE(JsonStore::readLines(path, lines));
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[1], "{broken");
  std::vector<Message> all = log.recent();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].text, "one");
  EXPECT_TRUE(all[0].read);
}

TEST(MessageLog, MissingFileIsEmpty) {
  MessageLog log(makeTempDir() + "/none.jsonl");
  EXPECT_TRUE(log.recent().empty());
  EXPECT_EQ(log.unreadCount(), 0u);
  EXPECT_TRUE(log.markAllRead());
}

// ---------------------------------------------------------------------------
// UserSettings

TEST(UserSettings, DefaultsWrittenWhenMissing) {
  std::string path = makeTempDir() + "/settings.json";
  UserSettings s(path, 12);
  ASSERT_TRUE(s.load());
  EXPECT_EQ(s.timeFormat(), 12);
  EXPECT_EQ(s.brightness(), 3);
  EXPECT_EQ(s.refreshMode(), RefreshMode::Balanced);
  EXPECT_FALSE(s.sleepWindow().enabled);
  EXPECT_TRUE(JsonStore::fileExists(path));
}

TEST(UserSettings, CyclesWrap) {
  UserSettings s(makeTempDir() + "/settings.json", 24);
  ASSERT_TRUE(s.load());

  ASSERT_TRUE(s.toggleTimeFormat());
  EXPECT_EQ(s.timeFormat(), 12);
  ASSERT_TRUE(s.toggleTimeFormat());
  EXPECT_EQ(s.timeFormat(), 24);

  ASSERT_TRUE(s.setBrightness(5));
  ASSERT_TRUE(s.cycleBrightness());
  EXPECT_EQ(s.brightness(), 1);
  EXPECT_FALSE(s.setBrightness(6));

  ASSERT_TRUE(s.cycleRefreshMode());
  EXPECT_EQ(s.refreshMode(), RefreshMode::Slow);
  ASSERT_TRUE(s.cycleRefreshMode());
  EXPECT_EQ(s.refreshMode(), RefreshMode::Fast);
  ASSERT_TRUE(s.cycleRefreshMode());
  EXPECT_EQ(s.refreshMode(), RefreshMode::Balanced);
}

TEST(UserSettings, ReadsFileWrittenByApi) {
  std::string path = makeTempDir() + "/settings.json";
  std::ofstream(path) << R"({"time_format": 12, "brightness": 9, "refresh_mode": "slow",
                             "sleep_enabled": true, "sleep_time": "22:30", "wake_time": "06:15"})";
  UserSettings s(path, 24);
  ASSERT_TRUE(s.load());
  EXPECT_EQ(s.timeFormat(), 12);
  EXPECT_EQ(s.brightness(), 3);
  EXPECT_EQ(s.refreshMode(), RefreshMode::Slow);
  EXPECT_TRUE(s.sleepWindow().enabled);
  EXPECT_EQ(s.sleepWindow().startMin, 22 * 60 + 30);
  EXPECT_EQ(s.sleepWindow().endMin, 6 * 60 + 15);
}

TEST(UserSettings, ChangesPersist) {
  std::string path = makeTempDir() + "/settings.json";
  {
    UserSettings s(path, 24);
    ASSERT_TRUE(s.load());
    ASSERT_TRUE(s.setRefreshMode(RefreshMode::Fast));
    ASSERT_TRUE(s.setBrightness(4));
  }
  UserSettings again(path, 24);
  ASSERT_TRUE(again.load());
  EXPECT_EQ(again.refreshMode(), RefreshMode::Fast);
  EXPECT_EQ(again.brightness(), 4);
}

TEST(SleepWindow, Contains) {
  SleepWindow w;
  EXPECT_FALSE(w.contains(0));
  w.enabled = true;
  EXPECT_TRUE(w.contains(23 * 60));
  EXPECT_TRUE(w.contains(3 * 60));
  EXPECT_FALSE(w.contains(7 * 60));
  EXPECT_FALSE(w.contains(12 * 60));

  w.startMin = 13 * 60;
  w.endMin = 14 * 60;
  EXPECT_TRUE(w.contains(13 * 60 + 30));
  EXPECT_FALSE(w.contains(14 * 60));
}

TEST(RefreshMode, Parse) {
  RefreshMode m = RefreshMode::Balanced;
  EXPECT_TRUE(parseRefreshMode("fast", m));
  EXPECT_EQ(m, RefreshMode::Fast);
  EXPECT_FALSE(parseRefreshMode("turbo", m));
  EXPECT_EQ(m, RefreshMode::Fast);
  EXPECT_STREQ(refreshModeName(RefreshMode::Slow), "slow");
}

// ---------------------------------------------------------------------------
// DeviceStats

TEST(DeviceStats, IncrementPersists) {
  std::string path = makeTempDir() + "/stats.json";
  DeviceStats a(path);
  ASSERT_TRUE(a.load());
  ASSERT_TRUE(a.increment(StatKey::MESSAGES_RECEIVED, 2));

  DeviceStats b(path);
  ASSERT_TRUE(b.load());
  EXPECT_EQ(b.get(StatKey::MESSAGES_RECEIVED), 2);
  EXPECT_EQ(b.get(StatKey::BUTTON_PRESSES), 0);
}

TEST(DeviceStats, BumpWaitsForFlush) {
  std::string path = makeTempDir() + "/stats.json";
  DeviceStats a(path);
  ASSERT_TRUE(a.load());
  a.bump(StatKey::BUTTON_PRESSES);
  a.bump(StatKey::BUTTON_PRESSES);
  EXPECT_TRUE(a.dirty());
  EXPECT_EQ(a.get(StatKey::BUTTON_PRESSES), 2);

  DeviceStats before(path);
  ASSERT_TRUE(before.load());
  EXPECT_EQ(before.get(StatKey::BUTTON_PRESSES), 0);

  ASSERT_TRUE(a.flush());
  EXPECT_FALSE(a.dirty());
  DeviceStats after(path);
  ASSERT_TRUE(after.load());
  EXPECT_EQ(after.get(StatKey::BUTTON_PRESSES), 2);
}

TEST(DeviceStats, ReloadKeepsPendingBumps) {
  std::string path = makeTempDir() + "/stats.json";
  DeviceStats local(path);
  ASSERT_TRUE(local.load());
  local.bump(StatKey::DISPLAY_UPDATES, 3);

  DeviceStats api(path);
  ASSERT_TRUE(api.load());
  ASSERT_TRUE(api.increment(StatKey::MESSAGES_RECEIVED));

  ASSERT_TRUE(local.reload());
  EXPECT_EQ(local.get(StatKey::MESSAGES_RECEIVED), 1);
  EXPECT_EQ(local.get(StatKey::DISPLAY_UPDATES), 3);
  ASSERT_TRUE(local.flush());

  DeviceStats check(path);
  ASSERT_TRUE(check.load());
  EXPECT_EQ(check.get(StatKey::MESSAGES_RECEIVED), 1);
  EXPECT_EQ(check.get(StatKey::DISPLAY_UPDATES), 3);
}

TEST(DeviceStats, ErrorRecording) {
  std::string path = makeTempDir() + "/stats.json";
  DeviceStats s(path);
  ASSERT_TRUE(s.load());
  EXPECT_FALSE(s.hasError());
  ASSERT_TRUE(s.recordError("peer unreachable"));
  EXPECT_TRUE(s.hasError());
  EXPECT_EQ(s.get(StatKey::NETWORK_ERRORS), 1);

  DeviceStats again(path);
  ASSERT_TRUE(again.load());
  EXPECT_EQ(again.lastError(), "peer unreachable");
  ASSERT_TRUE(again.clearError());
  EXPECT_FALSE(again.hasError());
}

// ---------------------------------------------------------------------------
// JsonStore

TEST(JsonStore, EnsureDirCreatesNestedPath) {
  std::string dir = makeTempDir() + "/a/b/c";
  ASSERT_TRUE(JsonStore::ensureDir(dir));
  EXPECT_TRUE(JsonStore::fileExists(dir));
  EXPECT_TRUE(JsonStore::ensureDir(dir));
}

TEST(JsonStore, SaveLeavesNoTempFile) {
  std::string path = makeTempDir() + "/doc.json";
  StaticJsonDocument<64> doc;
  doc["k"] = 1;
  ASSERT_TRUE(JsonStore::save(path, doc));
  EXPECT_FALSE(JsonStore::fileExists(path + ".tmp"));

  StaticJsonDocument<64> back;
  ASSERT_TRUE(JsonStore::load(path, back));
  EXPECT_EQ(back["k"].as<int>(), 1);
}
