#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>

#include "json_store.h"
#include "peer_signals.h"
#include "test_env.h"

using namespace InkPet;

namespace {

void touch(const std::string &path) {
  std::ofstream f(path);
}

class FlagWatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    cfg.dir = makeTempDir() + "/flags";
    watcher = std::make_unique<FlagWatcher>(channel, cfg);
    ASSERT_TRUE(watcher->begin());
  }

  PeerSignalChannel channel;
  FlagWatcher::Config cfg;
  std::unique_ptr<FlagWatcher> watcher;
};

}  // namespace

TEST(PeerSignalChannel, RepeatsCoalesce) {
  PeerSignalChannel ch;
  EXPECT_FALSE(ch.pending());
  ch.post(PeerSignal::Poke);
  ch.post(PeerSignal::Poke);
  ch.post(PeerSignal::NewMessage);
  EXPECT_TRUE(ch.pending());

  uint8_t bits = ch.takeAll();
  EXPECT_TRUE(PeerSignalChannel::has(bits, PeerSignal::Poke));
  EXPECT_TRUE(PeerSignalChannel::has(bits, PeerSignal::NewMessage));
  EXPECT_FALSE(PeerSignalChannel::has(bits, PeerSignal::FeedPet));
  EXPECT_EQ(ch.takeAll(), 0u);
  EXPECT_FALSE(ch.pending());
}

TEST_F(FlagWatcherTest, FlagsArePostedOnceAndRemoved) {
  touch(cfg.dir + "/feed_pet.flag");
  touch(cfg.dir + "/new_message.flag");

  EXPECT_EQ(watcher->checkNow(), 2);
  EXPECT_FALSE(JsonStore::fileExists(cfg.dir + "/feed_pet.flag"));
  EXPECT_FALSE(JsonStore::fileExists(cfg.dir + "/new_message.flag"));

  uint8_t bits = channel.takeAll();
  EXPECT_TRUE(PeerSignalChannel::has(bits, PeerSignal::FeedPet));
  EXPECT_TRUE(PeerSignalChannel::has(bits, PeerSignal::NewMessage));
  EXPECT_EQ(watcher->checkNow(), 0);
}

TEST_F(FlagWatcherTest, PollHonoursInterval) {
  EXPECT_EQ(watcher->poll(100), 0);
  touch(cfg.dir + "/poke.flag");
  EXPECT_EQ(watcher->poll(1000), 0);
  EXPECT_EQ(watcher->poll(5100), 1);
  EXPECT_TRUE(PeerSignalChannel::has(channel.takeAll(), PeerSignal::Poke));
}

TEST_F(FlagWatcherTest, FirstPollChecksImmediately) {
  touch(cfg.dir + "/poke.flag");
  EXPECT_EQ(watcher->poll(0), 1);
}

TEST_F(FlagWatcherTest, UnknownFilesAreIgnored) {
  touch(cfg.dir + "/reboot.flag");
  EXPECT_EQ(watcher->checkNow(), 0);
  EXPECT_TRUE(JsonStore::fileExists(cfg.dir + "/reboot.flag"));
}

TEST_F(FlagWatcherTest, RaiseOutboundCreatesFlag) {
  ASSERT_TRUE(watcher->raiseOutbound("send_poke"));
  EXPECT_TRUE(JsonStore::fileExists(cfg.dir + "/send_poke.flag"));
  EXPECT_EQ(watcher->checkNow(), 0);
}

TEST(FlagWatcher, RaiseFailsWithoutDirectory) {
  PeerSignalChannel ch;
  FlagWatcher::Config cfg;
  cfg.dir = makeTempDir() + "/missing/deeper";
  FlagWatcher w(ch, cfg);
  EXPECT_FALSE(w.raiseOutbound("send_poke"));
}
