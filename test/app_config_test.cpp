#include <gtest/gtest.h>
#include <stdlib.h>

#include <fstream>
#include <string>

#include "app_config.h"
#include "test_env.h"

using namespace InkPet;

TEST(AppConfig, Defaults) {
  AppConfig cfg;
  EXPECT_EQ(cfg.timeFormat, 24);
  EXPECT_EQ(cfg.petName, "Fluffy");
  EXPECT_EQ(cfg.flagDir, "/tmp/eink_flags");
  EXPECT_EQ(cfg.spritesDir(), "assets/sprites");
  EXPECT_FALSE(cfg.mockHardware);
}

TEST(AppConfig, LoadsEnvFile) {
  std::string path = makeTempDir() + "/.env";
  std::ofstream(path) << "# device\n"
                      << "DEVICE_NAME=desk_clock\n"
                      << "export PET_NAME=\"Mochi\"\n"
                      << "TIME_FORMAT = 12\n"
                      << "DATA_DIR='/var/lib/inkpet'\n"
                      << "DEBUG_MODE=True\n"
                      << "MOCK_HARDWARE=false\n"
                      << "this line is junk\n"
                      << "UNKNOWN_KEY=1\n";
  AppConfig cfg;
  ASSERT_TRUE(AppConfigLoader::load(cfg, path));
  EXPECT_EQ(cfg.deviceName, "desk_clock");
  EXPECT_EQ(cfg.petName, "Mochi");
  EXPECT_EQ(cfg.timeFormat, 12);
  EXPECT_EQ(cfg.dataDir, "/var/lib/inkpet");
  EXPECT_TRUE(cfg.debugMode);
  EXPECT_FALSE(cfg.mockHardware);
}

TEST(AppConfig, MissingFileKeepsDefaults) {
  AppConfig cfg;
  EXPECT_TRUE(AppConfigLoader::load(cfg, makeTempDir() + "/absent.env"));
  EXPECT_EQ(cfg.deviceName, "bunny_clock");
}

TEST(AppConfig, InvalidTimeFormatIgnored) {
  AppConfig cfg;
  AppConfigLoader::apply(cfg, "TIME_FORMAT", "13");
  EXPECT_EQ(cfg.timeFormat, 24);
  AppConfigLoader::apply(cfg, "TIME_FORMAT", "12");
  EXPECT_EQ(cfg.timeFormat, 12);
}

TEST(AppConfig, EnvironmentOverridesFile) {
  AppConfig cfg;
  AppConfigLoader::apply(cfg, "PET_NAME", "FromFile");
  setenv("PET_NAME", "FromEnv", 1);
  setenv("MOCK_HARDWARE", "true", 1);
  AppConfigLoader::applyEnvironment(cfg);
  unsetenv("PET_NAME");
  unsetenv("MOCK_HARDWARE");
  EXPECT_EQ(cfg.petName, "FromEnv");
  EXPECT_TRUE(cfg.mockHardware);
}
