#pragma once
#include <stdint.h>
#include <string>

namespace InkPet {

// Runtime configuration. Defaults below, then an optional .env file,
// then process environment variables (highest priority).
struct AppConfig {
  std::string deviceName     = "bunny_clock";
  std::string deviceTimezone = "America/Mexico_City";
  int         timeFormat     = 24;        // 12 or 24
  std::string petName        = "Fluffy";
  std::string petType        = "bunny";
  std::string dataDir        = "data";
  std::string assetsDir      = "assets";
  std::string flagDir        = "/tmp/eink_flags";
  bool        debugMode      = false;
  bool        mockHardware   = false;
  std::string mockDumpPath;               // MOCK_DUMP_PATH, PBM written per refresh

  std::string spritesDir() const { return assetsDir + "/sprites"; }
};

namespace AppConfigLoader {
  // Returns false only when envPath exists but cannot be read.
  bool load(AppConfig &cfg, const std::string &envPath);
  // Applies a single KEY=VALUE pair; unknown keys are ignored.
  void apply(AppConfig &cfg, const std::string &key, const std::string &value);
  void applyEnvironment(AppConfig &cfg);
  void dump(const AppConfig &cfg);
}

}  // namespace InkPet
