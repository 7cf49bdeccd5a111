#include "app_config.h"

#include <stdlib.h>

#include <algorithm>
#include <cctype>
#include <fstream>

#include "logger.h"
DEFINE_MODULE_LOGGER(MainLog)

namespace {

const char* const KEYS[] = {
  "DEVICE_NAME", "DEVICE_TIMEZONE", "TIME_FORMAT", "PET_NAME", "PET_TYPE",
  "DATA_DIR", "ASSETS_DIR", "FLAG_DIR", "DEBUG_MODE", "MOCK_HARDWARE",
  "MOCK_DUMP_PATH"
};

std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  return s.substr(b, e - b);
}

std::string unquote(const std::string &s) {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

bool parseBool(const std::string &v) {
  std::string lower = v;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return lower == "true";
}

}  // namespace

namespace InkPet {
namespace AppConfigLoader {

void apply(AppConfig &cfg, const std::string &key, const std::string &value) {
  if (key == "DEVICE_NAME") {
    cfg.deviceName = value;
  } else if (key == "DEVICE_TIMEZONE") {
    cfg.deviceTimezone = value;
  } else if (key == "TIME_FORMAT") {
    int fmt = atoi(value.c_str());
    if (fmt == 12 || fmt == 24) {
      cfg.timeFormat = fmt;
    } else {
      MainLog::printf("[Config] TIME_FORMAT=%s ignored (expected 12 or 24)\n", value.c_str());
    }
  } else if (key == "PET_NAME") {
    cfg.petName = value;
  } else if (key == "PET_TYPE") {
    cfg.petType = value;
  } else if (key == "DATA_DIR") {
    cfg.dataDir = value;
  } else if (key == "ASSETS_DIR") {
    cfg.assetsDir = value;
  } else if (key == "FLAG_DIR") {
    cfg.flagDir = value;
  } else if (key == "DEBUG_MODE") {
    cfg.debugMode = parseBool(value);
  } else if (key == "MOCK_HARDWARE") {
    cfg.mockHardware = parseBool(value);
  } else if (key == "MOCK_DUMP_PATH") {
    cfg.mockDumpPath = value;
  }
}

bool load(AppConfig &cfg, const std::string &envPath) {
  std::ifstream in(envPath);
  if (!in.is_open()) {
    MainLog::printf("[Config] %s not found, using defaults\n", envPath.c_str());
    return true;
  }

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    lineNo++;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;
    if (t.compare(0, 7, "export ") == 0) t = trim(t.substr(7));
    size_t eq = t.find('=');
    if (eq == std::string::npos) {
      MainLog::printf("[Config] %s:%d malformed line skipped\n", envPath.c_str(), lineNo);
      continue;
    }
    apply(cfg, trim(t.substr(0, eq)), unquote(trim(t.substr(eq + 1))));
  }
  if (in.bad()) {
    MainLog::printf("[Config] read error on %s\n", envPath.c_str());
    return false;
  }
  return true;
}

void applyEnvironment(AppConfig &cfg) {
  for (const char* key : KEYS) {
    const char* v = getenv(key);
    if (v) apply(cfg, key, v);
  }
}

void dump(const AppConfig &cfg) {
  MainLog::printf("[Config] device=%s tz=%s time=%dh pet=%s (%s)\n",
                  cfg.deviceName.c_str(), cfg.deviceTimezone.c_str(), cfg.timeFormat,
                  cfg.petName.c_str(), cfg.petType.c_str());
  MainLog::printf("[Config] data=%s assets=%s flags=%s debug=%d mock=%d\n",
                  cfg.dataDir.c_str(), cfg.assetsDir.c_str(), cfg.flagDir.c_str(),
                  cfg.debugMode ? 1 : 0, cfg.mockHardware ? 1 : 0);
}

}  // namespace AppConfigLoader
}  // namespace InkPet
