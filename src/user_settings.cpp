#include "user_settings.h"

#include <stdio.h>
#include <time.h>

#include <utility>

#include "json_store.h"
#include "logger.h"
DEFINE_MODULE_LOGGER(StoreLog)

namespace {

bool parseHhMm(const char* s, int &minutes) {
  int h = 0;
  int m = 0;
  if (!s || sscanf(s, "%d:%d", &h, &m) != 2) return false;
  if (h < 0 || h > 23 || m < 0 || m > 59) return false;
  minutes = h * 60 + m;
  return true;
}

std::string formatHhMm(int minutes) {
  char buf[8];
  snprintf(buf, sizeof(buf), "%02d:%02d", (minutes / 60) % 24, minutes % 60);
  return buf;
}

std::string isoNow() {
  time_t t = time(nullptr);
  struct tm tmInfo;
  gmtime_r(&t, &tmInfo);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmInfo);
  return buf;
}

}  // namespace

namespace InkPet {

const char* refreshModeName(RefreshMode mode) {
  switch (mode) {
    case RefreshMode::Fast:     return "fast";
    case RefreshMode::Balanced: return "balanced";
    case RefreshMode::Slow:     return "slow";
  }
  return "balanced";
}

bool parseRefreshMode(const std::string &name, RefreshMode &out) {
  if (name == "fast")     { out = RefreshMode::Fast;     return true; }
  if (name == "balanced") { out = RefreshMode::Balanced; return true; }
  if (name == "slow")     { out = RefreshMode::Slow;     return true; }
  return false;
}

bool SleepWindow::contains(int minuteOfDay) const {
  if (!enabled || startMin == endMin) return false;
  if (startMin < endMin) {
    return minuteOfDay >= startMin && minuteOfDay < endMin;
  }
  return minuteOfDay >= startMin || minuteOfDay < endMin;
}

UserSettings::UserSettings(std::string path, int defaultTimeFormat)
  : _path(std::move(path)), _defaultTimeFormat(defaultTimeFormat) {
  resetDefaults();
}

void UserSettings::resetDefaults() {
  _timeFormat = _defaultTimeFormat;
  _brightness = 3;
  _refreshMode = RefreshMode::Balanced;
  _notifications = true;
  _sleep = SleepWindow();
}

bool UserSettings::load() {
  DynamicJsonDocument doc(1024);
  if (!JsonStore::load(_path, doc)) {
    StoreLog::printf("[Settings] %s unavailable, writing defaults\n", _path.c_str());
    resetDefaults();
    return save();
  }

  int fmt = doc["time_format"] | _defaultTimeFormat;
  _timeFormat = (fmt == 12) ? 12 : 24;

  int b = doc["brightness"] | 3;
  if (b < BRIGHTNESS_MIN || b > BRIGHTNESS_MAX) b = 3;
  _brightness = b;

  RefreshMode mode = RefreshMode::Balanced;
  const char* modeName = doc["refresh_mode"] | "balanced";
  if (!parseRefreshMode(modeName, mode)) {
    StoreLog::printf("[Settings] unknown refresh_mode '%s', using balanced\n", modeName);
  }
  _refreshMode = mode;

  _notifications = doc["notifications_enabled"] | true;
  _sleep.enabled = doc["sleep_enabled"] | false;
  if (!parseHhMm(doc["sleep_time"] | "23:00", _sleep.startMin)) _sleep.startMin = 23 * 60;
  if (!parseHhMm(doc["wake_time"] | "07:00", _sleep.endMin)) _sleep.endMin = 7 * 60;
  return true;
}

bool UserSettings::save() const {
  DynamicJsonDocument doc(1024);
  doc["time_format"] = _timeFormat;
  doc["brightness"] = _brightness;
  doc["sleep_enabled"] = _sleep.enabled;
  doc["sleep_time"] = formatHhMm(_sleep.startMin);
  doc["wake_time"] = formatHhMm(_sleep.endMin);
  doc["refresh_mode"] = refreshModeName(_refreshMode);
  doc["notifications_enabled"] = _notifications;
  doc["last_modified"] = isoNow();
  return JsonStore::save(_path, doc);
}

bool UserSettings::setTimeFormat(int fmt) {
  if (fmt != 12 && fmt != 24) return false;
  _timeFormat = fmt;
  return save();
}

bool UserSettings::setBrightness(int level) {
  if (level < BRIGHTNESS_MIN || level > BRIGHTNESS_MAX) return false;
  _brightness = level;
  return save();
}

bool UserSettings::setRefreshMode(RefreshMode mode) {
  _refreshMode = mode;
  return save();
}

bool UserSettings::setSleepWindow(const SleepWindow &window) {
  _sleep = window;
  return save();
}

bool UserSettings::toggleTimeFormat() {
  return setTimeFormat(_timeFormat == 24 ? 12 : 24);
}

bool UserSettings::cycleBrightness() {
  return setBrightness((_brightness % BRIGHTNESS_MAX) + 1);
}

bool UserSettings::cycleRefreshMode() {
  switch (_refreshMode) {
    case RefreshMode::Fast:     return setRefreshMode(RefreshMode::Balanced);
    case RefreshMode::Balanced: return setRefreshMode(RefreshMode::Slow);
    case RefreshMode::Slow:     return setRefreshMode(RefreshMode::Fast);
  }
  return false;
}

}  // namespace InkPet
