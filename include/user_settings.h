#pragma once
#include <stdint.h>
#include <string>

namespace InkPet {

enum class RefreshMode { Fast, Balanced, Slow };

const char* refreshModeName(RefreshMode mode);
bool parseRefreshMode(const std::string &name, RefreshMode &out);

// Sleep window in minutes since local midnight; may wrap past midnight.
struct SleepWindow {
  bool enabled = false;
  int  startMin = 23 * 60;
  int  endMin   = 7 * 60;

  bool contains(int minuteOfDay) const;
};

// settings.json
class UserSettings {
public:
  static constexpr int BRIGHTNESS_MIN = 1;
  static constexpr int BRIGHTNESS_MAX = 5;

  UserSettings(std::string path, int defaultTimeFormat);

  // Loads the file, writing defaults when it is missing or corrupt.
  bool load();

  int timeFormat() const { return _timeFormat; }
  int brightness() const { return _brightness; }
  RefreshMode refreshMode() const { return _refreshMode; }
  bool notificationsEnabled() const { return _notifications; }
  const SleepWindow& sleepWindow() const { return _sleep; }

  bool setTimeFormat(int fmt);
  bool setBrightness(int level);
  bool setRefreshMode(RefreshMode mode);
  bool setSleepWindow(const SleepWindow &window);

  // 24 <-> 12
  bool toggleTimeFormat();
  // 1..5 wrapping back to 1
  bool cycleBrightness();
  // fast -> balanced -> slow -> fast
  bool cycleRefreshMode();

  bool save() const;

private:
  void resetDefaults();

  std::string _path;
  int _defaultTimeFormat;
  int _timeFormat = 24;
  int _brightness = 3;
  RefreshMode _refreshMode = RefreshMode::Balanced;
  bool _notifications = true;
  SleepWindow _sleep;
};

}  // namespace InkPet
