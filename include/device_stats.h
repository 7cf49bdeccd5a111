#pragma once
#include <stdint.h>
#include <map>
#include <string>

namespace InkPet {

// stats.json counters
namespace StatKey {
  constexpr const char* BUTTON_PRESSES    = "total_button_presses";
  constexpr const char* DISPLAY_UPDATES   = "total_display_updates";
  constexpr const char* MESSAGES_SENT     = "total_messages_sent";
  constexpr const char* MESSAGES_RECEIVED = "total_messages_received";
  constexpr const char* NETWORK_ERRORS    = "network_errors";
  constexpr const char* UPTIME_HOURS      = "total_uptime_hours";
}

class DeviceStats {
public:
  explicit DeviceStats(std::string path);

  bool load();
  bool reload();
  bool save();

  bool increment(const std::string &key, int64_t amount = 1);
  // In-memory only; persisted by the next flush() or save().
  void bump(const std::string &key, int64_t amount = 1);
  bool flush();
  bool dirty() const { return !_pending.empty(); }
  int64_t get(const std::string &key) const;

  // Bumps network_errors and stores the message with a timestamp.
  bool recordError(const std::string &message);
  bool clearError();
  bool hasError() const { return !_lastError.empty(); }
  const std::string& lastError() const { return _lastError; }

private:
  bool readFile();

  std::string _path;
  std::map<std::string, int64_t> _counters;
  std::string _firstBoot;
  std::string _lastError;
  std::string _lastErrorAt;
  std::map<std::string, int64_t> _pending;   // bumps not yet on disk
};

}  // namespace InkPet
