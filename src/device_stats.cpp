#include "device_stats.h"

#include <time.h>

#include <utility>

#include "json_store.h"
#include "logger.h"
DEFINE_MODULE_LOGGER(StoreLog)

namespace {

const char* const COUNTER_KEYS[] = {
  InkPet::StatKey::BUTTON_PRESSES,
  InkPet::StatKey::DISPLAY_UPDATES,
  InkPet::StatKey::MESSAGES_SENT,
  InkPet::StatKey::MESSAGES_RECEIVED,
  InkPet::StatKey::NETWORK_ERRORS,
  InkPet::StatKey::UPTIME_HOURS,
};

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

DeviceStats::DeviceStats(std::string path) : _path(std::move(path)) {
  for (const char* key : COUNTER_KEYS) _counters[key] = 0;
}

bool DeviceStats::readFile() {
  DynamicJsonDocument doc(2048);
  if (!JsonStore::load(_path, doc)) return false;

  JsonObjectConst root = doc.as<JsonObjectConst>();
  for (JsonPairConst kv : root) {
    if (kv.value().is<int64_t>()) {
      _counters[kv.key().c_str()] = kv.value().as<int64_t>();
    }
  }
  _firstBoot = doc["first_boot"] | "";
  JsonVariantConst err = doc["last_error"];
  if (err.is<JsonObjectConst>()) {
    _lastError = err["message"] | "";
    _lastErrorAt = err["timestamp"] | "";
  } else {
    _lastError.clear();
    _lastErrorAt.clear();
  }
  for (const auto &kv : _pending) _counters[kv.first] += kv.second;
  return true;
}

bool DeviceStats::load() {
  if (readFile()) return true;
  StoreLog::printf("[Stats] no usable %s, starting fresh\n", _path.c_str());
  _firstBoot = isoNow();
  return save();
}

bool DeviceStats::reload() {
  if (!readFile()) {
    StoreLog::printf("[Stats] reload of %s failed\n", _path.c_str());
    return false;
  }
  return true;
}

bool DeviceStats::save() {
  DynamicJsonDocument doc(2048);
  doc["first_boot"] = _firstBoot;
  for (const auto &kv : _counters) doc[kv.first] = kv.second;
  if (_lastError.empty()) {
    doc["last_error"] = nullptr;
  } else {
    JsonObject err = doc.createNestedObject("last_error");
    err["message"] = _lastError;
    err["timestamp"] = _lastErrorAt;
  }
  if (!JsonStore::save(_path, doc)) return false;
  _pending.clear();
  return true;
}

bool DeviceStats::increment(const std::string &key, int64_t amount) {
  _counters[key] += amount;
  return save();
}

void DeviceStats::bump(const std::string &key, int64_t amount) {
  _counters[key] += amount;
  _pending[key] += amount;
}

bool DeviceStats::flush() {
  if (_pending.empty()) return true;
  return save();
}

int64_t DeviceStats::get(const std::string &key) const {
  auto it = _counters.find(key);
  return it == _counters.end() ? 0 : it->second;
}

bool DeviceStats::recordError(const std::string &message) {
  _counters[StatKey::NETWORK_ERRORS] += 1;
  _lastError = message;
  _lastErrorAt = isoNow();
  StoreLog::printf("[Stats] error recorded: %s\n", message.c_str());
  return save();
}

bool DeviceStats::clearError() {
  _lastError.clear();
  _lastErrorAt.clear();
  return save();
}

}  // namespace InkPet
