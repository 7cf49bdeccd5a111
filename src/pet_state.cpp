#include "pet_state.h"

#include <time.h>

#include <algorithm>
#include <utility>

#include "json_store.h"
#include "logger.h"
DEFINE_MODULE_LOGGER(StoreLog)

namespace {
int clampStat(int v) {
  return std::max(0, std::min(InkPet::PetState::STAT_MAX, v));
}
}

namespace InkPet {

const char* moodName(Mood mood) {
  switch (mood) {
    case Mood::Happy:    return "happy";
    case Mood::Neutral:  return "neutral";
    case Mood::Sad:      return "sad";
    case Mood::Hungry:   return "hungry";
    case Mood::Sick:     return "sick";
    case Mood::Sleeping: return "sleeping";
    case Mood::Dead:     return "dead";
    default:             return "neutral";
  }
}

PetState::PetState(std::string path, std::string name, std::string type)
  : _path(std::move(path)), _name(std::move(name)), _type(std::move(type)) {
  resetDefaults(static_cast<int64_t>(time(nullptr)));
}

void PetState::resetDefaults(int64_t nowEpoch) {
  _hunger = 5;
  _happiness = 8;
  _health = STAT_MAX;
  _ageHours = 0;
  _totalFeeds = 0;
  _totalInteractions = 0;
  _messagesSent = 0;
  _messagesReceived = 0;
  _createdAt = _lastFed = _lastInteraction = _lastUpdate = nowEpoch;
}

bool PetState::readFile() {
  DynamicJsonDocument doc(1024);
  if (!JsonStore::load(_path, doc)) return false;

  int64_t now = static_cast<int64_t>(time(nullptr));
  _name              = doc["name"] | _name.c_str();
  _type              = doc["type"] | _type.c_str();
  _hunger            = clampStat(doc["hunger"] | 5);
  _happiness         = clampStat(doc["happiness"] | 8);
  _health            = clampStat(doc["health"] | STAT_MAX);
  _ageHours          = std::max(0, doc["age_hours"] | 0);
  _totalFeeds        = doc["total_feeds"] | 0;
  _totalInteractions = doc["total_interactions"] | 0;
  _messagesSent      = doc["messages_sent"] | 0;
  _messagesReceived  = doc["messages_received"] | 0;
  _createdAt         = doc["created_at"] | now;
  _lastFed           = doc["last_fed"] | now;
  _lastInteraction   = doc["last_interaction"] | now;
  _lastUpdate        = doc["last_update"] | now;
  return true;
}

bool PetState::load() {
  if (readFile()) {
    StoreLog::printf("[Pet] loaded %s: H=%d F=%d M=%d\n",
                     _name.c_str(), _health, _hunger, _happiness);
    return true;
  }
  StoreLog::printf("[Pet] no usable %s, hatching %s\n", _path.c_str(), _name.c_str());
  resetDefaults(static_cast<int64_t>(time(nullptr)));
  return save();
}

bool PetState::reload() {
  if (!readFile()) {
    StoreLog::printf("[Pet] reload of %s failed, keeping in-memory state\n", _path.c_str());
    return false;
  }
  return true;
}

bool PetState::save() const {
  DynamicJsonDocument doc(1024);
  doc["name"] = _name;
  doc["type"] = _type;
  doc["hunger"] = _hunger;
  doc["happiness"] = _happiness;
  doc["health"] = _health;
  doc["age_hours"] = _ageHours;
  doc["total_feeds"] = _totalFeeds;
  doc["total_interactions"] = _totalInteractions;
  doc["messages_sent"] = _messagesSent;
  doc["messages_received"] = _messagesReceived;
  doc["created_at"] = _createdAt;
  doc["last_fed"] = _lastFed;
  doc["last_interaction"] = _lastInteraction;
  doc["last_update"] = _lastUpdate;
  return JsonStore::save(_path, doc);
}

Mood PetState::mood() const {
  if (_health == 0) return Mood::Dead;
  if (_health <= 3) return Mood::Sick;
  if (_hunger >= 7) return Mood::Hungry;
  if (_happiness >= 8) return Mood::Happy;
  if (_happiness <= 3) return Mood::Sad;
  return Mood::Neutral;
}

Mood PetState::mood(const SleepWindow &window, int minuteOfDay) const {
  Mood m = mood();
  if (m == Mood::Dead) return m;
  if (window.contains(minuteOfDay)) return Mood::Sleeping;
  return m;
}

bool PetState::feed(int64_t nowEpoch) {
  _hunger = clampStat(_hunger - 3);
  _happiness = clampStat(_happiness + 1);
  _lastFed = _lastInteraction = nowEpoch;
  _totalFeeds++;
  return save();
}

bool PetState::interact(int64_t nowEpoch) {
  _happiness = clampStat(_happiness + 2);
  _lastInteraction = nowEpoch;
  _totalInteractions++;
  return save();
}

bool PetState::messageSent(int64_t nowEpoch) {
  _messagesSent++;
  _lastInteraction = nowEpoch;
  return save();
}

bool PetState::messageReceived() {
  _messagesReceived++;
  return save();
}

bool PetState::applyDecay(int64_t nowEpoch) {
  double hours = static_cast<double>(nowEpoch - _lastUpdate) / 3600.0;
  if (hours < _cfg.minDecayHours) return false;

  int hungerUp = static_cast<int>(hours * _cfg.hungerPerHour);
  int happyDown = static_cast<int>(hours * _cfg.happinessPerHour);

  _hunger = clampStat(_hunger + hungerUp);
  _happiness = clampStat(_happiness - happyDown);
  if (_hunger >= 8) {
    _health = clampStat(_health - 1);
  } else if (_hunger <= 2 && _happiness >= 7) {
    _health = clampStat(_health + 1);
  }
  _ageHours += static_cast<int>(hours);
  _lastUpdate = nowEpoch;

  StoreLog::printf("[Pet] decay %.2fh -> H=%d F=%d M=%d (%s)\n",
                   hours, _health, _hunger, _happiness, moodName(mood()));
  if (!save()) StoreLog::println("[Pet] decay kept in memory only");
  return true;
}

}  // namespace InkPet
