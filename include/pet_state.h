#pragma once
#include <stdint.h>
#include <string>

#include "user_settings.h"

namespace InkPet {

enum class Mood : uint8_t {
  Happy = 0,
  Neutral,
  Sad,
  Hungry,
  Sick,
  Sleeping,
  Dead,
  COUNT
};

const char* moodName(Mood mood);

// pet_state.json. Stats are 0..10; hunger rises over time, happiness falls.
class PetState {
public:
  static constexpr int STAT_MAX = 10;

  struct Config {
    float hungerPerHour    = 1.0f;
    float happinessPerHour = 0.5f;
    float minDecayHours    = 0.1f;  // shorter gaps are ignored
  };

  PetState(std::string path, std::string name, std::string type);

  void configure(const Config &cfg) { _cfg = cfg; }

  // Loads the file, writing a fresh pet when it is missing or corrupt.
  bool load();
  // Re-reads the file after another process changed it.
  bool reload();
  bool save() const;

  const std::string& name() const { return _name; }
  int hunger() const { return _hunger; }
  int happiness() const { return _happiness; }
  int health() const { return _health; }
  int ageHours() const { return _ageHours; }
  int totalFeeds() const { return _totalFeeds; }
  int totalInteractions() const { return _totalInteractions; }
  int messagesSent() const { return _messagesSent; }
  int messagesReceived() const { return _messagesReceived; }
  int64_t lastUpdateEpoch() const { return _lastUpdate; }

  // Stat-only mood: dead, sick, hungry, happy, sad, neutral.
  Mood mood() const;
  // Adds sleeping when the window covers minuteOfDay (local time).
  Mood mood(const SleepWindow &window, int minuteOfDay) const;

  bool feed(int64_t nowEpoch);
  bool interact(int64_t nowEpoch);
  bool messageSent(int64_t nowEpoch);
  bool messageReceived();

  // Hourly decay. Returns true when the state changed, even if it could not be saved.
  bool applyDecay(int64_t nowEpoch);

private:
  void resetDefaults(int64_t nowEpoch);
  bool readFile();

  Config _cfg;
  std::string _path;
  std::string _name;
  std::string _type;

  int _hunger = 5;
  int _happiness = 8;
  int _health = STAT_MAX;
  int _ageHours = 0;
  int _totalFeeds = 0;
  int _totalInteractions = 0;
  int _messagesSent = 0;
  int _messagesReceived = 0;
  int64_t _createdAt = 0;
  int64_t _lastFed = 0;
  int64_t _lastInteraction = 0;
  int64_t _lastUpdate = 0;
};

}  // namespace InkPet
