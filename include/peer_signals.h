#pragma once
#include <stdint.h>
#include <atomic>
#include <string>

namespace InkPet {

// Inbound events from the API process. Each type is a bit, so repeats
// coalesce until the loop takes them.
enum class PeerSignal : uint8_t {
  NewMessage = 1u << 0,
  FeedPet    = 1u << 1,
  Poke       = 1u << 2
};

const char* peerSignalName(PeerSignal sig);

class PeerSignalChannel {
public:
  void post(PeerSignal sig);
  // Returns and clears every pending bit.
  uint8_t takeAll();
  bool pending() const { return _bits.load() != 0; }

  static bool has(uint8_t mask, PeerSignal sig) {
    return (mask & static_cast<uint8_t>(sig)) != 0;
  }

private:
  std::atomic<uint8_t> _bits{0};
};

// The API process touches <dir>/{new_message,feed_pet,poke}.flag after it
// has updated the JSON files. Each flag is posted once and deleted.
class FlagWatcher {
public:
  struct Config {
    std::string dir = "/tmp/eink_flags";
    uint32_t intervalMs = 5000;
  };

  FlagWatcher(PeerSignalChannel &channel, const Config &cfg);

  bool begin();
  // Scans the flag directory when the interval has elapsed.
  // Returns the number of signals posted.
  int poll(uint32_t nowMs);
  int checkNow();

  // Asks the API process to do something on our behalf (<name>.flag).
  bool raiseOutbound(const char* name);

private:
  PeerSignalChannel &_channel;
  Config _cfg;
  uint32_t _lastCheckMs = 0;
  bool _checkedOnce = false;
};

}  // namespace InkPet
