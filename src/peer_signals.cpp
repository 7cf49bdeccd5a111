#include "peer_signals.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include "json_store.h"
#include "logger.h"
DEFINE_MODULE_LOGGER(ServiceLog)

namespace {

struct FlagFile {
  const char* file;
  InkPet::PeerSignal signal;
};

const FlagFile FLAG_FILES[] = {
  {"new_message.flag", InkPet::PeerSignal::NewMessage},
  {"feed_pet.flag",    InkPet::PeerSignal::FeedPet},
  {"poke.flag",        InkPet::PeerSignal::Poke},
};

}  // namespace

namespace InkPet {

const char* peerSignalName(PeerSignal sig) {
  switch (sig) {
    case PeerSignal::NewMessage: return "new_message";
    case PeerSignal::FeedPet:    return "feed_pet";
    case PeerSignal::Poke:       return "poke";
  }
  return "?";
}

void PeerSignalChannel::post(PeerSignal sig) {
  _bits.fetch_or(static_cast<uint8_t>(sig));
}

uint8_t PeerSignalChannel::takeAll() {
  return _bits.exchange(0);
}

FlagWatcher::FlagWatcher(PeerSignalChannel &channel, const Config &cfg)
  : _channel(channel), _cfg(cfg) {}

bool FlagWatcher::begin() {
  if (!JsonStore::ensureDir(_cfg.dir)) {
    ServiceLog::printf("[Flags] cannot create %s\n", _cfg.dir.c_str());
    return false;
  }
  return true;
}

int FlagWatcher::poll(uint32_t nowMs) {
  if (_checkedOnce && nowMs - _lastCheckMs < _cfg.intervalMs) return 0;
  _checkedOnce = true;
  _lastCheckMs = nowMs;
  return checkNow();
}

int FlagWatcher::checkNow() {
  int posted = 0;
  for (const FlagFile &f : FLAG_FILES) {
    std::string path = _cfg.dir + "/" + f.file;
    if (!JsonStore::fileExists(path)) continue;
    if (remove(path.c_str()) != 0 && errno != ENOENT) {
      ServiceLog::printf("[Flags] cannot remove %s: %s\n", path.c_str(), strerror(errno));
    }
    _channel.post(f.signal);
    ServiceLog::printf("[Flags] %s\n", peerSignalName(f.signal));
    posted++;
  }
  return posted;
}

bool FlagWatcher::raiseOutbound(const char* name) {
  std::string path = _cfg.dir + "/" + name + ".flag";
  FILE* f = fopen(path.c_str(), "w");
  if (!f) {
    ServiceLog::printf("[Flags] cannot raise %s: %s\n", path.c_str(), strerror(errno));
    return false;
  }
  fclose(f);
  return true;
}

}  // namespace InkPet
