#pragma once
#include <stdint.h>
#include <time.h>
#include <atomic>
#include <functional>
#include <optional>

#include "animation_scheduler.h"
#include "app_config.h"
#include "button_queue.h"
#include "button_source.h"
#include "device_stats.h"
#include "menu_context.h"
#include "menu_state_machine.h"
#include "message_log.h"
#include "panel.h"
#include "peer_signals.h"
#include "pet_state.h"
#include "refresh_coordinator.h"
#include "sprite_library.h"
#include "user_settings.h"

namespace InkPet {

// The polling loop and sole rendering owner. Buttons and peer signals reach
// it only through ButtonQueue and PeerSignalChannel.
class DisplayService {
public:
  struct Config {
    uint32_t loopIntervalMs      = 100;
    uint32_t clockIntervalMs     = 60UL * 1000UL;
    uint32_t petUpdateIntervalMs = 60UL * 60UL * 1000UL;
    uint32_t statsSaveIntervalMs = 10UL * 60UL * 1000UL;
  };

  DisplayService(const AppConfig &appCfg, Panel &panel);

  void configure(const Config &cfg) { _cfg = cfg; }
  void setWallClock(std::function<time_t()> fn) { _ctx.wallTime = std::move(fn); }

  // Loads state, brings up the panel and shows Home, then starts buttons
  // (may be null). False on any hardware failure.
  bool setup(uint32_t nowMs, ButtonSource* buttons);
  // Runs until stop is set or the display escalates. Returns the exit code.
  int run(const std::atomic<bool> &stop);
  // One loop iteration. False once the state machine is escalated.
  bool step(uint32_t nowMs, std::optional<ButtonEvent> ev);
  // Final frame, panel to sleep, counters flushed.
  void shutdown(uint32_t nowMs);

  ButtonQueue& buttonQueue() { return _buttons; }
  PeerSignalChannel& signals() { return _signals; }
  MenuStateMachine& stateMachine() { return _machine; }
  RefreshCoordinator& refresh() { return _refresh; }
  PetState& pet() { return _pet; }
  MessageLog& messages() { return _messages; }
  UserSettings& settings() { return _settings; }
  DeviceStats& stats() { return _stats; }

private:
  void handleSignals(uint8_t bits);
  bool isFatal(TransitionResult r) const { return r == TransitionResult::Fatal; }

  Config _cfg;
  AppConfig _appCfg;
  PetState _pet;
  MessageLog _messages;
  UserSettings _settings;
  DeviceStats _stats;
  RefreshCoordinator _refresh;
  AnimationScheduler _animation;
  SpriteLibrary _sprites;
  ButtonQueue _buttons;
  PeerSignalChannel _signals;
  FlagWatcher _flags;
  MenuContext _ctx;
  MenuStateMachine _machine;

  int _lastMinute = -1;
  uint32_t _lastClockMs = 0;
  uint32_t _lastPetMs = 0;
  uint32_t _lastStatsSaveMs = 0;
};

}  // namespace InkPet
