#include "display_service.h"

#include <memory>
#include <utility>
#include <vector>

#include "home_menu.h"
#include "json_store.h"
#include "logger.h"
#include "messages_menu.h"
#include "platform.h"
#include "settings_menu.h"
#include "stats_menu.h"
DEFINE_MODULE_LOGGER(ServiceLog)

namespace {

std::vector<std::unique_ptr<InkPet::Menu>> makeMenus(InkPet::MenuContext &ctx) {
  std::vector<std::unique_ptr<InkPet::Menu>> menus;
  menus.push_back(std::make_unique<InkPet::HomeMenu>(ctx));
  menus.push_back(std::make_unique<InkPet::MessagesMenu>(ctx));
  menus.push_back(std::make_unique<InkPet::StatsMenu>(ctx));
  menus.push_back(std::make_unique<InkPet::SettingsMenu>(ctx));
  return menus;
}

InkPet::FlagWatcher::Config flagConfig(const InkPet::AppConfig &cfg) {
  InkPet::FlagWatcher::Config fc;
  fc.dir = cfg.flagDir;
  return fc;
}

}  // namespace

namespace InkPet {

DisplayService::DisplayService(const AppConfig &appCfg, Panel &panel)
  : _appCfg(appCfg),
    _pet(appCfg.dataDir + "/pet_state.json", appCfg.petName, appCfg.petType),
    _messages(appCfg.dataDir + "/messages.jsonl"),
    _settings(appCfg.dataDir + "/settings.json", appCfg.timeFormat),
    _stats(appCfg.dataDir + "/stats.json"),
    _refresh(panel),
    _sprites(appCfg.spritesDir()),
    _flags(_signals, flagConfig(appCfg)),
    _ctx{_refresh, _animation, _sprites, _pet, _messages, _settings, _stats, _appCfg},
    _machine(_refresh, _animation, [this] { return _ctx.mood(); }, makeMenus(_ctx)) {
  _ctx.sendPoke = [this] { return _flags.raiseOutbound("send_poke"); };
}

bool DisplayService::setup(uint32_t nowMs, ButtonSource* buttons) {
  if (!JsonStore::ensureDir(_appCfg.dataDir)) {
    ServiceLog::printf("[Service] data dir %s unusable, state will not persist\n",
                       _appCfg.dataDir.c_str());
  }
  if (!_pet.load()) ServiceLog::println("[Service] pet state not persisted");
  if (!_settings.load()) ServiceLog::println("[Service] settings not persisted");
  if (!_stats.load()) ServiceLog::println("[Service] stats not persisted");
  if (!_flags.begin()) ServiceLog::println("[Service] peer signals disabled");

  _refresh.applyRefreshMode(_settings.refreshMode());
  if (!_refresh.begin()) {
    ServiceLog::println("[Service] FATAL: display init failed");
    return false;
  }
  if (!_machine.setup(nowMs)) {
    ServiceLog::println("[Service] FATAL: first render failed");
    return false;
  }
  if (buttons && !buttons->begin()) {
    ServiceLog::printf("[Service] FATAL: %s buttons failed to start\n", buttons->name());
    return false;
  }

  struct tm now = _ctx.localTime();
  _lastMinute = now.tm_min;
  _lastClockMs = _lastPetMs = _lastStatsSaveMs = nowMs;
  ServiceLog::printf("[Service] running, pet %s is %s\n",
                     _pet.name().c_str(), moodName(_ctx.mood()));
  return true;
}

void DisplayService::handleSignals(uint8_t bits) {
  // The API process already updated the files; pick up its changes.
  if (!_pet.reload()) ServiceLog::println("[Service] pet reload failed");
  if (!_stats.reload()) ServiceLog::println("[Service] stats reload failed");

  if (PeerSignalChannel::has(bits, PeerSignal::NewMessage) && _settings.notificationsEnabled()) {
    ServiceLog::printf("[Service] new message, %u unread\n",
                       static_cast<unsigned>(_messages.unreadCount()));
  }
  if (PeerSignalChannel::has(bits, PeerSignal::FeedPet)) {
    ServiceLog::println("[Service] remote feed");
  }
  if (PeerSignalChannel::has(bits, PeerSignal::Poke)) {
    ServiceLog::println("[Service] poke received");
  }
  _machine.requestRender();
}

bool DisplayService::step(uint32_t nowMs, std::optional<ButtonEvent> ev) {
  if (ev) {
    TransitionResult r = _machine.handleButton(*ev, nowMs);
    ServiceLog::debugf("[Service] %s -> %s\n", buttonEventName(*ev), transitionResultName(r));
    if (isFatal(r)) return false;
    if (r != TransitionResult::Throttled && r != TransitionResult::Dropped) {
      _stats.bump(StatKey::BUTTON_PRESSES);
    }
  }

  _flags.poll(nowMs);
  uint8_t bits = _signals.takeAll();
  if (bits) handleSignals(bits);

  struct tm now = _ctx.localTime();
  if (now.tm_min != _lastMinute || nowMs - _lastClockMs >= _cfg.clockIntervalMs) {
    _lastMinute = now.tm_min;
    _lastClockMs = nowMs;
    if (isFatal(_machine.updateClock(nowMs))) return false;
  }

  if (nowMs - _lastPetMs >= _cfg.petUpdateIntervalMs) {
    _lastPetMs = nowMs;
    if (_pet.applyDecay(static_cast<int64_t>(_ctx.wallTime()))) _machine.requestRender();
  }

  if (isFatal(_machine.animationTick(nowMs))) return false;
  _machine.checkRefreshDue(nowMs);
  if (isFatal(_machine.renderCurrent(nowMs))) return false;

  if (nowMs - _lastStatsSaveMs >= _cfg.statsSaveIntervalMs) {
    _lastStatsSaveMs = nowMs;
    if (!_stats.flush()) ServiceLog::println("[Service] stats flush failed");
  }
  return !_machine.isEscalated();
}

int DisplayService::run(const std::atomic<bool> &stop) {
  while (!stop) {
    std::optional<ButtonEvent> ev = _buttons.pop(_cfg.loopIntervalMs);
    if (!step(Platform::millis(), ev)) {
      ServiceLog::println("[Service] display escalated, exiting for restart");
      return 1;
    }
  }
  ServiceLog::println("[Service] stop requested");
  return 0;
}

void DisplayService::shutdown(uint32_t nowMs) {
  FrameBuffer &fb = _refresh.canvas();
  if (fb.ready()) {
    fb.clear();
    fb.drawTextCentered(DISPLAY_HEIGHT / 2 - 12, "Shutting down...", FontSize::Large);
    if (!_refresh.commit(false, nowMs).ok) {
      ServiceLog::println("[Service] shutdown frame failed");
    }
  }
  if (!_refresh.sleep()) ServiceLog::println("[Service] panel sleep failed");
  if (!_stats.flush()) ServiceLog::println("[Service] stats flush failed");
  ServiceLog::println("[Service] shutdown complete");
}

}  // namespace InkPet
