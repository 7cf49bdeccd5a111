#include "button_source.h"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include "logger.h"
#include "platform.h"
DEFINE_MODULE_LOGGER(ButtonLog)

namespace {
constexpr int POLL_INTERVAL_MS = 50;

const char* const LINE_LABELS[] = {"btn-return", "btn-action", "btn-go"};
}

namespace InkPet {

// ---------------------------------------------------------------------------
// ButtonTracker

void ButtonTracker::emit(ButtonEvent ev) {
  if (_queue.tryPush(ev)) {
    ButtonLog::debugf("[Buttons] %s\n", buttonEventName(ev));
  }
}

void ButtonTracker::onEdge(ButtonId id, bool pressed, uint32_t nowMs) {
  LineState &s = _lines[static_cast<int>(id)];

  if (pressed) {
    if (s.down) return;
    s.down = true;
    if (s.everPressed && nowMs - s.pressMs < _cfg.debounceMs) {
      s.accepted = false;
      return;
    }
    s.everPressed = true;
    s.accepted = true;
    s.holdFired = false;
    s.pressMs = nowMs;
    if (id == ButtonId::Return) emit(ButtonEvent::ReturnPress);
    if (id == ButtonId::Go) emit(ButtonEvent::GoPress);
    return;
  }

  if (!s.down) return;
  s.down = false;
  if (id == ButtonId::Action && s.accepted && !s.holdFired) {
    emit(ButtonEvent::ActionPress);
  }
  s.accepted = false;
}

void ButtonTracker::poll(uint32_t nowMs) {
  LineState &s = _lines[static_cast<int>(ButtonId::Action)];
  if (s.down && s.accepted && !s.holdFired && nowMs - s.pressMs >= _cfg.longPressMs) {
    s.holdFired = true;
    emit(ButtonEvent::ActionHold);
  }
}

// ---------------------------------------------------------------------------
// GpioButtons

GpioButtons::GpioButtons(ButtonQueue &queue, const Config &cfg)
  : _cfg(cfg), _tracker(queue) {
  _tracker.configure(cfg.tracker);
}

GpioButtons::~GpioButtons() {
  stop();
}

bool GpioButtons::begin() {
  const int pins[] = {_cfg.pinReturn, _cfg.pinAction, _cfg.pinGo};
  for (int i = 0; i < static_cast<int>(ButtonId::COUNT); i++) {
    if (!_lines[i].requestEdges(_cfg.gpioChip, pins[i], LINE_LABELS[i])) {
      ButtonLog::printf("[Buttons] GPIO %d unavailable (check gpio group permissions)\n", pins[i]);
      for (auto &l : _lines) l.release();
      return false;
    }
  }
  _running = true;
  _thread = std::thread(&GpioButtons::run, this);
  ButtonLog::printf("[Buttons] GPIO ready: RETURN=%d ACTION=%d GO=%d\n",
                    _cfg.pinReturn, _cfg.pinAction, _cfg.pinGo);
  return true;
}

void GpioButtons::stop() {
  _running = false;
  if (_thread.joinable()) _thread.join();
  for (auto &l : _lines) l.release();
}

void GpioButtons::run() {
  constexpr int N = static_cast<int>(ButtonId::COUNT);
  struct pollfd fds[N];
  for (int i = 0; i < N; i++) {
    fds[i].fd = _lines[i].fd();
    fds[i].events = POLLIN | POLLPRI;
  }

  while (_running) {
    for (auto &f : fds) f.revents = 0;
    int rc = poll(fds, N, POLL_INTERVAL_MS);
    uint32_t now = Platform::millis();
    if (rc < 0 && errno != EINTR) {
      ButtonLog::printf("[Buttons] poll failed: %s\n", strerror(errno));
      break;
    }
    for (int i = 0; rc > 0 && i < N; i++) {
      if (!(fds[i].revents & (POLLIN | POLLPRI))) continue;
      bool rising = false;
      uint64_t ts = 0;
      if (!_lines[i].readEdge(rising, ts)) continue;
      // Pull-up: falling edge = pressed
      _tracker.onEdge(static_cast<ButtonId>(i), !rising, now);
    }
    _tracker.poll(now);
  }
  ButtonLog::println("[Buttons] GPIO reader stopped");
}

// ---------------------------------------------------------------------------
// ConsoleButtons

ConsoleButtons::~ConsoleButtons() {
  stop();
}

bool ConsoleButtons::begin() {
  _running = true;
  _thread = std::thread(&ConsoleButtons::run, this);
  ButtonLog::println("[Buttons] console mode: r=RETURN a=ACTION g=GO h=HOLD (then Enter)");
  return true;
}

void ConsoleButtons::stop() {
  _running = false;
  if (_thread.joinable()) _thread.join();
}

void ConsoleButtons::run() {
  struct pollfd pfd;
  pfd.fd = STDIN_FILENO;
  pfd.events = POLLIN;
  char buf[64];

  while (_running) {
    pfd.revents = 0;
    int rc = poll(&pfd, 1, POLL_INTERVAL_MS * 2);
    if (rc <= 0) continue;
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      ButtonLog::println("[Buttons] stdin closed");
      break;
    }
    for (ssize_t i = 0; i < n; i++) {
      ButtonEvent ev;
      switch (buf[i]) {
        case 'r': ev = ButtonEvent::ReturnPress; break;
        case 'a': ev = ButtonEvent::ActionPress; break;
        case 'g': ev = ButtonEvent::GoPress; break;
        case 'h': ev = ButtonEvent::ActionHold; break;
        default: continue;
      }
      // A full slot drops the key, same as a real button.
      if (_queue.tryPush(ev)) ButtonLog::debugf("[Buttons] key %c\n", buf[i]);
    }
  }
}

}  // namespace InkPet
