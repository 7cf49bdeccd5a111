#include "menu.h"

#include "logger.h"
DEFINE_MODULE_LOGGER(MenuLog)

namespace InkPet {

struct tm MenuContext::localTime() const {
  time_t t = wallTime();
  struct tm tmInfo;
  localtime_r(&t, &tmInfo);
  return tmInfo;
}

Mood MenuContext::mood() const {
  struct tm now = localTime();
  return pet.mood(settings.sleepWindow(), now.tm_hour * 60 + now.tm_min);
}

bool Menu::commit(bool full, uint32_t nowMs) {
  CommitResult res = _ctx.refresh.commit(!full, nowMs);
  if (!res.ok) {
    MenuLog::printf("[%s] commit failed (%s)\n", name(), res.full ? "full" : "partial");
    return false;
  }
  _ctx.stats.bump(StatKey::DISPLAY_UPDATES);
  return true;
}

std::string Menu::timeString() const {
  struct tm now = _ctx.localTime();
  char buf[16];
  strftime(buf, sizeof(buf), _ctx.settings.timeFormat() == 12 ? "%I:%M %p" : "%H:%M", &now);
  return buf;
}

std::string Menu::dateString() const {
  struct tm now = _ctx.localTime();
  char buf[24];
  strftime(buf, sizeof(buf), "%a, %b %d", &now);
  return buf;
}

void Menu::drawHeader(FrameBuffer &fb, const char* title) {
  fb.drawText(Layout::HEADER_X, Layout::HEADER_Y, title, FontSize::Medium);
  fb.drawText(Layout::CORNER_CLOCK_X, Layout::HEADER_Y, timeString(), FontSize::Small);
  fb.drawLine(5, Layout::HEADER_RULE_Y, DISPLAY_WIDTH - 5, Layout::HEADER_RULE_Y);
}

void Menu::drawHints(FrameBuffer &fb, const char* back, const char* activate, const char* next) {
  fb.drawText(Layout::HINT_RETURN_X, Layout::HINTS_Y, back, FontSize::Small);
  fb.drawText(Layout::HINT_ACTIVATE_X, Layout::HINTS_Y, activate, FontSize::Small);
  fb.drawText(Layout::HINT_NEXT_X, Layout::HINTS_Y, next, FontSize::Small);
}

}  // namespace InkPet
