#include "home_menu.h"

#include <stdio.h>
#include <time.h>

#include <algorithm>

#include "logger.h"
DEFINE_MODULE_LOGGER(MenuLog)

namespace {

const char* moodFace(InkPet::Mood mood) {
  switch (mood) {
    case InkPet::Mood::Happy:    return ":)";
    case InkPet::Mood::Sad:      return ":(";
    case InkPet::Mood::Hungry:   return ":P";
    case InkPet::Mood::Sick:     return ":X";
    case InkPet::Mood::Sleeping: return "zZ";
    case InkPet::Mood::Dead:     return "x_x";
    default:                     return ":|";
  }
}

}  // namespace

namespace InkPet {

void HomeMenu::drawClock(FrameBuffer &fb) {
  struct tm now = _ctx.localTime();
  char hhmm[8];
  bool twelve = _ctx.settings.timeFormat() == 12;
  strftime(hhmm, sizeof(hhmm), twelve ? "%I:%M" : "%H:%M", &now);

  int y = Layout::CLOCK.y + (Layout::CLOCK.h - fb.fontHeight(FontSize::Giant)) / 2;
  fb.drawText(Layout::CLOCK_TEXT_X, y, hhmm, FontSize::Giant);
  if (twelve) {
    char ampm[4];
    strftime(ampm, sizeof(ampm), "%p", &now);
    int x = Layout::CLOCK_TEXT_X + fb.textWidth(hhmm, FontSize::Giant) + 3;
    fb.drawText(x, Layout::CLOCK.bottom() - fb.fontHeight(FontSize::Small) - 6, ampm, FontSize::Small);
  }
}

void HomeMenu::drawSprite(FrameBuffer &fb) {
  _ctx.sprites.draw(fb, _ctx.animation.currentFrame(), Layout::SPRITE);
}

void HomeMenu::drawStatusBar(FrameBuffer &fb) {
  const PetState &pet = _ctx.pet;
  fb.drawLine(0, Layout::SEPARATOR_Y, DISPLAY_WIDTH - 1, Layout::SEPARATOR_Y);

  std::string hearts;
  for (int i = 0; i < std::min(pet.health() / 3, 3); i++) hearts += "<3 ";
  fb.drawText(Layout::STAT_HEALTH_X, Layout::STATS_Y, hearts.empty() ? "HP:0" : hearts.c_str(),
              FontSize::Small);

  int hungerLevel = std::max(0, std::min(3, pet.hunger() / 3));
  std::string bars(static_cast<size_t>(hungerLevel), '*');
  fb.drawText(Layout::STAT_HUNGER_X, Layout::STATS_Y, hungerLevel > 0 ? bars.c_str() : "FED",
              FontSize::Small);

  fb.drawText(Layout::STAT_MOOD_X, Layout::STATS_Y, moodFace(_ctx.animation.state().mood),
              FontSize::Small);

  size_t unread = _ctx.messages.unreadCount();
  if (unread > 0) {
    char buf[16];
    snprintf(buf, sizeof(buf), "MSG:%zu", unread);
    fb.drawText(Layout::STAT_MSG_X, Layout::STATS_Y, buf, FontSize::Small);
  }

  if (_ctx.stats.hasError()) {
    fb.drawText(Layout::ERROR_MARK_X, Layout::ERROR_MARK_Y, "!", FontSize::Small);
  }
}

bool HomeMenu::render(bool full, uint32_t nowMs) {
  _ctx.animation.sync(_ctx.mood(), nowMs);

  FrameBuffer &fb = _ctx.refresh.canvas();
  fb.clear();
  _renderedDate = dateString();
  fb.drawText(Layout::DATE.x, Layout::DATE.y, _renderedDate, FontSize::Medium);
  drawClock(fb);
  drawSprite(fb);
  drawStatusBar(fb);
  drawHints(fb, "[Feed]", "[Poke]", "[>]");
  return commit(full, nowMs);
}

bool HomeMenu::updateClockField(uint32_t nowMs) {
  if (dateString() != _renderedDate) return render(false, nowMs);

  CommitResult res = _ctx.refresh.updateField(Layout::CLOCK,
      [this](FrameBuffer &fb) { drawClock(fb); }, nowMs);
  if (res.needsFullRender) return render(true, nowMs);
  if (!res.ok) {
    MenuLog::println("[Home] clock field update failed");
    return false;
  }
  _ctx.stats.bump(StatKey::DISPLAY_UPDATES);
  return true;
}

bool HomeMenu::updateSpriteField(uint32_t nowMs) {
  CommitResult res = _ctx.refresh.updateField(Layout::SPRITE,
      [this](FrameBuffer &fb) { drawSprite(fb); }, nowMs);
  if (res.needsFullRender) return render(true, nowMs);
  if (!res.ok) {
    MenuLog::println("[Home] sprite field update failed");
    return false;
  }
  return true;
}

bool HomeMenu::onBack(uint32_t nowMs) {
  if (!_ctx.pet.feed(static_cast<int64_t>(_ctx.wallTime()))) {
    MenuLog::println("[Home] feed not persisted");
  }
  MenuLog::printf("[Home] fed %s (hunger %d)\n", _ctx.pet.name().c_str(), _ctx.pet.hunger());
  return render(false, nowMs);
}

bool HomeMenu::onActivate(uint32_t nowMs) {
  int64_t now = static_cast<int64_t>(_ctx.wallTime());
  if (!_ctx.pet.interact(now)) {
    MenuLog::println("[Home] interaction not persisted");
  }
  if (_ctx.sendPoke) {
    if (_ctx.sendPoke()) {
      if (!_ctx.pet.messageSent(now)) MenuLog::println("[Home] sent counter not persisted");
      _ctx.stats.bump(StatKey::MESSAGES_SENT);
      MenuLog::println("[Home] poke sent");
    } else {
      if (!_ctx.stats.recordError("poke could not be queued")) {
        MenuLog::println("[Home] error record not persisted");
      }
    }
  }
  return render(false, nowMs);
}

}  // namespace InkPet
