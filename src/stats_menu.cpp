#include "stats_menu.h"

#include <stdio.h>

#include "messages_menu.h"

namespace {
constexpr int LINE_HEIGHT = 14;
}

namespace InkPet {

void StatsMenu::drawPetPage(FrameBuffer &fb) {
  const PetState &pet = _ctx.pet;
  char line[64];
  int y = Layout::LIST_Y;

  snprintf(line, sizeof(line), "Age: %dd %dh", pet.ageHours() / 24, pet.ageHours() % 24);
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  snprintf(line, sizeof(line), "Fed: %d times", pet.totalFeeds());
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  snprintf(line, sizeof(line), "Msgs: %d sent, %d rcv", pet.messagesSent(), pet.messagesReceived());
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  int stars = pet.happiness() / 2;
  std::string rating = "Mood: " + std::string(static_cast<size_t>(stars), '*') +
                       std::string(static_cast<size_t>(5 - stars), '-');
  fb.drawText(Layout::LIST_X, y, rating, FontSize::Small);
  y += LINE_HEIGHT;

  snprintf(line, sizeof(line), "H:%d F:%d M:%d", pet.health(),
           PetState::STAT_MAX - pet.hunger(), pet.happiness());
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
}

void StatsMenu::drawDevicePage(FrameBuffer &fb, uint32_t nowMs) {
  const DeviceStats &stats = _ctx.stats;
  char line[64];
  int y = Layout::LIST_Y;

  snprintf(line, sizeof(line), "Buttons: %lld",
           static_cast<long long>(stats.get(StatKey::BUTTON_PRESSES)));
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  snprintf(line, sizeof(line), "Updates: %lld",
           static_cast<long long>(stats.get(StatKey::DISPLAY_UPDATES)));
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  uint32_t minutes = nowMs / 60000UL;
  snprintf(line, sizeof(line), "Uptime: %uh %02um", minutes / 60, minutes % 60);
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  snprintf(line, sizeof(line), "Net errors: %lld",
           static_cast<long long>(stats.get(StatKey::NETWORK_ERRORS)));
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  if (stats.hasError()) {
    std::string last = "Last: " + MessagesMenu::truncateText(stats.lastError());
    fb.drawText(Layout::LIST_X, y, last, FontSize::Small);
  }
}

bool StatsMenu::render(bool full, uint32_t nowMs) {
  FrameBuffer &fb = _ctx.refresh.canvas();
  fb.clear();
  drawHeader(fb, _page == 0 ? "Pet Stats" : "Device Stats");
  if (_page == 0) {
    drawPetPage(fb);
  } else {
    drawDevicePage(fb, nowMs);
  }
  drawHints(fb, "[Back]", "[Next]", "[>]");
  return commit(full, nowMs);
}

bool StatsMenu::onActivate(uint32_t nowMs) {
  _page = (_page + 1) % PAGE_COUNT;
  return render(true, nowMs);
}

}  // namespace InkPet
