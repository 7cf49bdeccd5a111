#include "settings_menu.h"

#include <stdio.h>

#include "logger.h"
DEFINE_MODULE_LOGGER(MenuLog)

namespace {
constexpr int LINE_HEIGHT = 16;
}

namespace InkPet {

bool SettingsMenu::render(bool full, uint32_t nowMs) {
  const UserSettings &s = _ctx.settings;
  FrameBuffer &fb = _ctx.refresh.canvas();
  fb.clear();
  drawHeader(fb, "Settings");

  char line[64];
  int y = Layout::LIST_Y;

  snprintf(line, sizeof(line), "%s Time: %dh", _selected == ITEM_TIME_FORMAT ? ">" : " ",
           s.timeFormat());
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  std::string bars(static_cast<size_t>(s.brightness()), '#');
  bars.append(static_cast<size_t>(UserSettings::BRIGHTNESS_MAX - s.brightness()), '-');
  snprintf(line, sizeof(line), "%s Bright: %s", _selected == ITEM_BRIGHTNESS ? ">" : " ",
           bars.c_str());
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT;

  snprintf(line, sizeof(line), "%s Refresh: %s", _selected == ITEM_REFRESH_MODE ? ">" : " ",
           refreshModeName(s.refreshMode()));
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);
  y += LINE_HEIGHT + 10;

  snprintf(line, sizeof(line), "Device: %s", _ctx.config.deviceName.c_str());
  fb.drawText(Layout::LIST_X, y, line, FontSize::Small);

  drawHints(fb, "[Back]", "[Chg]", "[>]");
  return commit(full, nowMs);
}

bool SettingsMenu::onActivate(uint32_t nowMs) {
  UserSettings &s = _ctx.settings;
  bool saved = true;
  switch (_selected) {
    case ITEM_TIME_FORMAT:
      saved = s.toggleTimeFormat();
      MenuLog::printf("[Settings] time format -> %dh\n", s.timeFormat());
      break;
    case ITEM_BRIGHTNESS:
      saved = s.cycleBrightness();
      MenuLog::printf("[Settings] brightness -> %d\n", s.brightness());
      break;
    case ITEM_REFRESH_MODE:
      saved = s.cycleRefreshMode();
      _ctx.refresh.applyRefreshMode(s.refreshMode());
      MenuLog::printf("[Settings] refresh mode -> %s\n", refreshModeName(s.refreshMode()));
      break;
    default:
      break;
  }
  if (!saved) MenuLog::println("[Settings] change not persisted");

  _selected = (_selected + 1) % ITEM_COUNT;
  return render(true, nowMs);
}

}  // namespace InkPet
