#include "messages_menu.h"

#include <stdio.h>

#include <algorithm>

#include "logger.h"
DEFINE_MODULE_LOGGER(MenuLog)

namespace {
constexpr int ROW_Y = 28;
constexpr int ROW_HEIGHT = 16;
constexpr int EMPTY_Y = 50;
}

namespace InkPet {

std::string MessagesMenu::truncateText(const std::string &text) {
  if (text.size() <= MAX_TEXT) return text;
  return text.substr(0, MAX_TEXT - 3) + "...";
}

bool MessagesMenu::render(bool full, uint32_t nowMs) {
  std::vector<Message> msgs = _ctx.messages.recent(FETCH_LIMIT);
  size_t unread = _ctx.messages.unreadCount();
  size_t rows = std::min(msgs.size(), VISIBLE_ROWS);
  if (_selected >= rows) _selected = 0;

  FrameBuffer &fb = _ctx.refresh.canvas();
  fb.clear();

  char header[40];
  if (unread > 0) {
    snprintf(header, sizeof(header), "Messages (%zu) - %zu new", msgs.size(), unread);
  } else {
    snprintf(header, sizeof(header), "Messages (%zu)", msgs.size());
  }
  drawHeader(fb, header);

  if (msgs.empty()) {
    fb.drawTextCentered(EMPTY_Y, "No messages", FontSize::Medium);
  } else {
    int y = ROW_Y;
    for (size_t i = 0; i < rows; i++) {
      std::string line = std::string(i == _selected ? ">" : " ") + " " +
                         truncateText(msgs[i].text) + " -" + msgs[i].from;
      fb.drawText(Layout::HEADER_X, y, line, FontSize::Small);
      y += ROW_HEIGHT;
    }
  }

  drawHints(fb, "[Back]", "[Read]", "[>]");
  return commit(full, nowMs);
}

bool MessagesMenu::onActivate(uint32_t nowMs) {
  std::vector<Message> msgs = _ctx.messages.recent(FETCH_LIMIT);
  if (msgs.empty()) return true;

  _selected = (_selected + 1) % std::min(msgs.size(), VISIBLE_ROWS);
  if (!_ctx.messages.markAllRead()) {
    MenuLog::println("[Messages] mark-all-read not persisted");
  }
  return render(true, nowMs);
}

}  // namespace InkPet
