#pragma once
#include <stddef.h>

#include "menu.h"

namespace InkPet {

// Inbox: up to 3 of the 5 newest messages with a cursor.
class MessagesMenu : public Menu {
public:
  static constexpr size_t FETCH_LIMIT = 5;
  static constexpr size_t VISIBLE_ROWS = 3;
  static constexpr size_t MAX_TEXT = 20;   // longer texts become 17 chars + "..."

  explicit MessagesMenu(MenuContext &ctx) : Menu(ctx) {}

  const char* name() const override { return "Messages"; }
  bool render(bool full, uint32_t nowMs) override;
  // Moves the cursor and marks everything read.
  bool onActivate(uint32_t nowMs) override;

  size_t selectedIndex() const { return _selected; }

  static std::string truncateText(const std::string &text);

private:
  size_t _selected = 0;
};

}  // namespace InkPet
