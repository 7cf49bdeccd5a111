#pragma once
#include "menu.h"

namespace InkPet {

// Go changes the highlighted setting, then moves the highlight down.
class SettingsMenu : public Menu {
public:
  enum Item {
    ITEM_TIME_FORMAT = 0,
    ITEM_BRIGHTNESS,
    ITEM_REFRESH_MODE,
    ITEM_COUNT
  };

  explicit SettingsMenu(MenuContext &ctx) : Menu(ctx) {}

  const char* name() const override { return "Settings"; }
  bool render(bool full, uint32_t nowMs) override;
  bool onActivate(uint32_t nowMs) override;

  int selectedItem() const { return _selected; }

private:
  int _selected = ITEM_TIME_FORMAT;
};

}  // namespace InkPet
