#pragma once
#include "menu.h"

namespace InkPet {

// Page 0: pet history. Page 1: device counters.
class StatsMenu : public Menu {
public:
  static constexpr int PAGE_COUNT = 2;

  explicit StatsMenu(MenuContext &ctx) : Menu(ctx) {}

  const char* name() const override { return "Stats"; }
  bool render(bool full, uint32_t nowMs) override;
  bool onActivate(uint32_t nowMs) override;

  int page() const { return _page; }

private:
  void drawPetPage(FrameBuffer &fb);
  void drawDevicePage(FrameBuffer &fb, uint32_t nowMs);

  int _page = 0;
};

}  // namespace InkPet
