#pragma once
#include <string>

#include "menu.h"

namespace InkPet {

// Clock + pet. Return feeds, Go pokes the companion device.
class HomeMenu : public Menu {
public:
  explicit HomeMenu(MenuContext &ctx) : Menu(ctx) {}

  const char* name() const override { return "Home"; }
  bool render(bool full, uint32_t nowMs) override;
  bool onBack(uint32_t nowMs) override;
  bool onActivate(uint32_t nowMs) override;

  // Partial redraw of the clock rectangle only (whole screen on a date change
  // or when there is no base image yet).
  bool updateClockField(uint32_t nowMs) override;
  // Partial redraw of the sprite rectangle only.
  bool updateSpriteField(uint32_t nowMs) override;

private:
  void drawClock(FrameBuffer &fb);
  void drawSprite(FrameBuffer &fb);
  void drawStatusBar(FrameBuffer &fb);

  std::string _renderedDate;
};

}  // namespace InkPet
