#pragma once
#include <stdint.h>
#include <string>

#include "menu_context.h"

namespace InkPet {

// One screen. render() redraws everything; full forces a full refresh,
// otherwise a partial commit is requested (and may be upgraded).
// Returns false when the panel commit failed.
class Menu {
public:
  explicit Menu(MenuContext &ctx) : _ctx(ctx) {}
  virtual ~Menu() = default;

  virtual const char* name() const = 0;
  virtual bool render(bool full, uint32_t nowMs) = 0;
  // Return button while this menu is active; only Home does anything.
  virtual bool onBack(uint32_t nowMs) { (void)nowMs; return true; }
  // Go button; the menu re-renders itself.
  virtual bool onActivate(uint32_t nowMs) = 0;

  // Minute tick. Menus with a corner clock just redraw with a partial commit.
  virtual bool updateClockField(uint32_t nowMs) { return render(false, nowMs); }
  // Animation frame change; only Home shows the sprite.
  virtual bool updateSpriteField(uint32_t nowMs) { (void)nowMs; return true; }

protected:
  bool commit(bool full, uint32_t nowMs);

  // "14:05" or "02:05 PM" per the time_format setting
  std::string timeString() const;
  // "Mon, Jan 05"
  std::string dateString() const;

  void drawHeader(FrameBuffer &fb, const char* title);
  void drawHints(FrameBuffer &fb, const char* back, const char* activate, const char* next);

  MenuContext &_ctx;
};

}  // namespace InkPet
