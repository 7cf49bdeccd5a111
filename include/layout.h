#pragma once
#include <stdint.h>

#include "panel_pins.h"

namespace InkPet {

struct Rect {
  int16_t x = 0;
  int16_t y = 0;
  int16_t w = 0;
  int16_t h = 0;

  constexpr Rect() = default;
  constexpr Rect(int16_t x_, int16_t y_, int16_t w_, int16_t h_) : x(x_), y(y_), w(w_), h(h_) {}

  constexpr bool empty() const { return w <= 0 || h <= 0; }
  constexpr int right() const { return x + w; }    // exclusive
  constexpr int bottom() const { return y + h; }   // exclusive
  constexpr bool contains(int px, int py) const {
    return px >= x && py >= y && px < right() && py < bottom();
  }
  constexpr bool operator==(const Rect &o) const {
    return x == o.x && y == o.y && w == o.w && h == o.h;
  }
  constexpr bool operator!=(const Rect &o) const { return !(*this == o); }
};

// Intersection, empty Rect when disjoint.
Rect intersect(const Rect &a, const Rect &b);

// Fixed screen layout, 250x122 landscape. Fonts and sprite assets are sized for these.
namespace Layout {
  constexpr Rect SCREEN{0, 0, DISPLAY_WIDTH, DISPLAY_HEIGHT};

  // Home
  constexpr Rect DATE{5, 5, 165, 18};
  constexpr Rect CLOCK{5, 24, 168, 68};
  constexpr int  CLOCK_TEXT_X = 10;
  constexpr int  SPRITE_SIZE = 64;
  constexpr Rect SPRITE{DISPLAY_WIDTH - SPRITE_SIZE - 10, 25, SPRITE_SIZE, SPRITE_SIZE};
  constexpr int  SEPARATOR_Y = 95;
  constexpr int  STATS_Y = 98;
  constexpr int  STAT_HEALTH_X = 5;
  constexpr int  STAT_HUNGER_X = 50;
  constexpr int  STAT_MOOD_X = 90;
  constexpr int  STAT_MSG_X = 120;
  constexpr int  ERROR_MARK_X = 230;
  constexpr int  ERROR_MARK_Y = 5;

  // List screens (Messages, Stats, Settings)
  constexpr int  HEADER_X = 5;
  constexpr int  HEADER_Y = 5;
  constexpr int  CORNER_CLOCK_X = 180;
  constexpr int  HEADER_RULE_Y = 22;
  constexpr int  LIST_X = 10;
  constexpr int  LIST_Y = 30;

  // Button hints, one per button
  constexpr int  HINTS_Y = 110;
  constexpr int  HINT_RETURN_X = 5;
  constexpr int  HINT_ACTIVATE_X = 80;
  constexpr int  HINT_NEXT_X = 210;
}

}  // namespace InkPet
