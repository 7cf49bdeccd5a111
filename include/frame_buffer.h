#pragma once
#include <stdint.h>
#include <string>
#include <vector>

#include <LovyanGFX.hpp>

#include "layout.h"

namespace InkPet {

enum class FontSize : uint8_t {
  Small,   // hints, stat bar, list rows
  Medium,  // headers, date
  Large,   // centered notices
  Giant    // home clock
};

// The single 1-bit drawing surface (palette sprite, index 0 = ink, 1 = paper).
// Only RefreshCoordinator owns one; menus draw into it through canvas().
class FrameBuffer {
public:
  static constexpr uint8_t INK   = 0;
  static constexpr uint8_t PAPER = 1;

  FrameBuffer(int width, int height);
  ~FrameBuffer();

  FrameBuffer(const FrameBuffer&) = delete;
  FrameBuffer& operator=(const FrameBuffer&) = delete;

  bool begin();
  bool ready() const { return _ready; }

  int width() const { return _width; }
  int height() const { return _height; }

  void clear();
  void clearRect(const Rect &r);
  void fillRect(const Rect &r, bool black = true);
  void drawLine(int x0, int y0, int x1, int y1);
  void drawPixel(int x, int y, bool black = true);

  // Top-left anchored.
  void drawText(int x, int y, const char* text, FontSize size);
  void drawText(int x, int y, const std::string &text, FontSize size) {
    drawText(x, y, text.c_str(), size);
  }
  // Horizontally centered on the screen.
  void drawTextCentered(int y, const char* text, FontSize size);
  int textWidth(const char* text, FontSize size);
  int fontHeight(FontSize size);

  // Decodes a PNG and thresholds it to 1-bit, scaled into dest.
  bool drawPng(const std::vector<uint8_t> &png, const Rect &dest);

  bool isBlack(int x, int y) const;
  // Number of ink pixels inside r.
  uint32_t countInk(const Rect &r) const;

private:
  void selectFont(FontSize size);

  int _width;
  int _height;
  bool _ready = false;
  mutable lgfx::LGFX_Sprite _sprite;
};

}  // namespace InkPet
