#include "frame_buffer.h"

#include <algorithm>

#include "logger.h"
DEFINE_MODULE_LOGGER(RefreshLog)

namespace {

// Luminance cut for PNG thresholding (0..255)
constexpr int INK_THRESHOLD = 128;

bool pngSize(const std::vector<uint8_t> &png, uint32_t &w, uint32_t &h) {
  static const uint8_t SIG[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  if (png.size() < 24 || !std::equal(SIG, SIG + 8, png.begin())) return false;
  auto be32 = [&](size_t off) {
    return (uint32_t(png[off]) << 24) | (uint32_t(png[off + 1]) << 16) |
           (uint32_t(png[off + 2]) << 8) | uint32_t(png[off + 3]);
  };
  w = be32(16);
  h = be32(20);
  return w > 0 && h > 0;
}

}  // namespace

namespace InkPet {

Rect intersect(const Rect &a, const Rect &b) {
  int x0 = std::max<int>(a.x, b.x);
  int y0 = std::max<int>(a.y, b.y);
  int x1 = std::min(a.right(), b.right());
  int y1 = std::min(a.bottom(), b.bottom());
  if (x1 <= x0 || y1 <= y0) return Rect();
  return Rect(x0, y0, x1 - x0, y1 - y0);
}

FrameBuffer::FrameBuffer(int width, int height) : _width(width), _height(height) {}

FrameBuffer::~FrameBuffer() {
  if (_ready) _sprite.deleteSprite();
}

bool FrameBuffer::begin() {
  if (_ready) return true;
  _sprite.setColorDepth(lgfx::palette_1bit);
  if (!_sprite.createSprite(_width, _height)) {
    RefreshLog::printf("[FrameBuffer] createSprite(%d, %d) failed\n", _width, _height);
    return false;
  }
  _sprite.createPalette();
  _sprite.setPaletteColor(INK, 0x000000u);
  _sprite.setPaletteColor(PAPER, 0xFFFFFFu);
  _sprite.setTextWrap(false);
  _ready = true;
  clear();
  return true;
}

void FrameBuffer::clear() {
  _sprite.fillScreen(PAPER);
}

void FrameBuffer::clearRect(const Rect &r) {
  fillRect(r, false);
}

void FrameBuffer::fillRect(const Rect &r, bool black) {
  Rect c = intersect(r, Rect(0, 0, _width, _height));
  if (c.empty()) return;
  _sprite.fillRect(c.x, c.y, c.w, c.h, black ? INK : PAPER);
}

void FrameBuffer::drawLine(int x0, int y0, int x1, int y1) {
  _sprite.drawLine(x0, y0, x1, y1, INK);
}

void FrameBuffer::drawPixel(int x, int y, bool black) {
  _sprite.drawPixel(x, y, black ? INK : PAPER);
}

void FrameBuffer::selectFont(FontSize size) {
  switch (size) {
    case FontSize::Small:  _sprite.setFont(&fonts::DejaVu12); break;
    case FontSize::Medium: _sprite.setFont(&fonts::DejaVu18); break;
    case FontSize::Large:  _sprite.setFont(&fonts::DejaVu24); break;
    case FontSize::Giant:  _sprite.setFont(&fonts::DejaVu40); break;
  }
  _sprite.setTextSize(1);
}

void FrameBuffer::drawText(int x, int y, const char* text, FontSize size) {
  if (!text || !*text) return;
  selectFont(size);
  _sprite.setTextColor(INK);
  _sprite.setTextDatum(lgfx::top_left);
  _sprite.drawString(text, x, y);
}

void FrameBuffer::drawTextCentered(int y, const char* text, FontSize size) {
  if (!text || !*text) return;
  selectFont(size);
  _sprite.setTextColor(INK);
  _sprite.setTextDatum(lgfx::top_center);
  _sprite.drawString(text, _width / 2, y);
  _sprite.setTextDatum(lgfx::top_left);
}

int FrameBuffer::textWidth(const char* text, FontSize size) {
  selectFont(size);
  return _sprite.textWidth(text);
}

int FrameBuffer::fontHeight(FontSize size) {
  selectFont(size);
  return _sprite.fontHeight();
}

bool FrameBuffer::drawPng(const std::vector<uint8_t> &png, const Rect &dest) {
  uint32_t imgW = 0;
  uint32_t imgH = 0;
  if (!pngSize(png, imgW, imgH)) {
    RefreshLog::println("[FrameBuffer] drawPng: not a PNG");
    return false;
  }

  // Decode in 16-bit on white, then threshold into the 1-bit canvas.
  lgfx::LGFX_Sprite rgb;
  rgb.setColorDepth(lgfx::rgb565_2Byte);
  if (!rgb.createSprite(dest.w, dest.h)) {
    RefreshLog::println("[FrameBuffer] drawPng: scratch sprite alloc failed");
    return false;
  }
  rgb.fillScreen(0xFFFFu);
  float sx = static_cast<float>(dest.w) / static_cast<float>(imgW);
  float sy = static_cast<float>(dest.h) / static_cast<float>(imgH);
  bool ok = rgb.drawPng(png.data(), png.size(), 0, 0, dest.w, dest.h, 0, 0, sx, sy);
  if (!ok) {
    RefreshLog::println("[FrameBuffer] drawPng: decode failed");
    rgb.deleteSprite();
    return false;
  }

  for (int y = 0; y < dest.h; y++) {
    for (int x = 0; x < dest.w; x++) {
      uint16_t c = rgb.readPixel(x, y);
      int r = ((c >> 11) & 0x1F) << 3;
      int g = ((c >> 5) & 0x3F) << 2;
      int b = (c & 0x1F) << 3;
      int lum = (r * 299 + g * 587 + b * 114) / 1000;
      drawPixel(dest.x + x, dest.y + y, lum < INK_THRESHOLD);
    }
  }
  rgb.deleteSprite();
  return true;
}

bool FrameBuffer::isBlack(int x, int y) const {
  if (x < 0 || y < 0 || x >= _width || y >= _height) return false;
  return _sprite.readPixelValue(x, y) == INK;
}

uint32_t FrameBuffer::countInk(const Rect &r) const {
  Rect c = intersect(r, Rect(0, 0, _width, _height));
  uint32_t n = 0;
  for (int y = c.y; y < c.bottom(); y++) {
    for (int x = c.x; x < c.right(); x++) {
      if (isBlack(x, y)) n++;
    }
  }
  return n;
}

}  // namespace InkPet
