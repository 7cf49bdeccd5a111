#include "mock_panel.h"

#include <stdio.h>

#include <fstream>
#include <utility>

#include "logger.h"
DEFINE_MODULE_LOGGER(PanelLog)

namespace InkPet {

MockPanel::MockPanel(std::string dumpPath) : _dumpPath(std::move(dumpPath)) {}

bool MockPanel::begin() {
  _asleep = false;
  PanelLog::printf("[MockEPD] init %dx%d%s%s\n", DISPLAY_WIDTH, DISPLAY_HEIGHT,
                   _dumpPath.empty() ? "" : ", dumping to ", _dumpPath.c_str());
  return true;
}

bool MockPanel::fullRefresh(const FrameBuffer &fb) {
  if (_asleep && !begin()) return false;
  _fullCount++;
  PanelLog::printf("[MockEPD] full refresh #%u\n", _fullCount);
  return dump(fb);
}

bool MockPanel::partialRefresh(const FrameBuffer &fb, const Rect &region) {
  if (_asleep && !begin()) return false;
  _partialCount++;
  PanelLog::debugf("[MockEPD] partial refresh #%u (%d,%d %dx%d)\n",
                   _partialCount, region.x, region.y, region.w, region.h);
  return dump(fb);
}

bool MockPanel::sleep() {
  _asleep = true;
  PanelLog::println("[MockEPD] sleep");
  return true;
}

bool MockPanel::dump(const FrameBuffer &fb) {
  if (_dumpPath.empty()) return true;
  std::ofstream out(_dumpPath, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    PanelLog::printf("[MockEPD] cannot write %s\n", _dumpPath.c_str());
    return false;
  }
  out << "P4\n" << fb.width() << " " << fb.height() << "\n";
  int stride = (fb.width() + 7) / 8;
  for (int y = 0; y < fb.height(); y++) {
    for (int bx = 0; bx < stride; bx++) {
      uint8_t byte = 0;
      for (int bit = 0; bit < 8; bit++) {
        int x = bx * 8 + bit;
        if (x < fb.width() && fb.isBlack(x, y)) byte |= static_cast<uint8_t>(0x80 >> bit);
      }
      out.put(static_cast<char>(byte));
    }
  }
  return out.good();
}

}  // namespace InkPet
