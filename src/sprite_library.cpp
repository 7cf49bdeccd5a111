#include "sprite_library.h"

#include <fstream>
#include <iterator>
#include <utility>

#include "logger.h"
DEFINE_MODULE_LOGGER(AnimLog)

namespace {
const char* const BUNNY_ART[] = {
  "(\\___/)",
  "( o.o )",
  " > ^ <",
};
constexpr int BUNNY_LINE_HEIGHT = 12;
}

namespace InkPet {

SpriteLibrary::SpriteLibrary(std::string dir) : _dir(std::move(dir)) {}

const std::vector<uint8_t>& SpriteLibrary::lookup(const std::string &name) {
  auto it = _cache.find(name);
  if (it != _cache.end()) return it->second;

  std::vector<uint8_t> bytes;
  std::ifstream in(_dir + "/" + name + ".png", std::ios::binary);
  if (in.is_open()) {
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  } else {
    AnimLog::debugf("[Sprites] %s/%s.png not found\n", _dir.c_str(), name.c_str());
  }
  return _cache.emplace(name, std::move(bytes)).first->second;
}

bool SpriteLibrary::has(const std::string &frameId) {
  return !lookup(frameId).empty();
}

bool SpriteLibrary::draw(FrameBuffer &fb, const std::string &frameId, const Rect &dest) {
  const std::vector<uint8_t> &frame = lookup(frameId);
  if (!frame.empty() && fb.drawPng(frame, dest)) return true;

  size_t sep = frameId.rfind('_');
  if (sep != std::string::npos) {
    const std::vector<uint8_t> &still = lookup(frameId.substr(0, sep));
    if (!still.empty() && fb.drawPng(still, dest)) return true;
  }

  drawFallback(fb, dest);
  return false;
}

void SpriteLibrary::drawFallback(FrameBuffer &fb, const Rect &dest) {
  int y = dest.y + 5;
  for (const char* line : BUNNY_ART) {
    fb.drawText(dest.x + 4, y, line, FontSize::Small);
    y += BUNNY_LINE_HEIGHT;
  }
}

}  // namespace InkPet
