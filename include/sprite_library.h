#pragma once
#include <stdint.h>
#include <map>
#include <string>
#include <vector>

#include "frame_buffer.h"

namespace InkPet {

// Pet sprites from <dir>/<frame>.png, falling back to <dir>/<prefix>.png
// and then to a drawn ASCII bunny. Files are read once and cached.
class SpriteLibrary {
public:
  explicit SpriteLibrary(std::string dir);

  // Draws frameId ("neutral_3") scaled into dest. Always draws something;
  // returns false when the ASCII fallback was used.
  bool draw(FrameBuffer &fb, const std::string &frameId, const Rect &dest);
  bool has(const std::string &frameId);

  static void drawFallback(FrameBuffer &fb, const Rect &dest);

private:
  const std::vector<uint8_t>& lookup(const std::string &name);

  std::string _dir;
  std::map<std::string, std::vector<uint8_t>> _cache;
};

}  // namespace InkPet
