#pragma once
#include "frame_buffer.h"

namespace InkPet {

// A monochrome e-paper panel. All calls return false on a hardware error.
class Panel {
public:
  virtual ~Panel() = default;

  virtual bool begin() = 0;
  // Whole screen; also latches the content as the panel's base image.
  virtual bool fullRefresh(const FrameBuffer &fb) = 0;
  // Only the pixels inside region, diffed against the base image.
  virtual bool partialRefresh(const FrameBuffer &fb, const Rect &region) = 0;
  virtual bool sleep() = 0;
  virtual const char* name() const = 0;
};

}  // namespace InkPet
