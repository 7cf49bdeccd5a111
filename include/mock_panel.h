#pragma once
#include <stdint.h>
#include <string>

#include "panel.h"

namespace InkPet {

// Desktop stand-in for the e-paper: logs each refresh and can dump the
// framebuffer as a PBM after every commit.
class MockPanel : public Panel {
public:
  explicit MockPanel(std::string dumpPath = std::string());

  bool begin() override;
  bool fullRefresh(const FrameBuffer &fb) override;
  bool partialRefresh(const FrameBuffer &fb, const Rect &region) override;
  bool sleep() override;
  const char* name() const override { return "mock"; }

  uint32_t fullCount() const { return _fullCount; }
  uint32_t partialCount() const { return _partialCount; }

private:
  bool dump(const FrameBuffer &fb);

  std::string _dumpPath;
  uint32_t _fullCount = 0;
  uint32_t _partialCount = 0;
  bool _asleep = false;
};

}  // namespace InkPet
