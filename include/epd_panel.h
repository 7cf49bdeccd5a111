#pragma once
#include <stddef.h>
#include <stdint.h>
#include <initializer_list>
#include <vector>

#include "gpio_line.h"
#include "panel.h"
#include "panel_pins.h"

namespace InkPet {

// Waveshare 2.13" V4 (SSD1680) over spidev + GPIO chardev.
// The controller is portrait 122x250; landscape pixel (x, y) maps to
// native (y, 249 - x).
class EpdPanel : public Panel {
public:
  struct Config {
    const char* spiDevice   = EPD_SPI_DEVICE;
    const char* gpioChip    = GPIO_CHIP_PATH;
    int      pinRst         = PIN_EPD_RST;
    int      pinDc          = PIN_EPD_DC;
    int      pinBusy        = PIN_EPD_BUSY;
    int      pinPwr         = PIN_EPD_PWR;
    uint32_t spiSpeedHz     = EPD_SPI_SPEED_HZ;
    uint32_t busyTimeoutMs  = 10000;
  };

  EpdPanel();
  explicit EpdPanel(const Config &cfg);
  ~EpdPanel() override;

  bool begin() override;
  bool fullRefresh(const FrameBuffer &fb) override;
  bool partialRefresh(const FrameBuffer &fb, const Rect &region) override;
  bool sleep() override;
  const char* name() const override { return "ssd1680"; }

private:
  bool openBus();
  bool hardwareReset(uint32_t lowMs);
  bool initController();
  bool waitBusy(const char* what);
  bool command(uint8_t cmd);
  bool data(const uint8_t* buf, size_t len);
  bool data(uint8_t b) { return data(&b, 1); }
  bool command(uint8_t cmd, std::initializer_list<uint8_t> args);
  bool setWindow(int xByteStart, int xByteEnd, int yStart, int yEnd);
  bool setCursor(int xByte, int y);
  bool activate(uint8_t mode, const char* what);

  // Packs the whole framebuffer into native row-major bytes (1 = white).
  void packNative(const FrameBuffer &fb);

  Config _cfg;
  int _spiFd = -1;
  GpioLine _rst;
  GpioLine _dc;
  GpioLine _busy;
  GpioLine _pwr;
  bool _initialized = false;
  bool _asleep = false;
  std::vector<uint8_t> _native;
};

}  // namespace InkPet
