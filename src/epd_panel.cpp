#include "epd_panel.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>

#include "logger.h"
#include "platform.h"
DEFINE_MODULE_LOGGER(PanelLog)

namespace {
constexpr uint8_t CMD_DRIVER_OUTPUT   = 0x01;
constexpr uint8_t CMD_DEEP_SLEEP      = 0x10;
constexpr uint8_t CMD_DATA_ENTRY      = 0x11;
constexpr uint8_t CMD_SW_RESET        = 0x12;
constexpr uint8_t CMD_TEMP_SENSOR     = 0x18;
constexpr uint8_t CMD_ACTIVATE        = 0x20;
constexpr uint8_t CMD_UPDATE_CTRL1    = 0x21;
constexpr uint8_t CMD_UPDATE_CTRL2    = 0x22;
constexpr uint8_t CMD_WRITE_RAM_BW    = 0x24;
constexpr uint8_t CMD_WRITE_RAM_OLD   = 0x26;
constexpr uint8_t CMD_BORDER          = 0x3C;
constexpr uint8_t CMD_RAM_X_RANGE     = 0x44;
constexpr uint8_t CMD_RAM_Y_RANGE     = 0x45;
constexpr uint8_t CMD_RAM_X_COUNTER   = 0x4E;
constexpr uint8_t CMD_RAM_Y_COUNTER   = 0x4F;

constexpr uint8_t UPDATE_FULL    = 0xF7;
constexpr uint8_t UPDATE_PARTIAL = 0xFF;

constexpr int ROW_BYTES = (EPD_NATIVE_WIDTH + 7) / 8;   // 16
constexpr size_t SPI_CHUNK = 4096;
}

namespace InkPet {

EpdPanel::EpdPanel() : EpdPanel(Config()) {}

EpdPanel::EpdPanel(const Config &cfg) : _cfg(cfg) {
  _native.assign(static_cast<size_t>(ROW_BYTES) * EPD_NATIVE_HEIGHT, 0xFF);
}

EpdPanel::~EpdPanel() {
  if (_spiFd >= 0) close(_spiFd);
}

bool EpdPanel::openBus() {
  if (_spiFd >= 0) return true;

  _spiFd = open(_cfg.spiDevice, O_RDWR | O_CLOEXEC);
  if (_spiFd < 0) {
    PanelLog::printf("[EPD] open %s failed: %s\n", _cfg.spiDevice, strerror(errno));
    return false;
  }
  uint8_t mode = SPI_MODE_0;
  uint8_t bits = 8;
  uint32_t speed = _cfg.spiSpeedHz;
  if (ioctl(_spiFd, SPI_IOC_WR_MODE, &mode) < 0 ||
      ioctl(_spiFd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
      ioctl(_spiFd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
    PanelLog::printf("[EPD] spidev setup failed: %s\n", strerror(errno));
    close(_spiFd);
    _spiFd = -1;
    return false;
  }

  if (!_rst.requestOutput(_cfg.gpioChip, _cfg.pinRst, 1, "epd-rst")) return false;
  if (!_dc.requestOutput(_cfg.gpioChip, _cfg.pinDc, 0, "epd-dc")) return false;
  if (!_busy.requestInput(_cfg.gpioChip, _cfg.pinBusy, "epd-busy")) return false;
  if (_cfg.pinPwr >= 0 && !_pwr.requestOutput(_cfg.gpioChip, _cfg.pinPwr, 1, "epd-pwr")) {
    return false;
  }
  return true;
}

bool EpdPanel::hardwareReset(uint32_t lowMs) {
  if (!_rst.set(1)) return false;
  Platform::delay(20);
  if (!_rst.set(0)) return false;
  Platform::delay(lowMs);
  if (!_rst.set(1)) return false;
  Platform::delay(20);
  return true;
}

bool EpdPanel::waitBusy(const char* what) {
  uint32_t start = Platform::millis();
  int level = 1;
  while (true) {
    if (!_busy.get(level)) return false;
    if (level == 0) return true;
    if (Platform::millis() - start > _cfg.busyTimeoutMs) {
      PanelLog::printf("[EPD] BUSY timeout after %ums (%s)\n", _cfg.busyTimeoutMs, what);
      return false;
    }
    Platform::delay(5);
  }
}

bool EpdPanel::command(uint8_t cmd) {
  if (!_dc.set(0)) return false;
  struct spi_ioc_transfer xfer;
  memset(&xfer, 0, sizeof(xfer));
  xfer.tx_buf = reinterpret_cast<uintptr_t>(&cmd);
  xfer.len = 1;
  xfer.speed_hz = _cfg.spiSpeedHz;
  xfer.bits_per_word = 8;
  if (ioctl(_spiFd, SPI_IOC_MESSAGE(1), &xfer) < 0) {
    PanelLog::printf("[EPD] command 0x%02X failed: %s\n", cmd, strerror(errno));
    return false;
  }
  return true;
}

bool EpdPanel::data(const uint8_t* buf, size_t len) {
  if (!_dc.set(1)) return false;
  size_t off = 0;
  while (off < len) {
    size_t n = std::min(SPI_CHUNK, len - off);
    struct spi_ioc_transfer xfer;
    memset(&xfer, 0, sizeof(xfer));
    xfer.tx_buf = reinterpret_cast<uintptr_t>(buf + off);
    xfer.len = static_cast<uint32_t>(n);
    xfer.speed_hz = _cfg.spiSpeedHz;
    xfer.bits_per_word = 8;
    if (ioctl(_spiFd, SPI_IOC_MESSAGE(1), &xfer) < 0) {
      PanelLog::printf("[EPD] data write failed: %s\n", strerror(errno));
      return false;
    }
    off += n;
  }
  return true;
}

bool EpdPanel::command(uint8_t cmd, std::initializer_list<uint8_t> args) {
  if (!command(cmd)) return false;
  for (uint8_t b : args) {
    if (!data(b)) return false;
  }
  return true;
}

bool EpdPanel::setWindow(int xByteStart, int xByteEnd, int yStart, int yEnd) {
  return command(CMD_RAM_X_RANGE, {static_cast<uint8_t>(xByteStart), static_cast<uint8_t>(xByteEnd)}) &&
         command(CMD_RAM_Y_RANGE, {static_cast<uint8_t>(yStart & 0xFF), static_cast<uint8_t>(yStart >> 8),
                                   static_cast<uint8_t>(yEnd & 0xFF), static_cast<uint8_t>(yEnd >> 8)});
}

bool EpdPanel::setCursor(int xByte, int y) {
  return command(CMD_RAM_X_COUNTER, {static_cast<uint8_t>(xByte)}) &&
         command(CMD_RAM_Y_COUNTER, {static_cast<uint8_t>(y & 0xFF), static_cast<uint8_t>(y >> 8)});
}

bool EpdPanel::activate(uint8_t mode, const char* what) {
  return command(CMD_UPDATE_CTRL2, {mode}) && command(CMD_ACTIVATE) && waitBusy(what);
}

bool EpdPanel::initController() {
  constexpr uint8_t lastGate = EPD_NATIVE_HEIGHT - 1;
  bool ok = hardwareReset(2) &&
            waitBusy("reset") &&
            command(CMD_SW_RESET) &&
            waitBusy("swreset") &&
            command(CMD_DRIVER_OUTPUT, {lastGate, 0x00, 0x00}) &&
            command(CMD_DATA_ENTRY, {0x03}) &&
            setWindow(0, ROW_BYTES - 1, 0, EPD_NATIVE_HEIGHT - 1) &&
            setCursor(0, 0) &&
            command(CMD_BORDER, {0x05}) &&
            command(CMD_UPDATE_CTRL1, {0x00, 0x80}) &&
            command(CMD_TEMP_SENSOR, {0x80}) &&
            waitBusy("init");
  if (!ok) {
    PanelLog::println("[EPD] controller init failed");
    return false;
  }
  _initialized = true;
  _asleep = false;
  return true;
}

bool EpdPanel::begin() {
  if (!openBus()) {
    PanelLog::println("[EPD] begin() failed: bus/GPIO unavailable");
    return false;
  }
  if (!initController()) return false;
  PanelLog::printf("[EPD] begin() OK (%s @ %u Hz)\n", _cfg.spiDevice, _cfg.spiSpeedHz);
  return true;
}

void EpdPanel::packNative(const FrameBuffer &fb) {
  std::fill(_native.begin(), _native.end(), 0xFF);
  for (int x = 0; x < fb.width() && x < EPD_NATIVE_HEIGHT; x++) {
    int ny = EPD_NATIVE_HEIGHT - 1 - x;
    uint8_t* row = &_native[static_cast<size_t>(ny) * ROW_BYTES];
    for (int y = 0; y < fb.height() && y < EPD_NATIVE_WIDTH; y++) {
      if (fb.isBlack(x, y)) row[y >> 3] &= static_cast<uint8_t>(~(0x80 >> (y & 7)));
    }
  }
}

bool EpdPanel::fullRefresh(const FrameBuffer &fb) {
  if (!_initialized || _asleep) {
    if (!initController()) return false;
  }
  packNative(fb);

  bool ok = command(CMD_BORDER, {0x05}) &&
            setWindow(0, ROW_BYTES - 1, 0, EPD_NATIVE_HEIGHT - 1) &&
            setCursor(0, 0) &&
            command(CMD_WRITE_RAM_BW) && data(_native.data(), _native.size()) &&
            setCursor(0, 0) &&
            command(CMD_WRITE_RAM_OLD) && data(_native.data(), _native.size()) &&
            activate(UPDATE_FULL, "full refresh");
  if (!ok) {
    PanelLog::println("[EPD] full refresh failed");
    _initialized = false;
  }
  return ok;
}

bool EpdPanel::partialRefresh(const FrameBuffer &fb, const Rect &region) {
  if (!_initialized || _asleep) {
    PanelLog::println("[EPD] partial refresh without initialized base image");
    return false;
  }
  Rect r = intersect(region, Rect(0, 0, fb.width(), fb.height()));
  if (r.empty()) return true;
  packNative(fb);

  // Native window: x in bytes along the landscape y axis.
  int xb0 = r.y >> 3;
  int xb1 = (r.bottom() - 1) >> 3;
  int ny0 = EPD_NATIVE_HEIGHT - r.right();
  int ny1 = EPD_NATIVE_HEIGHT - 1 - r.x;

  bool ok = hardwareReset(1) &&
            command(CMD_BORDER, {0x80}) &&
            command(CMD_DRIVER_OUTPUT, {static_cast<uint8_t>(EPD_NATIVE_HEIGHT - 1), 0x00, 0x00}) &&
            command(CMD_DATA_ENTRY, {0x03}) &&
            setWindow(xb0, xb1, ny0, ny1) &&
            setCursor(xb0, ny0) &&
            command(CMD_WRITE_RAM_BW);
  for (int ny = ny0; ok && ny <= ny1; ny++) {
    const uint8_t* row = &_native[static_cast<size_t>(ny) * ROW_BYTES];
    ok = data(row + xb0, static_cast<size_t>(xb1 - xb0 + 1));
  }
  ok = ok && activate(UPDATE_PARTIAL, "partial refresh");
  if (!ok) {
    PanelLog::printf("[EPD] partial refresh failed (%d,%d %dx%d)\n", r.x, r.y, r.w, r.h);
    _initialized = false;
  }
  return ok;
}

bool EpdPanel::sleep() {
  if (!_initialized || _asleep) return true;
  if (!command(CMD_DEEP_SLEEP, {0x01})) return false;
  Platform::delay(100);
  _asleep = true;
  PanelLog::println("[EPD] deep sleep");
  return true;
}

}  // namespace InkPet
