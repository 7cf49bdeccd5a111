#include "gpio_line.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/gpio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "logger.h"
DEFINE_MODULE_LOGGER(GpioLog)

namespace {

int openChip(const char* chipPath) {
  int fd = open(chipPath, O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    GpioLog::printf("[GPIO] open %s failed: %s\n", chipPath, strerror(errno));
  }
  return fd;
}

void copyLabel(char* dst, size_t len, const char* label) {
  strncpy(dst, label ? label : "inkpet", len - 1);
  dst[len - 1] = '\0';
}

}  // namespace

GpioLine::~GpioLine() {
  release();
}

GpioLine::GpioLine(GpioLine &&other) noexcept : _fd(other._fd), _offset(other._offset) {
  other._fd = -1;
  other._offset = -1;
}

GpioLine& GpioLine::operator=(GpioLine &&other) noexcept {
  if (this != &other) {
    release();
    _fd = other._fd;
    _offset = other._offset;
    other._fd = -1;
    other._offset = -1;
  }
  return *this;
}

void GpioLine::release() {
  if (_fd >= 0) close(_fd);
  _fd = -1;
}

bool GpioLine::requestOutput(const char* chipPath, int offset, int initial, const char* label) {
  release();
  int chip = openChip(chipPath);
  if (chip < 0) return false;

  struct gpiohandle_request req;
  memset(&req, 0, sizeof(req));
  req.lineoffsets[0] = static_cast<__u32>(offset);
  req.flags = GPIOHANDLE_REQUEST_OUTPUT;
  req.default_values[0] = static_cast<__u8>(initial ? 1 : 0);
  req.lines = 1;
  copyLabel(req.consumer_label, sizeof(req.consumer_label), label);

  int rc = ioctl(chip, GPIO_GET_LINEHANDLE_IOCTL, &req);
  int err = errno;
  close(chip);
  if (rc < 0) {
    GpioLog::printf("[GPIO] output request on line %d failed: %s\n", offset, strerror(err));
    return false;
  }
  _fd = req.fd;
  _offset = offset;
  return true;
}

bool GpioLine::requestInput(const char* chipPath, int offset, const char* label) {
  release();
  int chip = openChip(chipPath);
  if (chip < 0) return false;

  struct gpiohandle_request req;
  memset(&req, 0, sizeof(req));
  req.lineoffsets[0] = static_cast<__u32>(offset);
  req.flags = GPIOHANDLE_REQUEST_INPUT;
  req.lines = 1;
  copyLabel(req.consumer_label, sizeof(req.consumer_label), label);

  int rc = ioctl(chip, GPIO_GET_LINEHANDLE_IOCTL, &req);
  int err = errno;
  close(chip);
  if (rc < 0) {
    GpioLog::printf("[GPIO] input request on line %d failed: %s\n", offset, strerror(err));
    return false;
  }
  _fd = req.fd;
  _offset = offset;
  return true;
}

bool GpioLine::requestEdges(const char* chipPath, int offset, const char* label) {
  release();
  int chip = openChip(chipPath);
  if (chip < 0) return false;

  struct gpioevent_request req;
  memset(&req, 0, sizeof(req));
  req.lineoffset = static_cast<__u32>(offset);
  req.handleflags = GPIOHANDLE_REQUEST_INPUT | GPIOHANDLE_REQUEST_BIAS_PULL_UP;
  req.eventflags = GPIOEVENT_REQUEST_BOTH_EDGES;
  copyLabel(req.consumer_label, sizeof(req.consumer_label), label);

  int rc = ioctl(chip, GPIO_GET_LINEEVENT_IOCTL, &req);
  int err = errno;
  close(chip);
  if (rc < 0) {
    GpioLog::printf("[GPIO] edge request on line %d failed: %s\n", offset, strerror(err));
    return false;
  }
  _fd = req.fd;
  _offset = offset;
  return true;
}

bool GpioLine::set(int value) {
  if (_fd < 0) return false;
  struct gpiohandle_data data;
  memset(&data, 0, sizeof(data));
  data.values[0] = static_cast<__u8>(value ? 1 : 0);
  if (ioctl(_fd, GPIOHANDLE_SET_LINE_VALUES_IOCTL, &data) < 0) {
    GpioLog::printf("[GPIO] set line %d failed: %s\n", _offset, strerror(errno));
    return false;
  }
  return true;
}

bool GpioLine::get(int &value) const {
  if (_fd < 0) return false;
  struct gpiohandle_data data;
  memset(&data, 0, sizeof(data));
  if (ioctl(_fd, GPIOHANDLE_GET_LINE_VALUES_IOCTL, &data) < 0) {
    GpioLog::printf("[GPIO] get line %d failed: %s\n", _offset, strerror(errno));
    return false;
  }
  value = data.values[0];
  return true;
}

bool GpioLine::readEdge(bool &rising, uint64_t &timestampNs) {
  if (_fd < 0) return false;
  struct gpioevent_data ev;
  ssize_t n = read(_fd, &ev, sizeof(ev));
  if (n != static_cast<ssize_t>(sizeof(ev))) {
    GpioLog::printf("[GPIO] short event read on line %d\n", _offset);
    return false;
  }
  rising = (ev.id == GPIOEVENT_EVENT_RISING_EDGE);
  timestampNs = ev.timestamp;
  return true;
}
