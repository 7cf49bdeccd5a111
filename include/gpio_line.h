#ifndef GPIO_LINE_H
#define GPIO_LINE_H

#include <stdint.h>

// One GPIO line through the Linux character device (v1 ABI).
// Owns the line fd; released on destruction.
class GpioLine {
public:
  GpioLine() = default;
  ~GpioLine();

  GpioLine(const GpioLine&) = delete;
  GpioLine& operator=(const GpioLine&) = delete;
  GpioLine(GpioLine &&other) noexcept;
  GpioLine& operator=(GpioLine &&other) noexcept;

  // Returns true if successful
  bool requestOutput(const char* chipPath, int offset, int initial, const char* label);
  bool requestInput(const char* chipPath, int offset, const char* label);
  // Input with pull-up, reporting both edges
  bool requestEdges(const char* chipPath, int offset, const char* label);

  bool set(int value);
  bool get(int &value) const;

  // Reads one queued edge; call after poll() reports fd() readable.
  bool readEdge(bool &rising, uint64_t &timestampNs);

  int fd() const { return _fd; }
  bool valid() const { return _fd >= 0; }
  int offset() const { return _offset; }
  void release();

private:
  int _fd = -1;
  int _offset = -1;
};

#endif  // GPIO_LINE_H
