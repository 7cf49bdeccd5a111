#include "logger.h"

#include <stdio.h>

#include <atomic>
#include <mutex>

namespace {
std::mutex outMutex;
std::atomic<bool> debugOn{false};
}

namespace Logger {

void begin(bool debug) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  debugOn = debug;
}

bool debugEnabled() {
  return debugOn;
}

void print(const char* msg) {
  std::lock_guard<std::mutex> lock(outMutex);
  fputs(msg, stdout);
}

void println(const char* msg) {
  std::lock_guard<std::mutex> lock(outMutex);
  fputs(msg, stdout);
  fputc('\n', stdout);
}

void vprintf(const char* fmt, va_list args) {
  char buffer[512];
  vsnprintf(buffer, sizeof(buffer), fmt, args);
  std::lock_guard<std::mutex> lock(outMutex);
  fputs(buffer, stdout);
}

void printf(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  Logger::vprintf(fmt, args);
  va_end(args);
}

}  // namespace Logger
