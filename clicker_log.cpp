#include "clicker_log.h"
#include <stdarg.h>
#include <stdio.h>

namespace Clicker {
namespace Log {

static constexpr size_t LINE_MAX = 160;

static Sink sink = nullptr;
static bool DEBUG_PRINT = false;

static void emit(const char* fmt, va_list args) {
  char line[LINE_MAX];
  vsnprintf(line, sizeof(line), fmt, args);
  sink(line);
}

void setSink(Sink s) { sink = s; }
void setDebug(bool enabled) { DEBUG_PRINT = enabled; }
bool debugEnabled() { return DEBUG_PRINT; }

void info(const char* fmt, ...) {
  if (!sink) return;
  va_list args;
  va_start(args, fmt);
  emit(fmt, args);
  va_end(args);
}

void debug(const char* fmt, ...) {
  if (!sink || !DEBUG_PRINT) return;
  va_list args;
  va_start(args, fmt);
  emit(fmt, args);
  va_end(args);
}

} // namespace Log
} // namespace Clicker
