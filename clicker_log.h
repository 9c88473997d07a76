// clicker_log.h
// printf-style logging routed to whatever sink the sketch installs (Serial).

#pragma once

namespace Clicker {
namespace Log {

typedef void (*Sink)(const char* line);

void setSink(Sink sink);
void setDebug(bool enabled);
bool debugEnabled();

// Always forwarded to the sink.
void info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
// Only while debug is on.
void debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace Log
} // namespace Clicker
