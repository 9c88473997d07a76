// activity_monitor.h
// Idle tracking for display dimming.

#pragma once
#include <stdint.h>
#include "clicker_config.h"

namespace Clicker {

class ActivityMonitor {
public:
  explicit ActivityMonitor(uint32_t dimTimeoutMs = Config::DIM_TIMEOUT_MS)
    : timeoutMs_(dimTimeoutMs) {}

  void begin(uint32_t now) { lastActivity_ = now; dimmed_ = false; }

  // Any input or new message/animation. True if the display must wake.
  bool touch(uint32_t now);
  // True exactly once when the idle timeout passes.
  bool update(uint32_t now);

  bool dimmed() const { return dimmed_; }
  uint32_t lastActivity() const { return lastActivity_; }

private:
  uint32_t timeoutMs_;
  uint32_t lastActivity_ = 0;
  bool     dimmed_ = false;
};

} // namespace Clicker
