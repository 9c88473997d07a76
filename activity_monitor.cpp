#include "activity_monitor.h"

namespace Clicker {

bool ActivityMonitor::touch(uint32_t now) {
  lastActivity_ = now;
  if (!dimmed_) return false;
  dimmed_ = false;
  return true;
}

bool ActivityMonitor::update(uint32_t now) {
  if (dimmed_) return false;
  if (now - lastActivity_ < timeoutMs_) return false;
  dimmed_ = true;
  return true;
}

} // namespace Clicker
