// message_scheduler.h
// The transient two-line message under the counter: wrap, scroll, expiry.

#pragma once
#include <stdint.h>
#include <string>
#include "clicker_config.h"

namespace Clicker {

struct WrappedText {
  std::string line1;
  std::string line2;
};

std::string trimCopy(const std::string& s);

// The display font is 8-bit; each non-ASCII UTF-8 sequence becomes one '?'.
std::string foldToAscii(const std::string& s);

// Breaks at the last space inside the first `width` chars (hard break at
// `width` when there is none). line2 is left unbounded; it scrolls.
WrappedText wordWrap(const std::string& msg, size_t width = Config::MSG_WIDTH_CHARS);

class MessageScheduler {
public:
  // Replaces whatever is showing. Text is folded to ASCII first.
  void show(const std::string& text, uint32_t now, uint32_t durationMs = Config::MSG_DEFAULT_MS);
  void clear();

  // Expiry and scroll. True when the visible text changed.
  bool update(uint32_t now);

  bool active() const { return active_; }
  const std::string& text() const { return text_; }
  const std::string& line1() const { return wrapped_.line1; }
  const std::string& line2() const { return wrapped_.line2; }
  bool scrolling() const;
  size_t scrollOffset() const { return scrollOffset_; }
  uint32_t expiresAt() const { return expiresAt_; }

  // Fixed-width window over line2 (whole line when it fits).
  std::string visibleLine2() const;

private:
  std::string text_;
  WrappedText wrapped_;
  bool     active_ = false;
  uint32_t expiresAt_ = 0;
  size_t   scrollOffset_ = 0;
  uint32_t lastScroll_ = 0;
};

} // namespace Clicker
