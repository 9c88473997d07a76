#include "message_scheduler.h"

namespace Clicker {

std::string trimCopy(const std::string& s) {
  static const char* WS = " \t\r\n";
  const size_t first = s.find_first_not_of(WS);
  if (first == std::string::npos) return std::string();
  const size_t last = s.find_last_not_of(WS);
  return s.substr(first, last - first + 1);
}

std::string foldToAscii(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    const unsigned char c = (unsigned char)s[i++];
    if (c < 0x80) { out += (char)c; continue; }
    out += '?';
    // swallow the continuation bytes of a lead byte
    if (c >= 0xC0) {
      while (i < s.size() && ((unsigned char)s[i] & 0xC0) == 0x80) ++i;
    }
  }
  return out;
}

WrappedText wordWrap(const std::string& msg, size_t width) {
  WrappedText w;
  if (msg.size() <= width) {
    w.line1 = msg;
    return w;
  }

  size_t breakPoint = width;
  for (size_t i = width; i > 0; --i) {
    if (msg[i - 1] == ' ') { breakPoint = i - 1; break; }
  }
  w.line1 = trimCopy(msg.substr(0, breakPoint));
  w.line2 = trimCopy(msg.substr(breakPoint));
  return w;
}

void MessageScheduler::show(const std::string& text, uint32_t now, uint32_t durationMs) {
  text_ = foldToAscii(text);
  wrapped_ = wordWrap(text_);
  active_ = true;
  scrollOffset_ = 0;
  lastScroll_ = now;
  expiresAt_ = now + durationMs;
}

void MessageScheduler::clear() {
  active_ = false;
  text_.clear();
  wrapped_ = WrappedText();
  scrollOffset_ = 0;
}

bool MessageScheduler::scrolling() const {
  return active_ && wrapped_.line2.size() > Config::MSG_WIDTH_CHARS;
}

bool MessageScheduler::update(uint32_t now) {
  if (!active_) return false;

  // signed difference survives millis() wrap
  if ((int32_t)(now - expiresAt_) > 0) {
    clear();
    return true;
  }

  if (scrolling() && (now - lastScroll_) >= Config::MSG_SCROLL_MS) {
    lastScroll_ = now;
    ++scrollOffset_;
    if (scrollOffset_ >= wrapped_.line2.size() + Config::MSG_SCROLL_PAD) scrollOffset_ = 0;
    return true;
  }
  return false;
}

std::string MessageScheduler::visibleLine2() const {
  if (!scrolling()) return wrapped_.line2;
  const std::string loop = wrapped_.line2 + std::string(Config::MSG_SCROLL_PAD, ' ') + wrapped_.line2;
  return loop.substr(scrollOffset_, Config::MSG_WIDTH_CHARS);
}

} // namespace Clicker
