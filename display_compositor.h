// display_compositor.h
// Decides what goes on screen each tick; the Display draws it.

#pragma once
#include <stdint.h>
#include "clicker_hal.h"

namespace Clicker {

class MessageScheduler;
class AnimationEngine;

static constexpr const char* TITLE_TEXT = "CLICK COUNTER";
static constexpr const char* STATS_TEXT = "HIGH SCORE";
static constexpr int LARGE_DIGIT_SCALE = 3;

// -------- Big digits (3x5 bitmap font, scaled) --------
inline int largeDigitAdvance(int scale) { return 3 * scale + 2; }
// Returns the advance, 0 for a non-digit.
int drawLargeDigit(Display& d, char digit, int16_t x, int16_t y, int scale = LARGE_DIGIT_SCALE);
// Centred horizontally.
void drawLargeNumber(Display& d, uint32_t value, int16_t y);
// Title text plus the separator under it.
void drawHeader(Display& d, const char* title, int16_t x = 10);

struct Scene {
  uint32_t count;
  uint32_t highScore;
  bool     stats;          // reset held: high score screen
  const MessageScheduler& message;
  const AnimationEngine&  animation;
};

class DisplayCompositor {
public:
  explicit DisplayCompositor(Display& display) : display_(display) {}

  void invalidate() { dirty_ = true; }

  // Draws and presents a frame only when something changed since the last.
  bool render(const Scene& scene);

  uint32_t framesPresented() const { return frames_; }

private:
  void drawNormal(const Scene& scene);
  void drawStats(const Scene& scene);
  void drawMessage(const MessageScheduler& msg);

  Display& display_;
  bool dirty_ = true;
  uint32_t frames_ = 0;
};

} // namespace Clicker
