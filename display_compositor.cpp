#include "display_compositor.h"
#include "animation_engine.h"
#include "clicker_config.h"
#include "message_scheduler.h"
#include <stdio.h>
#include <string.h>

namespace Clicker {

// ======= Layout =======
static constexpr int16_t HEADER_RULE_Y  = 14;
static constexpr int16_t COUNT_Y        = 24;
static constexpr int16_t STATS_Y        = 28;
static constexpr int16_t MSG_RULE_Y     = 44;
static constexpr int16_t MSG_LINE1_Y    = 48;
static constexpr int16_t MSG_LINE2_Y    = 56;

// 3x5 patterns, one row per entry, MSB is the left column
static const uint8_t DIGIT_PATTERNS[10][5] = {
  {0b111, 0b101, 0b101, 0b101, 0b111},  // 0
  {0b010, 0b110, 0b010, 0b010, 0b111},  // 1
  {0b111, 0b001, 0b111, 0b100, 0b111},  // 2
  {0b111, 0b001, 0b111, 0b001, 0b111},  // 3
  {0b101, 0b101, 0b111, 0b001, 0b001},  // 4
  {0b111, 0b100, 0b111, 0b001, 0b111},  // 5
  {0b111, 0b100, 0b111, 0b101, 0b111},  // 6
  {0b111, 0b001, 0b001, 0b001, 0b001},  // 7
  {0b111, 0b101, 0b111, 0b101, 0b111},  // 8
  {0b111, 0b101, 0b111, 0b001, 0b111},  // 9
};

int drawLargeDigit(Display& d, char digit, int16_t x, int16_t y, int scale) {
  if (digit < '0' || digit > '9') return 0;
  const uint8_t* rows = DIGIT_PATTERNS[digit - '0'];
  for (int r = 0; r < 5; ++r) {
    for (int c = 0; c < 3; ++c) {
      if (rows[r] & (1 << (2 - c))) {
        d.drawFilledRect(x + c * scale, y + r * scale, scale, scale);
      }
    }
  }
  return largeDigitAdvance(scale);
}

void drawLargeNumber(Display& d, uint32_t value, int16_t y) {
  char buf[12];
  snprintf(buf, sizeof(buf), "%lu", (unsigned long)value);
  const int len = (int)strlen(buf);
  const int advance = largeDigitAdvance(LARGE_DIGIT_SCALE);
  int x = (Config::SCREEN_W - (len * advance - 2)) / 2;
  for (int i = 0; i < len; ++i) x += drawLargeDigit(d, buf[i], (int16_t)x, y);
}

void drawHeader(Display& d, const char* title, int16_t x) {
  d.drawText(title, x, 2);
  d.drawLine(0, HEADER_RULE_Y, 127, HEADER_RULE_Y);
}

// ===============================
// Compositor
// ===============================
bool DisplayCompositor::render(const Scene& scene) {
  if (!dirty_) return false;
  dirty_ = false;

  if (scene.animation.spectacleActive()) {
    scene.animation.drawSpectacle(display_);   // presents itself
  } else if (scene.stats) {
    drawStats(scene);
    display_.present();
  } else {
    drawNormal(scene);
    display_.present();
  }
  ++frames_;
  return true;
}

void DisplayCompositor::drawStats(const Scene& scene) {
  display_.clear();
  drawHeader(display_, STATS_TEXT, 24);
  drawLargeNumber(display_, scene.highScore, STATS_Y);
}

void DisplayCompositor::drawNormal(const Scene& scene) {
  display_.clear();
  drawHeader(display_, TITLE_TEXT);
  drawLargeNumber(display_, scene.count, COUNT_Y);

  for (const ConfettiParticle& p : scene.animation.confetti()) {
    if (p.y >= 0 && p.y < Config::SCREEN_H && p.x >= 0 && p.x < Config::SCREEN_W) {
      display_.drawFilledRect(p.x, p.y, 3, 2);
    }
  }

  if (scene.message.active()) drawMessage(scene.message);
}

void DisplayCompositor::drawMessage(const MessageScheduler& msg) {
  display_.drawLine(0, MSG_RULE_Y, 127, MSG_RULE_Y);

  const int cellW = Config::GLYPH_W;
  if (!msg.line1().empty()) {
    int x1 = (Config::SCREEN_W - (int)msg.line1().size() * cellW) / 2;
    display_.drawText(msg.line1(), (int16_t)(x1 < 0 ? 0 : x1), MSG_LINE1_Y);
  }

  if (!msg.line2().empty()) {
    if (msg.scrolling()) {
      display_.drawText(msg.visibleLine2(), 0, MSG_LINE2_Y);
    } else {
      int x2 = (Config::SCREEN_W - (int)msg.line2().size() * cellW) / 2;
      display_.drawText(msg.line2(), (int16_t)(x2 < 0 ? 0 : x2), MSG_LINE2_Y);
    }
  }
}

} // namespace Clicker
