#include "clicker_device.h"
#include <SPI.h>

namespace Clicker {

// ======= Panel =======
static constexpr int16_t PANEL_W      = 240;
static constexpr int16_t PANEL_H      = 240;
static constexpr float   BLIT_SCALE   = 1.5f;   // 128x64 -> 192x96
static constexpr uint8_t DIM_FLOOR    = 24;     // below this the panel reads as off

// ---- colour helpers ----
static inline uint16_t dim565(uint16_t c, uint8_t factor) {
  uint8_t r5 = (c >> 11) & 0x1F;
  uint8_t g6 = (c >> 5)  & 0x3F;
  uint8_t b5 =  c        & 0x1F;
  uint8_t r = (r5 << 3) | (r5 >> 2);
  uint8_t g = (g6 << 2) | (g6 >> 4);
  uint8_t b = (b5 << 3) | (b5 >> 2);
  r = (uint8_t)(((uint16_t)r * factor) >> 8);
  g = (uint8_t)(((uint16_t)g * factor) >> 8);
  b = (uint8_t)(((uint16_t)b * factor) >> 8);
  return ((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3);
}

RoundTftDisplay::RoundTftDisplay(Adafruit_GC9A01A& tft)
  : tft_(tft), canvas_(Config::SCREEN_W, Config::SCREEN_H) {}

void RoundTftDisplay::begin() {
  SPI.begin(Config::PIN_TFT_SCK, -1, Config::PIN_TFT_MOSI);
  tft_.begin();
  tft_.setRotation(3);
  tft_.fillScreen(GC9A01A_BLACK);

  // 8x8 cells, cursor at the glyph's top-left
  u8g2_.begin(canvas_);
  u8g2_.setFont(u8g2_font_amstrad_cpc_extended_8f);
  u8g2_.setFontMode(1);
  u8g2_.setFontDirection(0);
  u8g2_.setFontPosTop();
  u8g2_.setForegroundColor(1);
  u8g2_.setBackgroundColor(0);
}

void RoundTftDisplay::clear() { canvas_.fillScreen(0); }

void RoundTftDisplay::drawText(const std::string& s, int16_t x, int16_t y) {
  u8g2_.drawUTF8(x, y, s.c_str());
}

void RoundTftDisplay::drawFilledRect(int16_t x, int16_t y, int16_t w, int16_t h) {
  canvas_.fillRect(x, y, w, h, 1);
}

void RoundTftDisplay::drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1) {
  canvas_.drawLine(x0, y0, x1, y1, 1);
}

void RoundTftDisplay::drawPixel(int16_t x, int16_t y) { canvas_.drawPixel(x, y, 1); }

void RoundTftDisplay::setBrightness(uint8_t level) {
  if (level < DIM_FLOOR) level = DIM_FLOOR;
  fg_ = (level >= 255) ? GC9A01A_WHITE : dim565(GC9A01A_WHITE, level);
  blitScaled();
}

void RoundTftDisplay::present() { blitScaled(); }

// ---- blitter (nearest, centered) ----
void RoundTftDisplay::blitScaled() {
  const int dstW  = int(Config::SCREEN_W * BLIT_SCALE + 0.5f);
  const int dstH  = int(Config::SCREEN_H * BLIT_SCALE + 0.5f);
  const int dstX0 = (PANEL_W - dstW) / 2;
  const int dstY0 = (PANEL_H - dstH) / 2;

  static uint16_t row[PANEL_W];

  tft_.startWrite();
  for (int dy = 0; dy < dstH; ++dy) {
    int sy = int(dy / BLIT_SCALE); if (sy >= Config::SCREEN_H) sy = Config::SCREEN_H - 1;
    for (int dx = 0; dx < dstW; ++dx) {
      int sx = int(dx / BLIT_SCALE); if (sx >= Config::SCREEN_W) sx = Config::SCREEN_W - 1;
      row[dx] = canvas_.getPixel(sx, sy) ? fg_ : GC9A01A_BLACK;
    }
    tft_.setAddrWindow(dstX0, dstY0 + dy, dstW, 1);
    tft_.writePixels(row, dstW);
  }
  tft_.endWrite();
}

} // namespace Clicker
