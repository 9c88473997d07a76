// clicker_device.h
// Arduino side of the Display / ButtonInput collaborators: the 128x64 1-bit
// canvas blitted onto the round GC9A01A, and the two pull-up buttons.

#pragma once
#include <Arduino.h>
#include <Adafruit_GFX.h>
#include <Adafruit_GC9A01A.h>
#include <U8g2_for_Adafruit_GFX.h>
#include "clicker_config.h"
#include "clicker_hal.h"

namespace Clicker {

class RoundTftDisplay : public Display {
public:
  explicit RoundTftDisplay(Adafruit_GC9A01A& tft);

  // SPI + panel init, binds the text renderer to the canvas.
  void begin();

  void clear() override;
  void drawText(const std::string& s, int16_t x, int16_t y) override;
  void drawFilledRect(int16_t x, int16_t y, int16_t w, int16_t h) override;
  void drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1) override;
  void drawPixel(int16_t x, int16_t y) override;
  void setBrightness(uint8_t level) override;
  void present() override;

private:
  void blitScaled();

  Adafruit_GC9A01A&     tft_;
  GFXcanvas1            canvas_;
  U8G2_FOR_ADAFRUIT_GFX u8g2_;
  uint16_t              fg_ = GC9A01A_WHITE;   // foreground after dimming
};

class PullupButton : public ButtonInput {
public:
  explicit PullupButton(uint8_t pin) : pin_(pin) {}
  void begin() { pinMode(pin_, INPUT_PULLUP); }
  Level readLevel() override {
    return digitalRead(pin_) == LOW ? Level::PRESSED : Level::RELEASED;
  }

private:
  uint8_t pin_;
};

} // namespace Clicker
