// clicker_hal.h
// Collaborators the counter engine talks to. The sketch wires real hardware
// behind these (see clicker_device.h); tests use fakes.

#pragma once
#include <stdint.h>
#include <string>
#include <vector>

namespace Clicker {

// 128x64 logical canvas, 1-bit. Drawing outside the canvas is clipped.
class Display {
public:
  virtual ~Display() {}
  virtual void clear() = 0;
  virtual void drawText(const std::string& s, int16_t x, int16_t y) = 0;
  virtual void drawFilledRect(int16_t x, int16_t y, int16_t w, int16_t h) = 0;
  virtual void drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1) = 0;
  virtual void drawPixel(int16_t x, int16_t y) = 0;
  virtual void setBrightness(uint8_t level) = 0;
  virtual void present() = 0;
};

enum class Level : uint8_t { PRESSED = 0, RELEASED = 1 };

// Pull-up wiring: released reads high, pressed reads low.
class ButtonInput {
public:
  virtual ~ButtonInput() {}
  virtual Level readLevel() = 0;
};

class ScoreStore {
public:
  virtual ~ScoreStore() {}
  // 0 when nothing valid is stored
  virtual uint32_t readHighScore() = 0;
  virtual void writeHighScore(uint32_t score) = 0;
};

// Non-blocking source of remote taunts.
class TauntService {
public:
  virtual ~TauntService() {}
  // Starts a fetch of up to `count` lines. False when one is already running.
  virtual bool requestTaunts(uint8_t count) = 0;
  virtual bool busy() const = 0;
  // Moves a finished batch into `out` (once). False if nothing is ready.
  // A failed fetch completes with an empty batch.
  virtual bool takeTaunts(std::vector<std::string>& out) = 0;
};

// Half-open range [lo, hi), same contract as Arduino random(lo, hi).
class RandomSource {
public:
  virtual ~RandomSource() {}
  virtual int32_t next(int32_t lo, int32_t hi) = 0;
};

// xorshift32; seed with esp_random() on the device, a constant in tests.
class XorShiftRandom : public RandomSource {
public:
  explicit XorShiftRandom(uint32_t seed) { reseed(seed); }

  void reseed(uint32_t seed) { state_ = seed ? seed : 0xA5F0361Du; }

  int32_t next(int32_t lo, int32_t hi) override {
    if (hi <= lo) return lo;
    uint32_t x = state_;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    state_ = x;
    return lo + (int32_t)(x % (uint32_t)(hi - lo));
  }

private:
  uint32_t state_;
};

} // namespace Clicker
