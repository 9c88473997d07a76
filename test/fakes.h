// Test doubles for the engine's collaborators.

#pragma once
#include <deque>
#include <string>
#include <vector>
#include "clicker_hal.h"

namespace Clicker {
namespace Testing {

struct TextOp {
  std::string text;
  int16_t x, y;
};

struct RectOp {
  int16_t x, y, w, h;
};

// Keeps the ops of the frame being drawn and of the last presented frame.
class RecordingDisplay : public Display {
public:
  struct Frame {
    std::vector<TextOp> texts;
    std::vector<RectOp> rects;
    int lines = 0;
    int pixels = 0;
  };

  void clear() override { current = Frame(); ++clears; }
  void drawText(const std::string& s, int16_t x, int16_t y) override {
    current.texts.push_back(TextOp{s, x, y});
  }
  void drawFilledRect(int16_t x, int16_t y, int16_t w, int16_t h) override {
    current.rects.push_back(RectOp{x, y, w, h});
  }
  void drawLine(int16_t, int16_t, int16_t, int16_t) override { ++current.lines; }
  void drawPixel(int16_t, int16_t) override { ++current.pixels; }
  void setBrightness(uint8_t level) override { brightness.push_back(level); }
  void present() override { last = current; ++presents; }

  bool lastHasText(const std::string& s) const {
    for (const TextOp& t : last.texts) if (t.text == s) return true;
    return false;
  }
  bool lastHasTextAt(const std::string& s, int16_t x, int16_t y) const {
    for (const TextOp& t : last.texts) if (t.text == s && t.x == x && t.y == y) return true;
    return false;
  }

  Frame current;
  Frame last;
  int clears = 0;
  int presents = 0;
  std::vector<uint8_t> brightness;
};

class ScriptedButton : public ButtonInput {
public:
  Level readLevel() override { return level; }
  Level level = Level::RELEASED;
};

class MemoryStore : public ScoreStore {
public:
  explicit MemoryStore(uint32_t initial = 0) : value(initial) {}
  uint32_t readHighScore() override { ++reads; return value; }
  void writeHighScore(uint32_t score) override { value = score; writes.push_back(score); }

  uint32_t value;
  int reads = 0;
  std::vector<uint32_t> writes;
};

// Completes immediately by default; with `async` the test decides when.
class FakeTauntService : public TauntService {
public:
  bool requestTaunts(uint8_t count) override {
    if (inFlight) return false;
    ++requests;
    lastCount = count;
    inFlight = true;
    if (!async) complete();
    return true;
  }
  bool busy() const override { return inFlight; }
  bool takeTaunts(std::vector<std::string>& out) override {
    if (!ready) return false;
    out = pending;
    pending.clear();
    ready = false;
    return true;
  }

  void complete() {
    pending = batch;
    ready = true;
    inFlight = false;
  }

  std::vector<std::string> batch;
  bool async = false;
  int requests = 0;
  uint8_t lastCount = 0;

private:
  std::vector<std::string> pending;
  bool inFlight = false;
  bool ready = false;
};

// Hands out queued values (clamped into range); once empty, the fallback
// if set, otherwise the low bound.
class ScriptedRandom : public RandomSource {
public:
  int32_t next(int32_t lo, int32_t hi) override {
    int32_t v = lo;
    if (!values.empty()) {
      v = values.front();
      values.pop_front();
    } else if (hasFallback) {
      v = fallback;
    }
    if (v < lo) v = lo;
    if (v >= hi) v = hi - 1;
    return v;
  }

  void always(int32_t v) { hasFallback = true; fallback = v; }

  std::deque<int32_t> values;
  bool hasFallback = false;
  int32_t fallback = 0;
};

} // namespace Testing
} // namespace Clicker
