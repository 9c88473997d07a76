// score_tracker.h
// Owns count / high score and decides what an increment means.

#pragma once
#include <stdint.h>
#include <vector>
#include "clicker_hal.h"
#include "clicker_tables.h"

namespace Clicker {

enum class IncrementOutcome : uint8_t {
  PLAIN,        // nothing special: the caller may roll for a taunt
  EASTER_EGG,
  NEW_RECORD,   // first record of the session
  MILESTONE     // nonzero multiple of 100
};

struct IncrementResult {
  IncrementOutcome outcome = IncrementOutcome::PLAIN;
  const EasterEgg* egg = nullptr;      // set for EASTER_EGG
  bool highScoreChanged = false;
};

class ScoreTracker {
public:
  ScoreTracker(ScoreStore& store, const std::vector<EasterEgg>& eggs);

  // Loads the persisted high score.
  void begin();

  IncrementResult applyIncrement();
  // False when the count was already 0 (nothing happens).
  bool applyReset();
  // Wipes count and high score, persists the zero. Returns the destroyed value.
  uint32_t applySecretReset();

  uint32_t count() const { return count_; }
  uint32_t highScore() const { return highScore_; }
  bool recordBrokenThisSession() const { return recordBroken_; }

private:
  void raiseHighScore(IncrementResult& r);

  ScoreStore& store_;
  const std::vector<EasterEgg> eggs_;

  uint32_t count_ = 0;
  uint32_t highScore_ = 0;
  bool     recordBroken_ = false;
};

} // namespace Clicker
