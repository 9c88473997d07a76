#include "score_tracker.h"
#include "clicker_log.h"

namespace Clicker {

ScoreTracker::ScoreTracker(ScoreStore& store, const std::vector<EasterEgg>& eggs)
  : store_(store), eggs_(eggs) {}

void ScoreTracker::begin() {
  count_ = 0;
  recordBroken_ = false;
  highScore_ = store_.readHighScore();
}

void ScoreTracker::raiseHighScore(IncrementResult& r) {
  if (count_ <= highScore_) return;
  highScore_ = count_;
  store_.writeHighScore(highScore_);
  r.highScoreChanged = true;
}

IncrementResult ScoreTracker::applyIncrement() {
  IncrementResult r;
  ++count_;

  const bool milestone = (count_ % 100 == 0);   // count_ >= 1 here

  // Priority: easter egg > new high score > milestone > plain
  if (const EasterEgg* egg = findEasterEgg(eggs_, count_)) {
    r.outcome = IncrementOutcome::EASTER_EGG;
    r.egg = egg;
    raiseHighScore(r);
  } else if (count_ > highScore_) {
    // A blank score (0) has no record to beat: mark it broken quietly.
    if (!recordBroken_ && highScore_ == 0) {
      recordBroken_ = true;
    } else if (!recordBroken_) {
      recordBroken_ = true;
      r.outcome = IncrementOutcome::NEW_RECORD;
      Log::info("New high score: %lu", (unsigned long)count_);
    }
    if (r.outcome == IncrementOutcome::PLAIN && milestone) {
      r.outcome = IncrementOutcome::MILESTONE;
    }
    raiseHighScore(r);
  } else if (milestone) {
    r.outcome = IncrementOutcome::MILESTONE;
  }
  return r;
}

bool ScoreTracker::applyReset() {
  if (count_ == 0) return false;
  count_ = 0;
  recordBroken_ = false;   // can celebrate again
  return true;
}

uint32_t ScoreTracker::applySecretReset() {
  const uint32_t destroyed = highScore_;
  Log::info("SECRET RESET! Destroying high score: %lu", (unsigned long)destroyed);
  highScore_ = 0;
  count_ = 0;
  recordBroken_ = false;
  store_.writeHighScore(0);
  return destroyed;
}

} // namespace Clicker
