// clicker_engine.h
// The counter itself: one object that owns every component, samples the
// buttons once per tick, dispatches the classified events and redraws when
// something changed.

#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "activity_monitor.h"
#include "animation_engine.h"
#include "clicker_hal.h"
#include "clicker_tables.h"
#include "display_compositor.h"
#include "input_classifier.h"
#include "message_scheduler.h"
#include "score_tracker.h"
#include "taunt_provider.h"

namespace Clicker {

struct Hardware {
  Display&      display;
  ButtonInput&  countButton;
  ButtonInput&  resetButton;
  ScoreStore&   store;
  RandomSource& rng;
  TauntService* taunts;   // null: remote taunts disabled
};

struct Tables {
  std::vector<std::string> taunts      = defaultTaunts();
  std::vector<std::string> resetTaunts = defaultResetTaunts();
  std::vector<EasterEgg>   easterEggs  = defaultEasterEggs();
};

struct EngineOptions {
  InputClassifier::Timing  input;
  TauntProvider::Settings  taunt;
  uint32_t dimTimeoutMs = Config::DIM_TIMEOUT_MS;
};

static constexpr const char* MSG_NEW_RECORD = "NEW RECORD!";
static constexpr const char* MSG_DESTROYED  = "Score destroyed!";

class ClickerEngine {
public:
  explicit ClickerEngine(const Hardware& hw);
  ClickerEngine(const Hardware& hw, const Tables& tables, const EngineOptions& options);

  // Loads the high score and draws the first frame.
  void begin(uint32_t now);
  // One pass of the control loop.
  void tick(uint32_t now);

  // Event entry points (tick() calls these; exposed for the sketch/tests).
  void handleEvent(InputEvent e, uint32_t now);

  uint32_t count() const { return score_.count(); }
  uint32_t highScore() const { return score_.highScore(); }
  bool showingStats() const { return stats_; }

  const ScoreTracker&     score() const { return score_; }
  const MessageScheduler& messages() const { return messages_; }
  const AnimationEngine&  animation() const { return animation_; }
  const TauntProvider&    taunts() const { return taunts_; }
  const ActivityMonitor&  activity() const { return activity_; }
  const DisplayCompositor& compositor() const { return compositor_; }

private:
  void onIncrement(uint32_t now);
  void onReset(uint32_t now);
  void onSecretReset(uint32_t now);
  void showMessage(const std::string& text, uint32_t now);
  void startConfetti(uint32_t now);
  void wake(uint32_t now);
  Scene scene() const;

  Hardware hw_;

  InputClassifier   input_;
  ScoreTracker      score_;
  TauntProvider     taunts_;
  MessageScheduler  messages_;
  AnimationEngine   animation_;
  ActivityMonitor   activity_;
  DisplayCompositor compositor_;

  bool stats_ = false;
};

} // namespace Clicker
