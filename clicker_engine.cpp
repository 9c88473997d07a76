#include "clicker_engine.h"
#include "clicker_log.h"

namespace Clicker {

ClickerEngine::ClickerEngine(const Hardware& hw)
  : ClickerEngine(hw, Tables(), EngineOptions()) {}

ClickerEngine::ClickerEngine(const Hardware& hw, const Tables& tables, const EngineOptions& options)
  : hw_(hw),
    input_(options.input),
    score_(hw.store, tables.easterEggs),
    taunts_(hw.rng, tables.taunts, tables.resetTaunts, hw.taunts, options.taunt),
    animation_(hw.rng),
    activity_(options.dimTimeoutMs),
    compositor_(hw.display) {}

void ClickerEngine::begin(uint32_t now) {
  score_.begin();
  activity_.begin(now);
  stats_ = false;
  hw_.display.setBrightness(Config::BRIGHTNESS_FULL);

  Log::info("Button Counter %s started!", CLICKER_FW_VERSION);
  Log::info("Count button: GP%u", (unsigned)Config::PIN_COUNT_BUTTON);
  Log::info("Reset button: GP%u", (unsigned)Config::PIN_RESET_BUTTON);
  Log::info("High score: %lu", (unsigned long)score_.highScore());
  if (!taunts_.remoteEnabled()) Log::info("No API key: local taunts only");

  compositor_.invalidate();
  compositor_.render(scene());
}

Scene ClickerEngine::scene() const {
  return Scene{score_.count(), score_.highScore(), stats_, messages_, animation_};
}

void ClickerEngine::tick(uint32_t now) {
  // ---- input ----
  const Level countLevel = hw_.countButton.readLevel();
  const Level resetLevel = hw_.resetButton.readLevel();
  const InputClassifier::Events events = input_.sample(countLevel, resetLevel, now);
  for (uint8_t i = 0; i < events.count; ++i) handleEvent(events.items[i], now);

  // ---- background refill lands here ----
  taunts_.poll();

  // ---- timers ----
  if (messages_.update(now)) compositor_.invalidate();
  if (animation_.updateConfetti(now)) compositor_.invalidate();

  switch (animation_.step(now)) {
    case SpectacleStep::FRAME:
      compositor_.invalidate();
      break;
    case SpectacleStep::FINISHED:
      compositor_.invalidate();
      if (animation_.lastFinished() == Spectacle::EXPLOSION) {
        showMessage(MSG_DESTROYED, now);
      } else {
        wake(now);   // easter egg handed over to confetti
      }
      break;
    case SpectacleStep::IDLE:
      break;
  }

  if (activity_.update(now)) {
    hw_.display.setBrightness(Config::BRIGHTNESS_DIMMED);
    Log::debug("Display dimmed");
  }

  compositor_.render(scene());
}

void ClickerEngine::handleEvent(InputEvent e, uint32_t now) {
  Log::debug("input: %s", inputEventName(e));
  wake(now);

  switch (e) {
    case InputEvent::COUNT_TAP:
      onIncrement(now);
      break;
    case InputEvent::RESET_TAP:
      onReset(now);
      break;
    case InputEvent::RESET_HOLD_START:
      break;
    case InputEvent::RESET_HOLD_ACTIVE:
      stats_ = true;
      compositor_.invalidate();
      break;
    case InputEvent::RESET_HOLD_END:
      stats_ = false;
      compositor_.invalidate();
      break;
    case InputEvent::SECRET_COMBO:
      onSecretReset(now);
      break;
  }
}

void ClickerEngine::onIncrement(uint32_t now) {
  const IncrementResult r = score_.applyIncrement();

  switch (r.outcome) {
    case IncrementOutcome::EASTER_EGG:
      animation_.startEasterEgg(*r.egg, now);
      showMessage(r.egg->message, now);
      break;
    case IncrementOutcome::NEW_RECORD:
      showMessage(MSG_NEW_RECORD, now);
      startConfetti(now);
      break;
    case IncrementOutcome::MILESTONE:
      startConfetti(now);
      break;
    case IncrementOutcome::PLAIN:
      if (taunts_.shouldTaunt()) showMessage(taunts_.nextTaunt(), now);
      break;
  }
  compositor_.invalidate();
}

void ClickerEngine::onReset(uint32_t now) {
  if (!score_.applyReset()) return;
  taunts_.resetGate();
  showMessage(taunts_.resetTaunt(), now);   // always taunt a reset
  compositor_.invalidate();
}

void ClickerEngine::onSecretReset(uint32_t now) {
  const uint32_t destroyed = score_.applySecretReset();
  taunts_.resetGate();
  stats_ = false;
  messages_.clear();
  animation_.startExplosion(destroyed, now);
  compositor_.invalidate();
}

void ClickerEngine::showMessage(const std::string& text, uint32_t now) {
  messages_.show(text, now);
  wake(now);
  compositor_.invalidate();
}

void ClickerEngine::startConfetti(uint32_t now) {
  animation_.startConfetti(now);
  wake(now);
}

void ClickerEngine::wake(uint32_t now) {
  if (activity_.touch(now)) {
    hw_.display.setBrightness(Config::BRIGHTNESS_FULL);
    Log::debug("Display woken");
  }
}

} // namespace Clicker
