#include "input_classifier.h"

namespace Clicker {

const char* inputEventName(InputEvent e) {
  switch (e) {
    case InputEvent::COUNT_TAP:         return "COUNT_TAP";
    case InputEvent::RESET_TAP:         return "RESET_TAP";
    case InputEvent::RESET_HOLD_START:  return "RESET_HOLD_START";
    case InputEvent::RESET_HOLD_ACTIVE: return "RESET_HOLD_ACTIVE";
    case InputEvent::RESET_HOLD_END:    return "RESET_HOLD_END";
    case InputEvent::SECRET_COMBO:      return "SECRET_COMBO";
  }
  return "?";
}

bool InputClassifier::Events::contains(InputEvent e) const {
  for (uint8_t i = 0; i < count; ++i) {
    if (items[i] == e) return true;
  }
  return false;
}

InputClassifier::InputClassifier() : InputClassifier(Timing()) {}

InputClassifier::InputClassifier(const Timing& timing) : timing_(timing) {}

bool InputClassifier::debounced(const Channel& ch, uint32_t now) const {
  return !ch.everAccepted || (now - ch.lastAcceptedAt) >= timing_.debounceMs;
}

void InputClassifier::accept(Channel& ch, uint32_t now) {
  ch.lastAcceptedAt = now;
  ch.everAccepted = true;
}

void InputClassifier::cancelResetPress(Events& out) {
  if (showingStats_) out.push(InputEvent::RESET_HOLD_END);
  showingStats_ = false;
  resetPressed_ = false;
}

InputClassifier::Events InputClassifier::sample(Level count, Level reset, uint32_t now) {
  Events out;

  // ---- secret combo first: both held suspends single-button logic ----
  const bool bothPressed = (count == Level::PRESSED && reset == Level::PRESSED);
  if (bothPressed) {
    if (comboStart_ == 0 && !comboFired_) {
      comboStart_ = now ? now : 1;  // 0 means "not timing"
      cancelResetPress(out);
    }
    if (comboStart_ != 0 && (now - comboStart_) >= timing_.comboMs) {
      comboStart_ = 0;
      comboFired_ = true;           // once per continuous dual press
      out.push(InputEvent::SECRET_COMBO);
    }
    countCh_.last = count;
    resetCh_.last = reset;
    return out;
  }

  comboStart_ = 0;
  if (count == Level::RELEASED && reset == Level::RELEASED) comboFired_ = false;

  // ---- count: debounced falling edge ----
  if (countCh_.last == Level::RELEASED && count == Level::PRESSED && debounced(countCh_, now)) {
    accept(countCh_, now);
    out.push(InputEvent::COUNT_TAP);
  }

  // ---- reset: press, hold, release ----
  if (!resetPressed_ && resetCh_.last == Level::RELEASED && reset == Level::PRESSED &&
      debounced(resetCh_, now)) {
    accept(resetCh_, now);
    resetPressed_ = true;
    resetPressStart_ = now;
    out.push(InputEvent::RESET_HOLD_START);
  }

  if (resetPressed_) {
    const uint32_t held = now - resetPressStart_;
    if (reset == Level::PRESSED) {
      if (!showingStats_ && held >= timing_.holdMs) {
        showingStats_ = true;
        out.push(InputEvent::RESET_HOLD_ACTIVE);
      }
    } else if (showingStats_ || held >= timing_.debounceMs) {
      // releases inside the debounce window are contact bounce
      if (held < timing_.holdMs && !showingStats_) {
        out.push(InputEvent::RESET_TAP);
      } else {
        out.push(InputEvent::RESET_HOLD_END);
      }
      showingStats_ = false;
      resetPressed_ = false;
    }
  }

  countCh_.last = count;
  resetCh_.last = reset;
  return out;
}

} // namespace Clicker
