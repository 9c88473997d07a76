// input_classifier.h
// Turns two raw, bouncy pull-up buttons into tap / hold / combo events.

#pragma once
#include <stdint.h>
#include "clicker_config.h"
#include "clicker_hal.h"

namespace Clicker {

enum class InputEvent : uint8_t {
  COUNT_TAP,
  RESET_TAP,
  RESET_HOLD_START,    // reset press accepted, hold timer running
  RESET_HOLD_ACTIVE,   // held past the threshold: show stats
  RESET_HOLD_END,      // released after stats: restore the normal view
  SECRET_COMBO
};

const char* inputEventName(InputEvent e);

class InputClassifier {
public:
  struct Timing {
    uint32_t debounceMs = Config::DEBOUNCE_MS;
    uint32_t holdMs     = Config::HOLD_MS;
    uint32_t comboMs    = Config::SECRET_COMBO_MS;
  };

  // A single sample can produce a couple of events (e.g. HOLD_END then COMBO).
  static constexpr uint8_t MAX_EVENTS = 4;

  struct Events {
    InputEvent items[MAX_EVENTS];
    uint8_t count = 0;
    void push(InputEvent e) { if (count < MAX_EVENTS) items[count++] = e; }
    bool contains(InputEvent e) const;
  };

  InputClassifier();
  explicit InputClassifier(const Timing& timing);

  // Call once per tick with the raw levels of both channels.
  Events sample(Level count, Level reset, uint32_t now);

  bool showingStats() const { return showingStats_; }

private:
  struct Channel {
    Level    last = Level::RELEASED;
    uint32_t lastAcceptedAt = 0;
    bool     everAccepted = false;
  };

  bool debounced(const Channel& ch, uint32_t now) const;
  void accept(Channel& ch, uint32_t now);
  void cancelResetPress(Events& out);

  Timing   timing_;
  Channel  countCh_;
  Channel  resetCh_;

  // reset press in progress
  bool     resetPressed_ = false;
  uint32_t resetPressStart_ = 0;
  bool     showingStats_ = false;

  // both held
  uint32_t comboStart_ = 0;
  bool     comboFired_ = false;
};

} // namespace Clicker
