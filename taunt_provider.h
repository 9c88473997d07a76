// taunt_provider.h
// Decides when a click earns a taunt and where the taunt comes from:
// the fixed local pool, or a cache refilled from the remote service.

#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "clicker_config.h"
#include "clicker_hal.h"

namespace Clicker {

class TauntProvider {
public:
  struct Settings {
    uint16_t minClicks   = Config::TAUNT_MIN_CLICKS;
    uint16_t odds        = Config::TAUNT_ODDS;
    uint16_t remoteEvery = Config::TAUNT_REMOTE_EVERY;
    uint8_t  batch       = Config::TAUNT_BATCH;
    size_t   maxLen      = Config::TAUNT_MAX_LEN;
  };

  enum class Source : uint8_t { LOCAL, REMOTE };

  // `remote` may be null: no credential, local pool only.
  TauntProvider(RandomSource& rng,
                const std::vector<std::string>& taunts,
                const std::vector<std::string>& resetTaunts,
                TauntService* remote);
  TauntProvider(RandomSource& rng,
                const std::vector<std::string>& taunts,
                const std::vector<std::string>& resetTaunts,
                TauntService* remote,
                const Settings& settings);

  // One call per plain increment. Counts the click and rolls once the gate
  // is open; true means a taunt is due.
  bool shouldTaunt();
  // Picks the next taunt (remote every Nth time when available).
  std::string nextTaunt();
  std::string resetTaunt();
  // Closes the gate again (counter reset).
  void resetGate() { clicksSinceTaunt_ = 0; }

  // Pulls in a finished remote batch if there is one. Call every tick.
  void poll();

  uint16_t clicksSinceTaunt() const { return clicksSinceTaunt_; }
  size_t cacheSize() const { return cache_.size(); }
  Source lastSource() const { return lastSource_; }
  bool remoteEnabled() const { return remote_ != nullptr; }

  // Trim, drop blanks and anything longer than maxLen, append to the cache.
  void addRemoteTaunts(const std::vector<std::string>& lines);

private:
  std::string pickLocal();

  RandomSource& rng_;
  const std::vector<std::string> taunts_;
  const std::vector<std::string> resetTaunts_;
  TauntService* remote_;
  Settings settings_;

  std::vector<std::string> cache_;   // consumed from the back
  uint16_t clicksSinceTaunt_ = 0;
  uint16_t tauntsSinceRemote_ = 0;
  Source   lastSource_ = Source::LOCAL;
};

} // namespace Clicker
