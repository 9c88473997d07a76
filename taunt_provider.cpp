#include "taunt_provider.h"
#include "clicker_log.h"
#include "message_scheduler.h"   // trimCopy, foldToAscii

namespace Clicker {

TauntProvider::TauntProvider(RandomSource& rng,
                             const std::vector<std::string>& taunts,
                             const std::vector<std::string>& resetTaunts,
                             TauntService* remote)
  : TauntProvider(rng, taunts, resetTaunts, remote, Settings()) {}

TauntProvider::TauntProvider(RandomSource& rng,
                             const std::vector<std::string>& taunts,
                             const std::vector<std::string>& resetTaunts,
                             TauntService* remote,
                             const Settings& settings)
  : rng_(rng), taunts_(taunts), resetTaunts_(resetTaunts),
    remote_(remote), settings_(settings) {}

bool TauntProvider::shouldTaunt() {
  if (clicksSinceTaunt_ < UINT16_MAX) ++clicksSinceTaunt_;
  if (clicksSinceTaunt_ < settings_.minClicks) return false;
  if (rng_.next(0, settings_.odds) != 0) return false;   // 1-in-odds
  clicksSinceTaunt_ = 0;
  return true;
}

std::string TauntProvider::pickLocal() {
  lastSource_ = Source::LOCAL;
  if (taunts_.empty()) return std::string();
  return taunts_[rng_.next(0, (int32_t)taunts_.size())];
}

std::string TauntProvider::nextTaunt() {
  ++tauntsSinceRemote_;
  if (remote_ && tauntsSinceRemote_ >= settings_.remoteEvery) {
    tauntsSinceRemote_ = 0;
    poll();
    if (cache_.empty()) {
      // Non-blocking: this taunt comes from the local pool, the batch
      // lands in the cache for later turns.
      if (remote_->requestTaunts(settings_.batch)) {
        Log::info("Fetching AI taunts...");
      }
      poll();
    }
    if (!cache_.empty()) {
      std::string taunt = cache_.back();
      cache_.pop_back();
      lastSource_ = Source::REMOTE;
      Log::info("[AI] %s", taunt.c_str());
      return taunt;
    }
  }
  std::string taunt = pickLocal();
  Log::info("[Local] %s", taunt.c_str());
  return taunt;
}

std::string TauntProvider::resetTaunt() {
  if (resetTaunts_.empty()) return std::string();
  return resetTaunts_[rng_.next(0, (int32_t)resetTaunts_.size())];
}

void TauntProvider::poll() {
  if (!remote_) return;
  std::vector<std::string> batch;
  if (!remote_->takeTaunts(batch)) return;
  addRemoteTaunts(batch);
  Log::info("Cache now has %u taunts", (unsigned)cache_.size());
}

void TauntProvider::addRemoteTaunts(const std::vector<std::string>& lines) {
  for (const std::string& raw : lines) {
    std::string line = trimCopy(foldToAscii(raw));
    if (line.empty() || line.size() > settings_.maxLen) continue;
    cache_.push_back(line);
  }
}

} // namespace Clicker
