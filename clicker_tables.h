// clicker_tables.h
// Fixed phrase pools and the easter-egg table. Injected into the engine at
// construction; these are the stock defaults.

#pragma once
#include <stdint.h>
#include <string>
#include <vector>

namespace Clicker {

// Bespoke animation bound to an easter-egg value.
enum class EggMotif : uint8_t { WINK, FLAMES, HORNS, MATRIX, EYE_ROLL };

struct EasterEgg {
  uint32_t    value;
  std::string message;
  EggMotif    motif;
};

const std::vector<std::string>& defaultTaunts();
const std::vector<std::string>& defaultResetTaunts();
const std::vector<EasterEgg>&   defaultEasterEggs();

// nullptr if `value` has no egg
const EasterEgg* findEasterEgg(const std::vector<EasterEgg>& table, uint32_t value);

} // namespace Clicker
