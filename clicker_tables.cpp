#include "clicker_tables.h"

namespace Clicker {

const std::vector<std::string>& defaultTaunts() {
  static const std::vector<std::string> taunts = {
    "That's it?",
    "My grandma clicks faster",
    "Weak.",
    "Keep going, champ",
    "Impressive... not",
    "Is that all you got?",
    "Pathetic clicking",
    "Try harder",
    "Yawn...",
    "Are you even trying?",
    "Click like you mean it",
    "Amateur hour",
    "Sad.",
    "More! MORE!",
    "You call that clicking?",
    "I've seen better",
    "Really?",
    "Oh wow, a click",
    "Groundbreaking stuff",
    "Revolutionary clicking",
    "History in the making",
    "Alert the press",
    "Legendary...",
    "Peak performance",
    "Your finger tired yet?",
    "Slow clap",
    "Do you even lift?",
    "My cat clicks better",
    "Zzzzz...",
    "Wake me when done",
    "Still going?",
    "Bless your heart",
    "A for effort",
    "Participation trophy",
    "So brave",
    "Much click. Wow.",
    "Error 404: skill",
    "Have you tried harder?",
    "Bold strategy",
    "Fascinating...",
    "Cool story bro",
    "K.",
    "Neat.",
    "Riveting stuff",
    "Edge of my seat",
    "Thrilling",
    "Stop. Don't. Come back.",
    "Oh no... anyway",
    "Press F to pay respects",
    "git gud",
    ":P",
    ";P",
    "-_-",
    "._.",
    ">_<",
    "^_^",
    "o_O",
    "T_T",
    "(._. )",
    "( -_-)",
    "\\(o_o)/",
    "(-_-)zzZ",
    "*slow clap*",
    "...really?",
    // puns
    "Un-BUTTON-lievable",
    "This is pressing",
    "Button your lip",
    "Push comes to shove",
    "You're on a roll",
    "Click bait",
    "Pushing my buttons",
    "That was riveting",
    "Key performance",
    "Tactile genius",
    "Finger lickin good",
    "Digit-al art",
    "Count on it",
    "Number one fan",
    "Sum-thing else",
  };
  return taunts;
}

const std::vector<std::string>& defaultResetTaunts() {
  static const std::vector<std::string> taunts = {
    "Giving up already?",
    "Back to zero, loser",
    "Rage quit?",
    "Starting fresh, huh?",
    "Couldn't handle it?",
    "The walk of shame",
    "Reset of defeat",
  };
  return taunts;
}

const std::vector<EasterEgg>& defaultEasterEggs() {
  static const std::vector<EasterEgg> eggs = {
    {69,    "Nice.",         EggMotif::WINK},
    {420,   "Blaze it",      EggMotif::FLAMES},
    {666,   "\\m/ HAIL \\m/", EggMotif::HORNS},
    {1337,  "L33T H4X0R",    EggMotif::MATRIX},
    {80085, "Really?",       EggMotif::EYE_ROLL},
  };
  return eggs;
}

const EasterEgg* findEasterEgg(const std::vector<EasterEgg>& table, uint32_t value) {
  for (const EasterEgg& egg : table) {
    if (egg.value == value) return &egg;
  }
  return nullptr;
}

} // namespace Clicker
