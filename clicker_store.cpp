#include "clicker_store.h"
#include "clicker_log.h"
#include <Preferences.h>

namespace Clicker {

static constexpr const char* KEY_HIGH_SCORE = "high_score";
static constexpr const char* KEY_WIFI_SSID  = "wifi_ssid";
static constexpr const char* KEY_WIFI_PASS  = "wifi_pass";
static constexpr const char* KEY_API_KEY    = "api_key";

uint32_t NvsScoreStore::readHighScore() {
  Preferences prefs;
  if (!prefs.begin(NVS_NAMESPACE, true)) {
    Log::info("High score: NVS unavailable, starting at 0");
    return 0;
  }
  const uint32_t v = prefs.getUInt(KEY_HIGH_SCORE, 0);
  prefs.end();
  return v;
}

void NvsScoreStore::writeHighScore(uint32_t score) {
  Preferences prefs;
  if (!prefs.begin(NVS_NAMESPACE, false)) {
    Log::info("High score: NVS unavailable, %lu not saved", (unsigned long)score);
    return;
  }
  if (prefs.putUInt(KEY_HIGH_SCORE, score) == 0) {
    Log::info("High score: write of %lu failed", (unsigned long)score);
  }
  prefs.end();
}

// ---- settings ----
static String readOrSeed(Preferences& prefs, const char* key, const char* seed) {
  if (prefs.isKey(key)) return prefs.getString(key, "");
  if (seed[0] == '\0') return String();
  if (prefs.putString(key, seed) == 0) Log::info("Settings: could not seed %s", key);
  return String(seed);
}

bool loadSettings(DeviceSettings& out) {
  out = DeviceSettings();
  Preferences prefs;
  if (!prefs.begin(NVS_NAMESPACE, false)) {
    Log::info("Settings: NVS unavailable, remote taunts off");
    return false;
  }
  out.wifiSsid = readOrSeed(prefs, KEY_WIFI_SSID, CLICKER_WIFI_SSID);
  out.wifiPass = readOrSeed(prefs, KEY_WIFI_PASS, CLICKER_WIFI_PASS);
  out.apiKey   = readOrSeed(prefs, KEY_API_KEY,   CLICKER_API_KEY);
  prefs.end();
  return true;
}

} // namespace Clicker
