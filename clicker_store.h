// clicker_store.h
// NVS persistence (Preferences, namespace "clicker"): the high score and the
// runtime settings for the remote taunt path.

#pragma once
#include <Arduino.h>
#include "clicker_hal.h"

// Build flags seed NVS on first boot; leave empty to configure later.
#ifndef CLICKER_WIFI_SSID
#define CLICKER_WIFI_SSID ""
#endif
#ifndef CLICKER_WIFI_PASS
#define CLICKER_WIFI_PASS ""
#endif
#ifndef CLICKER_API_KEY
#define CLICKER_API_KEY ""
#endif

namespace Clicker {

static constexpr const char* NVS_NAMESPACE = "clicker";

struct DeviceSettings {
  String wifiSsid;
  String wifiPass;
  String apiKey;

  bool remoteEnabled() const { return !apiKey.isEmpty() && !wifiSsid.isEmpty(); }
};

class NvsScoreStore : public ScoreStore {
public:
  uint32_t readHighScore() override;
  void writeHighScore(uint32_t score) override;
};

// Missing keys come back empty; absent keys are first seeded from the
// build flags. False if NVS could not be opened at all.
bool loadSettings(DeviceSettings& out);

} // namespace Clicker
