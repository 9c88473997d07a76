#include "clicker_net.h"
#include "clicker_config.h"
#include "clicker_log.h"
#include "taunt_request.h"
#include <WiFi.h>
#include <WiFiClientSecure.h>
#include <HTTPClient.h>

namespace Clicker {

// ======= Worker =======
static constexpr uint32_t TASK_STACK    = 12288;   // TLS handshake
static constexpr UBaseType_t TASK_PRIO  = 1;
static constexpr BaseType_t TASK_CORE   = 0;
static constexpr TickType_t LOCK_WAIT   = pdMS_TO_TICKS(50);

// ===============================
// WifiLink
// ===============================
void WifiLink::begin(const String& ssid, const String& pass) {
  ssid_ = ssid;
  pass_ = pass;
  if (ssid_.isEmpty()) return;
  WiFi.mode(WIFI_STA);
  WiFi.begin(ssid_.c_str(), pass_.c_str());
  started_ = true;
  Log::info("WiFi: joining %s", ssid_.c_str());
}

bool WifiLink::connected() const { return WiFi.status() == WL_CONNECTED; }

bool WifiLink::ensureConnected(uint32_t timeoutMs) {
  if (ssid_.isEmpty()) return false;
  if (!started_) begin(ssid_, pass_);

  const uint32_t start = millis();
  while (!connected()) {
    if (millis() - start >= timeoutMs) {
      Log::info("WiFi: connection failed");
      reported_ = false;
      return false;
    }
    delay(100);
  }
  if (!reported_) {
    reported_ = true;
    Log::info("WiFi: connected, IP %s", WiFi.localIP().toString().c_str());
  }
  return true;
}

// ===============================
// RemoteTaunts
// ===============================
bool RemoteTaunts::begin(const String& apiKey) {
  apiKey_ = apiKey;
  mutex_ = xSemaphoreCreateMutex();
  if (!mutex_) {
    Log::info("AI taunts: no mutex, remote off");
    return false;
  }
  if (xTaskCreatePinnedToCore(taskEntry, "TauntFetch", TASK_STACK, this,
                              TASK_PRIO, &task_, TASK_CORE) != pdPASS) {
    Log::info("AI taunts: worker not started, remote off");
    task_ = nullptr;
    vSemaphoreDelete(mutex_);
    mutex_ = nullptr;
    return false;
  }
  return true;
}

bool RemoteTaunts::requestTaunts(uint8_t count) {
  if (!task_) return false;
  if (xSemaphoreTake(mutex_, LOCK_WAIT) != pdTRUE) return false;
  const bool accepted = !inFlight_;
  if (accepted) {
    inFlight_ = true;
    wanted_ = count;
  }
  xSemaphoreGive(mutex_);
  if (accepted) xTaskNotifyGive(task_);
  return accepted;
}

bool RemoteTaunts::busy() const {
  if (!task_) return false;
  if (xSemaphoreTake(mutex_, LOCK_WAIT) != pdTRUE) return true;
  const bool b = inFlight_;
  xSemaphoreGive(mutex_);
  return b;
}

bool RemoteTaunts::takeTaunts(std::vector<std::string>& out) {
  if (!task_) return false;
  if (xSemaphoreTake(mutex_, 0) != pdTRUE) return false;   // try again next tick
  const bool had = ready_;
  if (had) {
    out.swap(batch_);
    batch_.clear();
    ready_ = false;
  }
  xSemaphoreGive(mutex_);
  return had;
}

void RemoteTaunts::taskEntry(void* arg) {
  static_cast<RemoteTaunts*>(arg)->run();
}

void RemoteTaunts::run() {
  for (;;) {
    ulTaskNotifyTake(pdTRUE, portMAX_DELAY);

    uint8_t count = 0;
    if (xSemaphoreTake(mutex_, portMAX_DELAY) == pdTRUE) {
      count = wanted_;
      xSemaphoreGive(mutex_);
    }

    // a failed fetch still completes, with an empty batch
    std::vector<std::string> lines;
    if (!fetch(count, lines)) lines.clear();

    if (xSemaphoreTake(mutex_, portMAX_DELAY) == pdTRUE) {
      batch_.swap(lines);
      ready_ = true;
      inFlight_ = false;
      xSemaphoreGive(mutex_);
    }
  }
}

bool RemoteTaunts::fetch(uint8_t count, std::vector<std::string>& out) {
  if (!link_.ensureConnected(Config::WIFI_JOIN_TIMEOUT_MS)) return false;

  WiFiClientSecure cli; cli.setInsecure();
  HTTPClient http; http.setTimeout(Config::HTTP_TIMEOUT_MS);
  if (!http.begin(cli, Config::TAUNT_API_URL)) {
    Log::info("AI fetch failed: cannot open connection");
    return false;
  }
  http.addHeader("Content-Type", "application/json");
  http.addHeader("x-api-key", apiKey_);
  http.addHeader("anthropic-version", Config::TAUNT_API_VERSION);

  const std::string body = buildTauntRequest(count);
  const int code = http.POST(reinterpret_cast<uint8_t*>(const_cast<char*>(body.data())), body.size());
  if (code != HTTP_CODE_OK) {
    Log::info("AI fetch failed: HTTP %d", code);
    http.end();
    return false;
  }
  const String resp = http.getString();
  http.end();

  if (!parseTauntResponse(std::string(resp.c_str(), resp.length()), out)) {
    Log::info("AI fetch failed: no text in response");
    return false;
  }
  Log::info("Fetched %u AI taunt lines", (unsigned)out.size());
  return true;
}

} // namespace Clicker
