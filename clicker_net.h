// clicker_net.h
// WiFi connection manager and the remote taunt client (HTTP on a worker task).

#pragma once
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <string>
#include <vector>
#include "clicker_hal.h"

namespace Clicker {

// Joins on demand and keeps the link up once established.
class WifiLink {
public:
  // Starts joining in the background; does not wait.
  void begin(const String& ssid, const String& pass);
  // Waits up to `timeoutMs` for the join. True when connected.
  bool ensureConnected(uint32_t timeoutMs);
  bool connected() const;

private:
  String ssid_;
  String pass_;
  bool   started_ = false;
  bool   reported_ = false;
};

class RemoteTaunts : public TauntService {
public:
  explicit RemoteTaunts(WifiLink& link) : link_(link) {}

  // Creates the mutex and the worker (core 0). False if either fails, in
  // which case the object stays inert.
  bool begin(const String& apiKey);

  bool requestTaunts(uint8_t count) override;
  bool busy() const override;
  bool takeTaunts(std::vector<std::string>& out) override;

private:
  static void taskEntry(void* arg);
  void run();
  bool fetch(uint8_t count, std::vector<std::string>& out);

  WifiLink& link_;
  String    apiKey_;

  SemaphoreHandle_t mutex_ = nullptr;
  TaskHandle_t      task_ = nullptr;

  // guarded by mutex_
  bool    inFlight_ = false;
  bool    ready_ = false;
  uint8_t wanted_ = 0;
  std::vector<std::string> batch_;
};

} // namespace Clicker
