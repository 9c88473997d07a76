#include "taunt_request.h"
#include "clicker_config.h"
#include "clicker_log.h"
#include <ArduinoJson.h>

namespace Clicker {

std::string buildTauntRequest(uint8_t count) {
  const std::string prompt =
    "Generate " + std::to_string(count) +
    " very short sarcastic taunts for a button clicker. MAX 15 characters each. "
    "Examples: 'Wow. A click.' 'So impressive' 'Try harder'. "
    "One per line, no numbers, no quotes.";

  JsonDocument doc;
  doc["model"] = Config::TAUNT_MODEL;
  doc["max_tokens"] = Config::TAUNT_MAX_TOKENS;
  JsonObject msg = doc["messages"].add<JsonObject>();
  msg["role"] = "user";
  msg["content"] = prompt;

  std::string body;
  serializeJson(doc, body);
  return body;
}

bool parseTauntResponse(const std::string& body, std::vector<std::string>& lines) {
  lines.clear();

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, body);
  if (err) {
    Log::debug("Taunt response: JSON error %s", err.c_str());
    return false;
  }

  JsonVariantConst text = doc["content"][0]["text"];
  if (!text.is<const char*>()) return false;
  const std::string all = text.as<std::string>();

  size_t start = 0;
  while (start <= all.size()) {
    size_t nl = all.find('\n', start);
    if (nl == std::string::npos) nl = all.size();
    lines.push_back(all.substr(start, nl - start));
    start = nl + 1;
  }
  return true;
}

} // namespace Clicker
