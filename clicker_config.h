// clicker_config.h
// Button Counter: compile-time tunables shared by the engine and the sketch.

#pragma once
#include <stddef.h>
#include <stdint.h>

#define CLICKER_FW_VERSION "1.2.0"

namespace Clicker {
namespace Config {

// ======= Pins =======
constexpr uint8_t PIN_COUNT_BUTTON = 14;   // INPUT_PULLUP, active LOW
constexpr uint8_t PIN_RESET_BUTTON = 15;

// Round TFT (GC9A01A over SPI)
constexpr int8_t PIN_TFT_CS   = 2;
constexpr int8_t PIN_TFT_DC   = 5;
constexpr int8_t PIN_TFT_RST  = -1;
constexpr int8_t PIN_TFT_SCK  = 4;
constexpr int8_t PIN_TFT_MOSI = 3;

// ======= Canvas (logical, 1-bit) =======
constexpr int16_t SCREEN_W = 128;
constexpr int16_t SCREEN_H = 64;
constexpr int16_t GLYPH_W  = 8;            // 8x8 monospace text cells

// ======= Loop =======
constexpr uint32_t TICK_MS = 10;

// ======= Input =======
constexpr uint32_t DEBOUNCE_MS     = 200;
constexpr uint32_t HOLD_MS         = 1000;  // reset held -> stats view
constexpr uint32_t SECRET_COMBO_MS = 3000;  // both held -> high score wipe

// ======= Taunts =======
constexpr uint16_t TAUNT_MIN_CLICKS   = 20;
constexpr uint16_t TAUNT_ODDS         = 40;   // 1-in-N once the gate is open
constexpr uint16_t TAUNT_REMOTE_EVERY = 4;
constexpr uint8_t  TAUNT_BATCH        = 10;
constexpr size_t   TAUNT_MAX_LEN      = 32;

// ======= Messages =======
constexpr size_t   MSG_WIDTH_CHARS = 16;
constexpr size_t   MSG_SCROLL_PAD  = 3;
constexpr uint32_t MSG_SCROLL_MS   = 200;
constexpr uint32_t MSG_DEFAULT_MS  = 4000;

// ======= Confetti =======
constexpr uint8_t  CONFETTI_COUNT   = 15;
constexpr uint32_t CONFETTI_STEP_MS = 50;
constexpr int16_t  CONFETTI_PRUNE_Y = 70;

// ======= Explosion =======
constexpr uint8_t  EXPLOSION_FRAMES     = 20;
constexpr uint32_t EXPLOSION_FRAME_MS   = 50;
constexpr float    EXPLOSION_GRAVITY    = 0.8f;
constexpr float    EXPLOSION_SHRINK     = 0.3f;
constexpr uint8_t  EXPLOSION_SPARK_FRAMES = 8;
constexpr uint8_t  EXPLOSION_SPARKS       = 5;
constexpr uint32_t EXPLOSION_CAPTION_MS = 500;

// ======= Display power =======
constexpr uint32_t DIM_TIMEOUT_MS    = 30000;
constexpr uint8_t  BRIGHTNESS_FULL   = 255;
constexpr uint8_t  BRIGHTNESS_DIMMED = 1;

// ======= Network =======
constexpr uint32_t WIFI_JOIN_TIMEOUT_MS = 10000;
constexpr uint32_t HTTP_TIMEOUT_MS      = 15000;

// ======= Remote taunts (Anthropic Messages API) =======
constexpr const char* TAUNT_API_URL     = "https://api.anthropic.com/v1/messages";
constexpr const char* TAUNT_API_VERSION = "2023-06-01";
constexpr const char* TAUNT_MODEL       = "claude-3-haiku-20240307";
constexpr uint16_t    TAUNT_MAX_TOKENS  = 300;

} // namespace Config
} // namespace Clicker
