// animation_engine.h
// Confetti overlay plus the frame-stepped spectacles (digit explosion and the
// easter-egg motifs). Nothing here blocks: the loop calls step() every tick
// and redraws when a new frame is ready.

#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "clicker_config.h"
#include "clicker_hal.h"
#include "clicker_tables.h"

namespace Clicker {

struct ConfettiParticle {
  int16_t x, y;
  int8_t  speed;   // px per step, downwards
  int8_t  drift;   // px per step, sideways
};

struct ExplosionParticle {
  char  digit;
  float x, y;
  float vx, vy;
  float scale;
};

struct Spark { int16_t x, y; };

enum class Spectacle : uint8_t { NONE, EXPLOSION, EASTER_EGG };
enum class SpectacleStep : uint8_t { IDLE, FRAME, FINISHED };

class AnimationEngine {
public:
  explicit AnimationEngine(RandomSource& rng);

  // ---- confetti ----
  void startConfetti(uint32_t now);
  // Advances at the confetti cadence. True when particles moved.
  bool updateConfetti(uint32_t now);
  bool confettiActive() const { return !confetti_.empty(); }
  const std::vector<ConfettiParticle>& confetti() const { return confetti_; }

  // ---- spectacles (a new one replaces the one playing) ----
  void startExplosion(uint32_t value, uint32_t now);
  void startEasterEgg(const EasterEgg& egg, uint32_t now);

  // FRAME: a new frame is ready to draw. FINISHED: the spectacle ended on
  // this call (easter eggs have already started their confetti).
  SpectacleStep step(uint32_t now);

  bool spectacleActive() const { return spectacle_ != Spectacle::NONE; }
  Spectacle spectacle() const { return spectacle_; }
  Spectacle lastFinished() const { return lastFinished_; }
  uint8_t frame() const { return frame_; }
  uint8_t frameCount() const { return frameCount_; }
  uint32_t frameMs() const { return frameMs_; }
  bool showingCaption() const { return caption_; }
  uint32_t spectacleValue() const { return value_; }
  const std::vector<ExplosionParticle>& explosion() const { return particles_; }
  const std::vector<Spark>& sparks() const { return sparks_; }

  // Full-screen frame of the current spectacle.
  void drawSpectacle(Display& d) const;

  // Frame count / cadence for an easter-egg motif.
  static uint8_t motifFrames(EggMotif m);
  static uint32_t motifFrameMs(EggMotif m);

private:
  void prepareFrame();
  void stepExplosion();
  void drawExplosion(Display& d) const;
  void drawEasterEgg(Display& d) const;

  RandomSource& rng_;

  std::vector<ConfettiParticle> confetti_;
  uint32_t lastConfetti_ = 0;

  Spectacle spectacle_ = Spectacle::NONE;
  Spectacle lastFinished_ = Spectacle::NONE;
  EggMotif  motif_ = EggMotif::WINK;
  uint32_t  value_ = 0;
  uint8_t   frame_ = 0;
  uint8_t   frameCount_ = 0;
  uint32_t  frameMs_ = 0;
  uint32_t  frameStart_ = 0;
  bool      caption_ = false;

  // explosion
  std::vector<ExplosionParticle> particles_;
  std::vector<Spark> sparks_;

  // per-frame randomness for the motifs
  static constexpr uint8_t MATRIX_COLS = 16;
  int8_t  flameJitter_[2][3] = {};
  uint8_t matrixStart_[MATRIX_COLS] = {};
  char    matrixChar_[MATRIX_COLS] = {};
};

} // namespace Clicker
