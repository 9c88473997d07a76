#include "animation_engine.h"
#include "display_compositor.h"
#include <stdio.h>
#include <string.h>

namespace Clicker {

// ======= Layout =======
static constexpr int16_t NUMBER_Y    = 24;
static constexpr int16_t SPARK_CX    = 64;
static constexpr int16_t SPARK_CY    = 30;
static constexpr int16_t DRAW_MIN    = -20;   // explosion digits drawn inside
static constexpr int16_t DRAW_MAX_X  = 140;   // a margin around the canvas
static constexpr int16_t DRAW_MAX_Y  = 80;

AnimationEngine::AnimationEngine(RandomSource& rng) : rng_(rng) {}

// ===============================
// Confetti
// ===============================
void AnimationEngine::startConfetti(uint32_t now) {
  confetti_.clear();
  for (uint8_t i = 0; i < Config::CONFETTI_COUNT; ++i) {
    ConfettiParticle p;
    p.x     = (int16_t)rng_.next(0, Config::SCREEN_W);
    p.y     = (int16_t)rng_.next(-30, 1);
    p.speed = (int8_t)rng_.next(3, 7);
    p.drift = (int8_t)rng_.next(-1, 2);
    confetti_.push_back(p);
  }
  lastConfetti_ = now;
}

bool AnimationEngine::updateConfetti(uint32_t now) {
  if (confetti_.empty()) return false;
  if (now - lastConfetti_ < Config::CONFETTI_STEP_MS) return false;
  lastConfetti_ = now;

  size_t keep = 0;
  for (size_t i = 0; i < confetti_.size(); ++i) {
    ConfettiParticle p = confetti_[i];
    p.y += p.speed;
    p.x += p.drift;
    if (p.y < Config::CONFETTI_PRUNE_Y) confetti_[keep++] = p;
  }
  confetti_.resize(keep);
  return true;
}

// ===============================
// Spectacles
// ===============================
uint8_t AnimationEngine::motifFrames(EggMotif m) {
  switch (m) {
    case EggMotif::FLAMES:
    case EggMotif::MATRIX:   return 8;
    case EggMotif::WINK:
    case EggMotif::HORNS:
    case EggMotif::EYE_ROLL: return 6;
  }
  return 6;
}

uint32_t AnimationEngine::motifFrameMs(EggMotif m) {
  return (m == EggMotif::FLAMES || m == EggMotif::MATRIX) ? 75 : 100;
}

void AnimationEngine::startExplosion(uint32_t value, uint32_t now) {
  spectacle_  = Spectacle::EXPLOSION;
  value_      = value;
  frame_      = 0;
  frameCount_ = Config::EXPLOSION_FRAMES;
  frameMs_    = Config::EXPLOSION_FRAME_MS;
  frameStart_ = now;
  caption_    = false;

  char digits[12];
  snprintf(digits, sizeof(digits), "%lu", (unsigned long)value);
  const int len = (int)strlen(digits);
  const int digitW = largeDigitAdvance(LARGE_DIGIT_SCALE);
  float x = (float)((Config::SCREEN_W - (len * digitW - 2)) / 2);

  // one particle per digit, flung sideways and up
  particles_.clear();
  for (int i = 0; i < len; ++i) {
    const int speed = rng_.next(4, 9);
    const float dir = rng_.next(0, 2) ? 1.0f : -1.0f;
    ExplosionParticle p;
    p.digit = digits[i];
    p.x     = x;
    p.y     = NUMBER_Y;
    p.vx    = speed * dir * (rng_.next(0, 1000) / 1000.0f);
    p.vy    = (float)(-speed + rng_.next(-2, 3));
    p.scale = LARGE_DIGIT_SCALE;
    particles_.push_back(p);
    x += digitW;
  }
  prepareFrame();
}

void AnimationEngine::startEasterEgg(const EasterEgg& egg, uint32_t now) {
  spectacle_  = Spectacle::EASTER_EGG;
  motif_      = egg.motif;
  value_      = egg.value;
  frame_      = 0;
  frameCount_ = motifFrames(egg.motif);
  frameMs_    = motifFrameMs(egg.motif);
  frameStart_ = now;
  caption_    = false;
  particles_.clear();
  sparks_.clear();

  if (motif_ == EggMotif::MATRIX) {
    for (uint8_t i = 0; i < MATRIX_COLS; ++i) matrixStart_[i] = (uint8_t)rng_.next(0, 16);
  }
  prepareFrame();
}

void AnimationEngine::stepExplosion() {
  const float g = Config::EXPLOSION_GRAVITY;
  for (ExplosionParticle& p : particles_) {
    p.vy += g;
    p.x  += p.vx;
    p.y  += p.vy;
    // shrink through the second half
    if (frame_ > frameCount_ / 2) {
      p.scale -= Config::EXPLOSION_SHRINK;
      if (p.scale < 1.0f) p.scale = 1.0f;
    }
  }

  sparks_.clear();
  if (frame_ < Config::EXPLOSION_SPARK_FRAMES) {
    for (uint8_t i = 0; i < Config::EXPLOSION_SPARKS; ++i) {
      Spark s;
      s.x = (int16_t)(SPARK_CX + rng_.next(-30, 31));
      s.y = (int16_t)(SPARK_CY + rng_.next(-15, 16));
      if (s.x >= 0 && s.x < Config::SCREEN_W && s.y >= 0 && s.y < Config::SCREEN_H) {
        sparks_.push_back(s);
      }
    }
  }
}

void AnimationEngine::prepareFrame() {
  if (spectacle_ == Spectacle::EXPLOSION) {
    stepExplosion();
    return;
  }
  switch (motif_) {
    case EggMotif::FLAMES:
      for (int side = 0; side < 2; ++side)
        for (int i = 0; i < 3; ++i) flameJitter_[side][i] = (int8_t)rng_.next(-2, 3);
      break;
    case EggMotif::MATRIX:
      for (uint8_t i = 0; i < MATRIX_COLS; ++i) matrixChar_[i] = (char)('0' + rng_.next(0, 10));
      break;
    default:
      break;
  }
}

SpectacleStep AnimationEngine::step(uint32_t now) {
  if (spectacle_ == Spectacle::NONE) return SpectacleStep::IDLE;

  const uint32_t hold = caption_ ? Config::EXPLOSION_CAPTION_MS : frameMs_;
  if (now - frameStart_ < hold) return SpectacleStep::IDLE;
  frameStart_ = now;

  if (!caption_ && frame_ + 1 < frameCount_) {
    ++frame_;
    prepareFrame();
    return SpectacleStep::FRAME;
  }

  // explosion ends on a held caption
  if (spectacle_ == Spectacle::EXPLOSION && !caption_) {
    caption_ = true;
    sparks_.clear();
    return SpectacleStep::FRAME;
  }

  lastFinished_ = spectacle_;
  if (spectacle_ == Spectacle::EASTER_EGG) startConfetti(now);
  spectacle_ = Spectacle::NONE;
  caption_ = false;
  particles_.clear();
  sparks_.clear();
  return SpectacleStep::FINISHED;
}

// ===============================
// Drawing
// ===============================
void AnimationEngine::drawSpectacle(Display& d) const {
  if (spectacle_ == Spectacle::EXPLOSION) drawExplosion(d);
  else if (spectacle_ == Spectacle::EASTER_EGG) drawEasterEgg(d);
}

void AnimationEngine::drawExplosion(Display& d) const {
  d.clear();
  drawHeader(d, TITLE_TEXT);

  if (caption_) {
    d.drawText("BOOM!", 44, 35);
    d.present();
    return;
  }

  for (const ExplosionParticle& p : particles_) {
    if (p.x >= DRAW_MIN && p.x <= DRAW_MAX_X && p.y >= DRAW_MIN && p.y <= DRAW_MAX_Y) {
      int scale = (int)p.scale;
      if (scale < 1) scale = 1;
      drawLargeDigit(d, p.digit, (int16_t)p.x, (int16_t)p.y, scale);
    }
  }
  for (const Spark& s : sparks_) d.drawPixel(s.x, s.y);
  d.present();
}

void AnimationEngine::drawEasterEgg(Display& d) const {
  d.clear();
  drawHeader(d, TITLE_TEXT);
  drawLargeNumber(d, value_, NUMBER_Y);

  switch (motif_) {
    case EggMotif::WINK:
      d.drawText(frame_ % 2 == 0 ? ";)" : ":)", 56, 48);
      break;

    case EggMotif::FLAMES: {
      const int16_t sides[2] = {8, 108};
      for (int s = 0; s < 2; ++s) {
        const int baseY = 45 - (frame_ % 5);
        for (int i = 0; i < 3; ++i) {
          const int y = baseY - i * 4 + flameJitter_[s][i];
          const int w = 12 - i * 3;
          const int x = sides[s] - w / 2 + 6;
          if (y > 14 && y < 64) d.drawFilledRect((int16_t)x, (int16_t)y, (int16_t)w, 3);
        }
      }
    } break;

    case EggMotif::HORNS:
      if (frame_ % 2 == 0) {
        for (int i = 0; i < 8; ++i) {
          d.drawPixel(20 + i, 48 - i);
          d.drawPixel(21 + i, 48 - i);
          d.drawPixel(107 - i, 48 - i);
          d.drawPixel(106 - i, 48 - i);
        }
      }
      d.drawText("\\m/    \\m/", 20, 52);
      break;

    case EggMotif::MATRIX:
      for (uint8_t i = 0; i < MATRIX_COLS; ++i) {
        const int y = (matrixStart_[i] + frame_ * 3) % 50 + 14;
        if (y < 64) d.drawText(std::string(1, matrixChar_[i]), (int16_t)(i * 8), (int16_t)y);
      }
      break;

    case EggMotif::EYE_ROLL: {
      const int16_t eyeX = 48 + (frame_ % 4) - 2;
      d.drawText("(", 40, 50);
      d.drawText("-", eyeX, 50);
      d.drawText("_", 60, 50);
      d.drawText("-", eyeX + 24, 50);
      d.drawText(")", 80, 50);
    } break;
  }
  d.present();
}

} // namespace Clicker
