#include <gtest/gtest.h>
#include "fakes.h"
#include "score_tracker.h"

using namespace Clicker;
using Clicker::Testing::MemoryStore;

namespace {

IncrementResult incrementTo(ScoreTracker& t, uint32_t target) {
  IncrementResult r;
  while (t.count() < target) r = t.applyIncrement();
  return r;
}

} // namespace

TEST(ScoreTracker, BeginLoadsStoredHighScore) {
  MemoryStore store(250);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();
  EXPECT_EQ(1, store.reads);
  EXPECT_EQ(250u, t.highScore());
  EXPECT_EQ(0u, t.count());
}

TEST(ScoreTracker, FirstClickOnBlankDeviceIsPlain) {
  MemoryStore store(0);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = t.applyIncrement();
  EXPECT_EQ(IncrementOutcome::PLAIN, r.outcome);
  EXPECT_TRUE(r.highScoreChanged);
  EXPECT_EQ(1u, t.count());
  EXPECT_EQ(1u, t.highScore());
  EXPECT_EQ(1u, store.value);
  EXPECT_TRUE(t.recordBrokenThisSession());
}

TEST(ScoreTracker, BeatingStoredRecordCelebratesOnce) {
  MemoryStore store(5);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = incrementTo(t, 5);
  EXPECT_EQ(IncrementOutcome::PLAIN, r.outcome);
  EXPECT_TRUE(store.writes.empty());

  r = t.applyIncrement();
  EXPECT_EQ(IncrementOutcome::NEW_RECORD, r.outcome);
  EXPECT_EQ(6u, store.value);

  r = t.applyIncrement();
  EXPECT_EQ(IncrementOutcome::PLAIN, r.outcome);
  EXPECT_TRUE(r.highScoreChanged);
  EXPECT_EQ(7u, store.value);
  EXPECT_EQ(7u, t.highScore());
}

TEST(ScoreTracker, MilestoneBelowHighScore) {
  MemoryStore store(500);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = incrementTo(t, 100);
  EXPECT_EQ(IncrementOutcome::MILESTONE, r.outcome);
  EXPECT_FALSE(r.highScoreChanged);
  EXPECT_EQ(500u, t.highScore());
}

TEST(ScoreTracker, MilestoneAfterRecordAlreadyBroken) {
  MemoryStore store(150);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = incrementTo(t, 151);
  EXPECT_EQ(IncrementOutcome::NEW_RECORD, r.outcome);
  r = incrementTo(t, 200);
  EXPECT_EQ(IncrementOutcome::MILESTONE, r.outcome);
  EXPECT_EQ(200u, t.highScore());
  EXPECT_EQ(200u, store.value);
}

TEST(ScoreTracker, RecordTakesPriorityOverMilestone) {
  MemoryStore store(99);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = incrementTo(t, 100);
  EXPECT_EQ(IncrementOutcome::NEW_RECORD, r.outcome);
}

TEST(ScoreTracker, EasterEggRaisesHighScore) {
  MemoryStore store(0);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = incrementTo(t, 69);
  ASSERT_EQ(IncrementOutcome::EASTER_EGG, r.outcome);
  ASSERT_NE(nullptr, r.egg);
  EXPECT_EQ("Nice.", r.egg->message);
  EXPECT_EQ(EggMotif::WINK, r.egg->motif);
  EXPECT_EQ(69u, t.highScore());
  EXPECT_EQ(69u, store.value);
}

TEST(ScoreTracker, EasterEggBeatsRecord) {
  MemoryStore store(68);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = incrementTo(t, 69);
  EXPECT_EQ(IncrementOutcome::EASTER_EGG, r.outcome);
  EXPECT_TRUE(r.highScoreChanged);
}

TEST(ScoreTracker, EasterEggBelowHighScoreKeepsIt) {
  MemoryStore store(1000);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  IncrementResult r = incrementTo(t, 420);
  ASSERT_EQ(IncrementOutcome::EASTER_EGG, r.outcome);
  EXPECT_EQ("Blaze it", r.egg->message);
  EXPECT_FALSE(r.highScoreChanged);
  EXPECT_EQ(1000u, t.highScore());
}

TEST(ScoreTracker, ResetAtZeroDoesNothing) {
  MemoryStore store(3);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();
  EXPECT_FALSE(t.applyReset());
  EXPECT_EQ(3u, t.highScore());
}

TEST(ScoreTracker, ResetRearmsRecordCelebration) {
  MemoryStore store(10);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();

  EXPECT_EQ(IncrementOutcome::NEW_RECORD, incrementTo(t, 11).outcome);
  EXPECT_TRUE(t.applyReset());
  EXPECT_EQ(0u, t.count());
  EXPECT_EQ(11u, t.highScore());
  EXPECT_FALSE(t.recordBrokenThisSession());

  EXPECT_EQ(IncrementOutcome::PLAIN, incrementTo(t, 11).outcome);
  EXPECT_EQ(IncrementOutcome::NEW_RECORD, incrementTo(t, 12).outcome);
}

TEST(ScoreTracker, SecretResetWipesAndPersistsZero) {
  MemoryStore store(42);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();
  incrementTo(t, 5);

  EXPECT_EQ(42u, t.applySecretReset());
  EXPECT_EQ(0u, t.count());
  EXPECT_EQ(0u, t.highScore());
  EXPECT_EQ(0u, store.value);
  ASSERT_FALSE(store.writes.empty());
  EXPECT_EQ(0u, store.writes.back());
}

TEST(ScoreTracker, HighScoreNeverBelowCount) {
  MemoryStore store(0);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();
  XorShiftRandom rng(7);
  for (int i = 0; i < 5000; ++i) {
    const int op = rng.next(0, 100);
    if (op < 90) t.applyIncrement();
    else if (op < 99) t.applyReset();
    else t.applySecretReset();
    ASSERT_GE(t.highScore(), t.count());
  }
}

TEST(ScoreTracker, CustomEggTable) {
  MemoryStore store(0);
  std::vector<EasterEgg> eggs;
  eggs.push_back(EasterEgg{3, "three", EggMotif::HORNS});
  ScoreTracker t(store, eggs);
  t.begin();

  IncrementResult r = incrementTo(t, 3);
  ASSERT_EQ(IncrementOutcome::EASTER_EGG, r.outcome);
  EXPECT_EQ("three", r.egg->message);
  EXPECT_EQ(IncrementOutcome::PLAIN, incrementTo(t, 69).outcome);
}

TEST(ScoreTracker, RecordAfterSecretResetStaysQuietUntilNormalReset) {
  MemoryStore store(50);
  ScoreTracker t(store, defaultEasterEggs());
  t.begin();
  t.applySecretReset();

  // blank score again: the climb sets the record without celebrating
  IncrementResult r = t.applyIncrement();
  EXPECT_EQ(IncrementOutcome::PLAIN, r.outcome);
  r = incrementTo(t, 10);
  EXPECT_EQ(IncrementOutcome::PLAIN, r.outcome);
  EXPECT_EQ(10u, t.highScore());

  ASSERT_TRUE(t.applyReset());
  incrementTo(t, 10);
  r = t.applyIncrement();
  EXPECT_EQ(IncrementOutcome::NEW_RECORD, r.outcome);
  EXPECT_EQ(11u, t.highScore());
}
