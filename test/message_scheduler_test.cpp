#include <gtest/gtest.h>
#include "message_scheduler.h"

using namespace Clicker;

TEST(WordWrap, ShortMessageIsOneLine) {
  WrappedText w = wordWrap("Nice.");
  EXPECT_EQ("Nice.", w.line1);
  EXPECT_EQ("", w.line2);

  w = wordWrap("Keep going champ");   // exactly 16
  EXPECT_EQ("Keep going champ", w.line1);
  EXPECT_EQ("", w.line2);
}

TEST(WordWrap, BreaksAtLastSpaceInsideWidth) {
  WrappedText w = wordWrap("My grandma clicks faster");
  EXPECT_EQ("My grandma", w.line1);
  EXPECT_EQ("clicks faster", w.line2);

  w = wordWrap("Press F to pay respects");
  EXPECT_EQ("Press F to pay", w.line1);
  EXPECT_EQ("respects", w.line2);
}

TEST(WordWrap, HardBreakWithoutSpaces) {
  WrappedText w = wordWrap("ABCDEFGHIJKLMNOPQRST");
  EXPECT_EQ("ABCDEFGHIJKLMNOP", w.line1);
  EXPECT_EQ("QRST", w.line2);
}

TEST(WordWrap, SpaceRightAtTheWidth) {
  WrappedText w = wordWrap("ABCDEFGHIJKLMNOP QRS");
  EXPECT_EQ("ABCDEFGHIJKLMNOP", w.line1);
  EXPECT_EQ("QRS", w.line2);
}

TEST(FoldToAscii, EachSequenceBecomesOneMark) {
  EXPECT_EQ("plain", foldToAscii("plain"));
  EXPECT_EQ("it?s", foldToAscii("it\xE2\x80\x99s"));
  EXPECT_EQ("caf?", foldToAscii("caf\xC3\xA9"));
  EXPECT_EQ("?!", foldToAscii("\xF0\x9F\x98\x80!"));
  EXPECT_EQ("a?b", foldToAscii("a\x80" "b"));
}

TEST(Trim, StripsSurroundingWhitespace) {
  EXPECT_EQ("a b", trimCopy("  a b \r\n"));
  EXPECT_EQ("", trimCopy(" \t "));
  EXPECT_EQ("x", trimCopy("x"));
}

TEST(MessageScheduler, ExpiresAfterDuration) {
  MessageScheduler m;
  m.show("Weak.", 1000);
  EXPECT_TRUE(m.active());
  EXPECT_EQ(5000u, m.expiresAt());

  EXPECT_FALSE(m.update(3000));
  EXPECT_FALSE(m.update(5000));
  EXPECT_TRUE(m.active());

  EXPECT_TRUE(m.update(5001));
  EXPECT_FALSE(m.active());
  EXPECT_EQ("", m.line1());
  EXPECT_FALSE(m.update(6000));
}

TEST(MessageScheduler, ShowReplacesCurrentMessage) {
  MessageScheduler m;
  m.show("Hello supercalifragilisticexpialidocious", 0, 60000);
  m.update(200);
  m.update(400);
  ASSERT_EQ(2u, m.scrollOffset());

  m.show("Sad.", 500);
  EXPECT_EQ("Sad.", m.text());
  EXPECT_EQ(0u, m.scrollOffset());
  EXPECT_FALSE(m.scrolling());
  EXPECT_EQ(4500u, m.expiresAt());
}

TEST(MessageScheduler, ShortSecondLineDoesNotScroll) {
  MessageScheduler m;
  m.show("My grandma clicks faster", 0);
  EXPECT_FALSE(m.scrolling());
  EXPECT_FALSE(m.update(200));
  EXPECT_EQ("clicks faster", m.visibleLine2());
}

TEST(MessageScheduler, LongSecondLineScrollsAndWraps) {
  const std::string line2 = "supercalifragilisticexpialidocious";   // 34 chars
  MessageScheduler m;
  m.show("Hello " + line2, 0, 60000);
  ASSERT_EQ("Hello", m.line1());
  ASSERT_EQ(line2, m.line2());
  EXPECT_TRUE(m.scrolling());
  EXPECT_EQ(line2.substr(0, 16), m.visibleLine2());

  EXPECT_FALSE(m.update(199));
  EXPECT_TRUE(m.update(200));
  EXPECT_EQ(1u, m.scrollOffset());

  const std::string loop = line2 + "   " + line2;
  uint32_t t = 200;
  for (size_t step = 2; step < line2.size() + 3; ++step) {
    t += 200;
    EXPECT_TRUE(m.update(t));
    ASSERT_EQ(step, m.scrollOffset());
    EXPECT_EQ(loop.substr(step, 16), m.visibleLine2());
  }

  t += 200;
  EXPECT_TRUE(m.update(t));
  EXPECT_EQ(0u, m.scrollOffset());
}

TEST(MessageScheduler, ExpirySurvivesMillisWrap) {
  MessageScheduler m;
  m.show("Weak.", 0xFFFFF800u);
  EXPECT_EQ(0x000007A0u, m.expiresAt());
  EXPECT_FALSE(m.update(0xFFFFFF00u));
  EXPECT_FALSE(m.update(0x00000100u));
  EXPECT_FALSE(m.update(0x000007A0u));
  EXPECT_TRUE(m.active());
  EXPECT_TRUE(m.update(0x000007A1u));
  EXPECT_FALSE(m.active());
}

TEST(MessageScheduler, MultibyteTextNeverSplitsAcrossLines) {
  MessageScheduler m;
  m.show("Aaaaaaaaaaaaaa\xE2\x80\x99sbbbbb", 0);
  EXPECT_EQ("Aaaaaaaaaaaaaa?s", m.line1());
  EXPECT_EQ("bbbbb", m.line2());
  for (char c : m.line1() + m.line2()) EXPECT_LT((unsigned char)c, 0x80);
}

TEST(MessageScheduler, ClearDropsEverything) {
  MessageScheduler m;
  m.show("Slow clap", 0);
  m.clear();
  EXPECT_FALSE(m.active());
  EXPECT_EQ("", m.text());
  EXPECT_EQ("", m.visibleLine2());
}
