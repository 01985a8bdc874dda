#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "fusedstream/core/char_class.hpp"
#include "fusedstream/core/fused_reader.hpp"
#include "test_support.hpp"

using fusedstream::core::CharClass;
using fusedstream::core::CharSet;
using fusedstream::core::FusedReader;
using fusedstream::testing::Mem;

namespace {

TEST(CharSet, NamedClasses) {
  EXPECT_EQ(CharSet(CharClass::Digit).Count(), 10u);
  EXPECT_EQ(CharSet(CharClass::HexDigit).Count(), 22u);
  EXPECT_EQ(CharSet(CharClass::OctDigit).Count(), 8u);
  EXPECT_EQ(CharSet(CharClass::BinDigit).Count(), 2u);
  EXPECT_EQ(CharSet(CharClass::Space).Count(), 6u);
  EXPECT_EQ(CharSet(CharClass::Alpha).Count(), 52u);
  EXPECT_EQ(CharSet(CharClass::Alnum).Count(), 62u);
  EXPECT_EQ(CharSet(CharClass::Punct).Count(), 32u);
  EXPECT_EQ(CharSet(CharClass::Control).Count(), 33u);
  EXPECT_TRUE(CharSet(CharClass::HexDigit).Matches('F'));
  EXPECT_FALSE(CharSet(CharClass::HexDigit).Matches('g'));
  EXPECT_FALSE(CharSet(CharClass::Alpha).Matches(static_cast<unsigned char>(0xE9)));
}

TEST(CharSet, PercentClassesAndComplements) {
  const CharSet digits = CharSet::Parse("%d");
  EXPECT_TRUE(digits.Matches('5'));
  EXPECT_FALSE(digits.Matches('a'));
  const CharSet not_digits = CharSet::Parse("%D");
  EXPECT_FALSE(not_digits.Matches('5'));
  EXPECT_TRUE(not_digits.Matches('a'));
  EXPECT_EQ(not_digits.Count(), 246u);
  EXPECT_TRUE(CharSet::Parse("%%").Matches('%'));
  EXPECT_EQ(CharSet::Parse("%.").Count(), 1u);
}

TEST(CharSet, BracketSets) {
  const CharSet range = CharSet::Parse("[a-c]");
  EXPECT_TRUE(range.Matches('b'));
  EXPECT_FALSE(range.Matches('d'));

  const CharSet not_delims = CharSet::Parse("[^,;]");
  EXPECT_FALSE(not_delims.Matches(','));
  EXPECT_FALSE(not_delims.Matches(';'));
  EXPECT_TRUE(not_delims.Matches('x'));

  const CharSet ident = CharSet::Parse("[%d_]");
  EXPECT_TRUE(ident.Matches('_'));
  EXPECT_TRUE(ident.Matches('7'));
  EXPECT_FALSE(ident.Matches('a'));

  EXPECT_TRUE(CharSet::Parse("[]]").Matches(']'));
  EXPECT_TRUE(CharSet::Parse("[a-]").Matches('-'));
  EXPECT_EQ(CharSet::Parse("x").Count(), 1u);
}

TEST(CharSet, MalformedPatternsThrow) {
  EXPECT_THROW(CharSet::Parse(""), std::invalid_argument);
  EXPECT_THROW(CharSet::Parse("%"), std::invalid_argument);
  EXPECT_THROW(CharSet::Parse("%q"), std::invalid_argument);
  EXPECT_THROW(CharSet::Parse("[abc"), std::invalid_argument);
  EXPECT_THROW(CharSet::Parse("ab"), std::invalid_argument);
}

TEST(ReadWhile, PatternRunsDropTheStoppingByte) {
  auto fused = FusedReader::FromStreams(Mem("abc123def"));
  EXPECT_EQ(*fused.ReadWhile("%a"), "abc");
  EXPECT_EQ(*fused.ReadWhile("%d"), "23");  // '1' ended the first run
  EXPECT_EQ(*fused.ReadWhile(CharClass::Alpha), "ef");
}

TEST(ReadWhile, CrossesMemberBoundaries) {
  auto fused = FusedReader::FromStreams(Mem("ab"), Mem("cd"), Mem("1x"));
  EXPECT_EQ(*fused.ReadWhile(CharSet(CharClass::Alpha)), "abcd");
  EXPECT_EQ(*fused.ReadBytes(1), "x");
}

TEST(ReadWhile, NoMatchStillConsumesOneByte) {
  auto fused = FusedReader::FromStreams(Mem("1a"));
  EXPECT_FALSE(fused.ReadWhile("%a").has_value());
  EXPECT_EQ(*fused.ReadBytes(1), "a");
}

TEST(ReadWhile, AcceptsByteFunction) {
  auto fused = FusedReader::FromStreams(Mem("aaab"));
  const auto run = fused.ReadWhile([](unsigned char c) { return c == 'a'; });
  EXPECT_EQ(*run, "aaa");
  EXPECT_TRUE(fused.IsFinished());
}

}  // namespace
