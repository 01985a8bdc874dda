// Numeric literal parsing across member boundaries.
// A split literal must parse exactly like the same literal in one member; the
// byte that ends a literal is consumed.
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>

#include "fusedstream/core/fused_reader.hpp"
#include "fusedstream/core/read_mode.hpp"
#include "fusedstream/log.hpp"
#include "test_support.hpp"

using fusedstream::core::FusedReader;
using fusedstream::core::ReadMode;
using fusedstream::testing::Mem;
using fusedstream::testing::TempFile;

namespace {

TEST(ReadNumber, HexLiteral) {
  auto fused = FusedReader::FromStreams(Mem("0xfeed"));
  const auto results = fused.Read({ReadMode::Parse("n")});
  EXPECT_EQ(std::get<std::uint64_t>(results[0]), 0xfeedu);
}

TEST(ReadNumber, HexLiteralFromFile) {
  TempFile num("num.txt", "0xfeed");
  auto fused = FusedReader::FromPathsRaw({num.Path()});
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(0xfeed));
}

TEST(ReadNumber, DecimalLiteral) {
  auto fused = FusedReader::FromStreams(Mem("420"));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(420));
  EXPECT_TRUE(fused.IsFinished());
}

TEST(ReadNumber, DecimalSpanningThreeMembers) {
  auto fused = FusedReader::FromStreams(Mem("420"), Mem("69"), Mem("666"));
  const auto results = fused.Read({ReadMode::Number()});
  EXPECT_EQ(std::get<std::uint64_t>(results[0]), 42069666u);
}

TEST(ReadNumber, PrefixedLiteralSpanningMembers) {
  auto fused = FusedReader::FromStreams(Mem("0"), Mem("x"), Mem("fe"), Mem("ed"));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(0xfeed));

  auto split_prefix = FusedReader::FromStreams(Mem("12 0"), Mem("b1"), Mem("01"));
  EXPECT_EQ(split_prefix.ReadNumber(), std::optional<std::uint64_t>(12));
  EXPECT_EQ(split_prefix.ReadNumber(), std::optional<std::uint64_t>(5));
}

TEST(ReadNumber, RadixPrefixes) {
  auto fused = FusedReader::FromStreams(Mem("0o17 0B101 0XFF"));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(15));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(5));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(255));
  EXPECT_FALSE(fused.ReadNumber().has_value());
}

TEST(ReadNumber, ZeroWithoutPrefixDropsNextByte) {
  auto fused = FusedReader::FromStreams(Mem("0;5"));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(0));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(5));

  // "07": the 7 is taken as the byte after the zero and lost.
  auto leading_zero = FusedReader::FromStreams(Mem("07"));
  EXPECT_EQ(leading_zero.ReadNumber(), std::optional<std::uint64_t>(0));
  EXPECT_TRUE(leading_zero.IsFinished());
}

TEST(ReadNumber, LoneZero) {
  auto fused = FusedReader::FromStreams(Mem("0"));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(0));
}

TEST(ReadNumber, TerminatingByteIsConsumed) {
  auto fused = FusedReader::FromStreams(Mem("12,34"));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(12));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(34));

  auto text = FusedReader::FromStreams(Mem("12 x"));
  EXPECT_EQ(text.ReadNumber(), std::optional<std::uint64_t>(12));
  EXPECT_EQ(*text.ReadBytes(1), "x");
}

TEST(ReadNumber, NoLiteralConsumesOneByte) {
  auto fused = FusedReader::FromStreams(Mem("abc"));
  EXPECT_FALSE(fused.ReadNumber().has_value());
  EXPECT_EQ(*fused.ReadBytes(2), "bc");
}

TEST(ReadNumber, PrefixWithoutDigits) {
  auto fused = FusedReader::FromStreams(Mem("0xg1"));
  EXPECT_FALSE(fused.ReadNumber().has_value());
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(1));
}

TEST(ReadNumber, LimitsOfUnsigned64) {
  const auto saved = fusedstream::log::GetLogLevel();
  fusedstream::log::SetLogLevel(fusedstream::log::LogLevel::Off);

  auto fused = FusedReader::FromStreams(Mem("18446744073709551615 18446744073709551616"));
  EXPECT_EQ(fused.ReadNumber(), std::optional<std::uint64_t>(std::numeric_limits<std::uint64_t>::max()));
  EXPECT_FALSE(fused.ReadNumber().has_value());

  fusedstream::log::SetLogLevel(saved);
}

}  // namespace
