// Attachment tests: contract validation with 1-based positions, flattening of
// collections, absorbing other readers, and opening paths.
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fusedstream/core/fused_reader.hpp"
#include "fusedstream/errors.hpp"
#include "fusedstream/io/stream.hpp"
#include "test_support.hpp"

using fusedstream::InvalidStreamError;
using fusedstream::OpenFailure;
using fusedstream::core::FusedReader;
using fusedstream::core::StreamSource;
using fusedstream::io::StreamCapability;
using fusedstream::testing::CloseLog;
using fusedstream::testing::Mem;
using fusedstream::testing::RestrictedStream;
using fusedstream::testing::TempFile;
using fusedstream::testing::TrackedStream;
using fusedstream::testing::UnmeasurableStream;

namespace {

constexpr std::uint32_t kReadClose =
    static_cast<std::uint32_t>(StreamCapability::Read) | static_cast<std::uint32_t>(StreamCapability::Close);

TEST(Attach, RejectsStreamMissingCapability) {
  FusedReader fused;
  fused.Attach(Mem("ok"));
  try {
    fused.Attach(std::make_unique<RestrictedStream>("no seek", kReadClose));
    FAIL() << "expected InvalidStreamError";
  } catch (const InvalidStreamError& e) {
    EXPECT_EQ(e.Position(), 2u);
    EXPECT_STREQ(e.what(), "invalid stream: #2");
  }
  EXPECT_EQ(fused.MemberCount(), 1u);
  EXPECT_EQ(*fused.ReadAll(), "ok");
}

TEST(Attach, RejectsNullAndUnmeasurableStreams) {
  FusedReader fused;
  EXPECT_THROW(fused.Attach(nullptr), InvalidStreamError);
  EXPECT_THROW(fused.Attach(std::make_unique<UnmeasurableStream>("abc")), InvalidStreamError);
  EXPECT_EQ(fused.MemberCount(), 0u);
  EXPECT_TRUE(fused.IsFinished());
}

TEST(Attach, InvalidStreamInManyKeepsEarlierItems) {
  FusedReader fused;
  EXPECT_THROW(fused.AttachAll(Mem("a"), Mem("b"), std::make_unique<RestrictedStream>("c", kReadClose)),
               InvalidStreamError);
  EXPECT_EQ(fused.MemberCount(), 2u);
}

TEST(Attach, MeasuresSizeAndRewinds) {
  auto stream = Mem("abcdef");
  (void)stream->Read(4);
  FusedReader fused;
  fused.Attach(std::move(stream));
  EXPECT_EQ(fused.MemberSize(0), 6u);
  EXPECT_EQ(*fused.ReadAll(), "abcdef");
}

TEST(Attach, FlattenEquivalence) {
  auto as_sequence = FusedReader::FromStreams(StreamSource::Sequence(Mem("a"), Mem("b"), Mem("c")));

  auto as_arguments = FusedReader::FromStreams(Mem("a"), Mem("b"), Mem("c"));

  auto ab = FusedReader::FromStreams(StreamSource::Sequence(Mem("a"), Mem("b")));
  FusedReader via_reader;
  via_reader.AttachAll(ab, Mem("c"));
  EXPECT_EQ(ab.MemberCount(), 0u);

  EXPECT_EQ(as_sequence.MemberCount(), 3u);
  EXPECT_EQ(as_arguments.MemberCount(), 3u);
  EXPECT_EQ(via_reader.MemberCount(), 3u);
  EXPECT_EQ(*as_sequence.ReadAll(), "abc");
  EXPECT_EQ(*as_arguments.ReadAll(), "abc");
  EXPECT_EQ(*via_reader.ReadAll(), "abc");
}

TEST(Attach, ContinuesAfterAbsorbedReader) {
  auto inner = FusedReader::FromStreams(Mem("1"), Mem("2"));
  FusedReader fused;
  fused.AttachAll(Mem("0"), inner, Mem("3"), StreamSource::Sequence(Mem("4"), Mem("5")));
  EXPECT_EQ(fused.MemberCount(), 6u);
  EXPECT_EQ(*fused.ReadAll(), "012345");
}

TEST(Attach, NestedCollectionsFlattenInOrder) {
  std::vector<StreamSource> items;
  items.emplace_back(Mem("a"));
  items.emplace_back(StreamSource::Sequence(Mem("b"), StreamSource::Sequence(Mem("c"))));
  items.emplace_back(std::vector<StreamSource>{});
  items.emplace_back(Mem("d"));
  FusedReader fused;
  fused.AttachMany(std::move(items));
  EXPECT_EQ(fused.MemberCount(), 4u);
  EXPECT_EQ(*fused.ReadAll(), "abcd");
}

TEST(Attach, AbsorbsOnlyUnreadMembersKeepingPosition) {
  auto log = std::make_shared<CloseLog>();
  FusedReader donor;
  donor.Attach(std::make_unique<TrackedStream>("abc", log, 1));
  donor.Attach(std::make_unique<TrackedStream>("def", log, 2));
  EXPECT_EQ(*donor.ReadBytes(4), "abcd");
  EXPECT_EQ(log->Count(1), 1u);

  FusedReader fused;
  fused.Attach(Mem("X"));
  fused.AttachAll(donor);
  EXPECT_EQ(fused.MemberCount(), 2u);
  EXPECT_TRUE(donor.IsFinished());
  EXPECT_EQ(donor.MemberCount(), 0u);

  EXPECT_EQ(*fused.ReadAll(), "Xef");
  EXPECT_EQ(log->Count(1), 1u);
  EXPECT_EQ(log->Count(2), 1u);
}

TEST(Attach, AbsorbingItselfThrows) {
  auto fused = FusedReader::FromStreams(Mem("a"));
  EXPECT_THROW(fused.AttachAll(fused), std::invalid_argument);
  EXPECT_EQ(fused.MemberCount(), 1u);
}

TEST(Attach, AdaptsStandardStreams) {
  auto fused = FusedReader::FromStreams(std::make_unique<std::istringstream>("hi "), Mem("there"));
  EXPECT_EQ(fused.MemberCount(), 2u);
  EXPECT_EQ(*fused.ReadAll(), "hi there");
}

TEST(Attach, FromPathsRawOpensInOrder) {
  TempFile a("paths_a.txt", "first\n");
  TempFile b("paths_b.txt", "second\n");
  auto fused = FusedReader::FromPathsRaw({b.Path(), a.Path()});
  EXPECT_EQ(*fused.ReadLine(), "second");
  EXPECT_EQ(*fused.ReadLine(), "first");
}

TEST(Attach, FromPathsRawPropagatesFirstOpenFailure) {
  TempFile a("paths_ok.txt", "data");
  const std::string missing = a.Path() + ".missing";
  try {
    (void)FusedReader::FromPathsRaw({a.Path(), missing, a.Path()});
    FAIL() << "expected OpenFailure";
  } catch (const OpenFailure& e) {
    EXPECT_EQ(e.Path(), missing);
  }
}

}  // namespace
