#pragma once

// =============================================================================
// File:        include/fusedstream/core/fused_reader.hpp
// Overview:    FusedReader presents an ordered list of finite streams as one
//              logical stream. Byte, line, read-all, predicate-run and numeric
//              reads cross member boundaries transparently.
// Resource Model: Each member is owned by the reader from attachment until it
//              is closed. A member is closed as soon as it is exhausted (eager
//              close on advance), or by Close()/the destructor otherwise; never
//              twice.
// Error Model: Attaching a stream that fails the contract throws
//              InvalidStreamError; FromPathsRaw propagates OpenFailure. End of
//              data is reported by empty optionals, never by exceptions.
//              Close failures are logged and otherwise ignored.
// Lookahead:   ReadWhile/ReadNumber consume and discard the first byte that
//              ends a run. There is no pushback.
// =============================================================================

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "fusedstream/config.hpp"
#include "fusedstream/core/char_class.hpp"
#include "fusedstream/core/read_mode.hpp"
#include "fusedstream/errors.hpp"
#include "fusedstream/io/adapter.hpp"
#include "fusedstream/io/file_stream.hpp"
#include "fusedstream/io/stream.hpp"
#include "fusedstream/log.hpp"

namespace fusedstream::core {

class FusedReader;

/**
 * @brief One argument to FusedReader::AttachMany.
 *
 * Tagged union of the three accepted shapes, resolved at construction:
 * - Single: a stream. A std::istream handle is adapted here, so the choice
 *   between a native stream and an adapted one is made by the caller's type.
 * - Collection: a sequence of sources, flattened recursively in order.
 * - Reader: another FusedReader whose unread members are moved over.
 *
 * Constructors are implicit so sources can be passed inline.
 */
class StreamSource {
 public:
  enum class Kind : std::uint8_t { Single, Collection, Reader };

  StreamSource(std::unique_ptr<io::Stream> stream)  // NOLINT(google-explicit-constructor)
      : kind_(Kind::Single), stream_(std::move(stream)) {}

  template <typename T,
            std::enable_if_t<std::is_base_of_v<io::Stream, T> || std::is_base_of_v<std::istream, T>, int> = 0>
  StreamSource(std::unique_ptr<T> handle)  // NOLINT(google-explicit-constructor)
      : kind_(Kind::Single) {
    if constexpr (std::is_base_of_v<io::Stream, T>) {
      stream_ = std::move(handle);
    } else {
      if (handle != nullptr) {
        stream_ = io::Adapt(std::move(handle));
      }
    }
  }

  StreamSource(std::vector<StreamSource> items)  // NOLINT(google-explicit-constructor)
      : kind_(Kind::Collection), items_(std::move(items)) {}

  StreamSource(FusedReader& reader)  // NOLINT(google-explicit-constructor)
      : kind_(Kind::Reader), reader_(&reader) {}

  /** Builds a Collection source from any number of sources. */
  template <typename... Sources>
  static StreamSource Sequence(Sources&&... sources) {
    std::vector<StreamSource> items;
    items.reserve(sizeof...(Sources));
    (items.emplace_back(std::forward<Sources>(sources)), ...);
    return StreamSource(std::move(items));
  }

  [[nodiscard]] Kind GetKind() const noexcept { return kind_; }

 private:
  friend class FusedReader;

  Kind kind_;
  std::unique_ptr<io::Stream> stream_;
  std::vector<StreamSource> items_;
  FusedReader* reader_ = nullptr;
};

/** Byte test used by ReadWhile. */
using BytePredicate = std::function<bool(unsigned char)>;

/**
 * @brief Ordered concatenation of finite streams read as one.
 *
 * Invariants and behavior:
 * - Members are read in attachment order. Each member's size is measured once
 *   at attachment (Seek(End), then Seek(Set)) and must not change afterwards.
 * - The cursor only moves forward. After every physical read, an exhausted
 *   member is closed and the cursor advances, so at most one member is being
 *   read at any time.
 * - With no members, or once all are exhausted, every read returns nullopt.
 * - Close() closes the members not yet closed, ignores their failures, and
 *   returns the reader to its default-constructed state. It is idempotent and
 *   the reader may be reused afterwards.
 * - Thread-safety: not thread-safe. External synchronization is required for
 *   concurrent access.
 */
class FusedReader {
 public:
  FusedReader() = default;
  ~FusedReader() { Close(); }

  FusedReader(const FusedReader&) = delete;
  FusedReader& operator=(const FusedReader&) = delete;

  FusedReader(FusedReader&& other) noexcept
      : members_(std::move(other.members_)),
        cursor_(other.cursor_),
        active_(other.active_),
        active_size_(other.active_size_) {
    other.Reset();
  }

  FusedReader& operator=(FusedReader&& other) noexcept {
    if (this != &other) {
      Close();
      members_ = std::move(other.members_);
      cursor_ = other.cursor_;
      active_ = other.active_;
      active_size_ = other.active_size_;
      other.Reset();
    }
    return *this;
  }

  /** Creates a reader and attaches each source in order. */
  template <typename... Sources>
  static FusedReader FromStreams(Sources&&... sources) {
    FusedReader reader;
    reader.AttachAll(std::forward<Sources>(sources)...);
    return reader;
  }

  /// Opens each path as a raw binary file and attaches it in order. The first
  /// OpenFailure propagates; files opened before it are closed with the
  /// partially built reader and nothing is returned.
  static FusedReader FromPathsRaw(const std::vector<std::string>& paths) {
    FusedReader reader;
    for (const std::string& path : paths) {
      reader.Attach(io::FileStream::Open(path));
    }
    return reader;
  }

  // ---- Attachment ----

  /// Validates, measures and appends one stream. Throws InvalidStreamError
  /// (1-based position) when the stream is null, lacks a required capability,
  /// or cannot be measured; the stream is not attached in that case.
  void Attach(std::unique_ptr<io::Stream> stream) {
    const std::size_t position = members_.size() + 1;
    if (stream == nullptr || !io::SatisfiesContract(stream->Capabilities())) {
      throw InvalidStreamError(position);
    }
    const auto size = MeasureSize(*stream);
    if (!size) {
      throw InvalidStreamError(position);
    }
    members_.push_back(Member{std::move(stream), *size, false});
    FUSEDSTREAM_LOG_DEBUG("attached member #{} ({} bytes)", position, *size);
    RefreshActive();
  }

  /// Attaches each source left to right. Collections are flattened; a reader
  /// source is absorbed and processing continues with the next source.
  void AttachMany(std::vector<StreamSource> sources) {
    for (StreamSource& source : sources) {
      AttachSource(std::move(source));
    }
  }

  template <typename... Sources>
  void AttachAll(Sources&&... sources) {
    (AttachSource(StreamSource(std::forward<Sources>(sources))), ...);
  }

  // ---- Cursor ----

  /// True when the active member's position has reached its recorded size
  /// (or when there is no active member). Does not advance.
  [[nodiscard]] bool IsCurrentEof() const {
    if (active_ == nullptr) {
      return true;
    }
    const auto position = active_->Seek();
    if (!position) {
      FUSEDSTREAM_LOG_WARN("member #{}: position query failed, treating as exhausted", cursor_ + 1);
      return true;
    }
    return static_cast<std::uint64_t>(*position) >= active_size_;
  }

  /// Closes the active member and moves to the next one. Callers check
  /// IsCurrentEof() first; this does not verify exhaustion.
  void Advance() noexcept {
    if (active_ == nullptr) {
      return;
    }
    CloseMember(cursor_);
    ++cursor_;
    RefreshActive();
    FUSEDSTREAM_LOG_DEBUG("advanced to member #{} of {}", cursor_ + 1, members_.size());
  }

  [[nodiscard]] bool IsFinished() const noexcept { return cursor_ >= members_.size(); }

  [[nodiscard]] std::size_t MemberCount() const noexcept { return members_.size(); }
  [[nodiscard]] std::size_t Cursor() const noexcept { return cursor_; }

  [[nodiscard]] std::uint64_t MemberSize(std::size_t index) const {
    if (index >= members_.size()) {
      throw std::out_of_range("FusedReader::MemberSize index out of range");
    }
    return members_[index].size;
  }

  /** Bytes left across the active member and every member after it. */
  [[nodiscard]] std::uint64_t RemainingBytes() const {
    if (active_ == nullptr) {
      return 0;
    }
    std::uint64_t total = 0;
    const auto position = active_->Seek();
    const auto consumed = position ? static_cast<std::uint64_t>(*position) : active_size_;
    if (consumed < active_size_) {
      total += active_size_ - consumed;
    }
    for (std::size_t i = cursor_ + 1; i < members_.size(); ++i) {
      total += members_[i].size;
    }
    return total;
  }

  // ---- Reads ----

  /// Reads exactly `count` bytes, crossing members as needed. Returns fewer
  /// only when the fused stream ends first; nullopt when no byte was read.
  std::optional<std::string> ReadBytes(std::size_t count) {
    if (IsFinished()) {
      return std::nullopt;
    }
    std::string out;
    while (out.size() < count) {
      SkipExhausted();
      if (active_ == nullptr) {
        break;
      }
      const auto chunk = active_->Read(std::min(count - out.size(), config::kMaxPhysicalReadBytes));
      if (chunk) {
        out += *chunk;
      }
      AdvanceIfDrained(chunk.has_value() && !chunk->empty());
    }
    if (out.empty() && count > 0) {
      return std::nullopt;
    }
    return out;
  }

  /// Reads one line from the active member. A line never spans members: a
  /// member ending without a terminator yields its partial last line.
  std::optional<std::string> ReadLine(bool keep_terminator = false) {
    if (IsFinished()) {
      return std::nullopt;
    }
    for (;;) {
      SkipExhausted();
      if (active_ == nullptr) {
        return std::nullopt;
      }
      auto line = active_->ReadLine(keep_terminator);
      AdvanceIfDrained(line.has_value());
      if (line) {
        return line;
      }
    }
  }

  /// Concatenates everything left, byte for byte, with no separators.
  std::optional<std::string> ReadAll() {
    if (IsFinished()) {
      return std::nullopt;
    }
    const std::size_t chunk_bytes = config::GetReadChunkBytes();
    std::string out;
    while (active_ != nullptr) {
      const auto chunk = active_->Read(chunk_bytes);
      if (chunk) {
        out += *chunk;
      }
      AdvanceIfDrained(chunk.has_value() && !chunk->empty());
    }
    return out;
  }

  /// Reads bytes while they match; the first non-matching byte is consumed
  /// and dropped. nullopt when no byte matched.
  std::optional<std::string> ReadWhile(const BytePredicate& predicate) {
    std::string run;
    for (;;) {
      const auto byte = ReadBytes(1);
      if (!byte || !predicate(static_cast<unsigned char>((*byte)[0]))) {
        break;
      }
      run += *byte;
    }
    if (run.empty()) {
      return std::nullopt;
    }
    return run;
  }

  std::optional<std::string> ReadWhile(const CharSet& set) {
    return ReadWhile([&set](unsigned char c) { return set.Matches(c); });
  }

  std::optional<std::string> ReadWhile(CharClass cls) { return ReadWhile(CharSet(cls)); }

  /** Pattern form, e.g. "%d", "[^,;]"; see char_class.hpp. */
  std::optional<std::string> ReadWhile(std::string_view pattern) { return ReadWhile(CharSet::Parse(pattern)); }

  /// Parses a decimal literal or a 0x/0o/0b-prefixed literal. A '0' followed by
  /// any other byte yields 0 and that byte is dropped. nullopt when no literal
  /// starts here, when a radix prefix has no digits, or on overflow.
  std::optional<std::uint64_t> ReadNumber() {
    const auto first = ReadBytes(1);
    if (!first) {
      return std::nullopt;
    }
    const char lead = (*first)[0];
    if (lead == '0') {
      const auto second = ReadBytes(1);
      if (!second) {
        return 0;
      }
      int base = 0;
      CharClass digits_class = CharClass::Digit;
      switch ((*second)[0]) {
        case 'x':
        case 'X':
          base = 16;
          digits_class = CharClass::HexDigit;
          break;
        case 'o':
        case 'O':
          base = 8;
          digits_class = CharClass::OctDigit;
          break;
        case 'b':
        case 'B':
          base = 2;
          digits_class = CharClass::BinDigit;
          break;
        default:
          return 0;
      }
      const auto digits = ReadWhile(digits_class);
      if (!digits) {
        return std::nullopt;
      }
      return ParseUnsigned(*digits, base);
    }
    if (!CharSet(CharClass::Digit).Matches(lead)) {
      return std::nullopt;
    }
    std::string digits(1, lead);
    if (const auto rest = ReadWhile(CharClass::Digit)) {
      digits += *rest;
    }
    return ParseUnsigned(digits, 10);
  }

  /// Performs one read per mode, in order. No modes means one line read.
  std::vector<ReadResult> Read(const std::vector<ReadMode>& modes) {
    std::vector<ReadResult> results;
    if (modes.empty()) {
      results.push_back(ToResult(ReadLine()));
      return results;
    }
    results.reserve(modes.size());
    for (const ReadMode& mode : modes) {
      FUSEDSTREAM_LOG_DEBUG("read mode '{}'", ToString(mode));
      switch (mode.kind) {
        case ReadMode::Kind::Bytes:
          results.push_back(ToResult(ReadBytes(mode.count)));
          break;
        case ReadMode::Kind::All:
          results.push_back(ToResult(ReadAll()));
          break;
        case ReadMode::Kind::Line:
          results.push_back(ToResult(ReadLine(false)));
          break;
        case ReadMode::Kind::LineKeep:
          results.push_back(ToResult(ReadLine(true)));
          break;
        case ReadMode::Kind::Number: {
          const auto number = ReadNumber();
          results.push_back(number ? ReadResult(*number) : ReadResult());
          break;
        }
      }
    }
    return results;
  }

  ReadResult Read() { return ToResult(ReadLine()); }

  // ---- Termination ----

  /// Closes every member not yet closed, logging and ignoring failures, then
  /// resets to the empty state.
  void Close() noexcept {
    for (std::size_t i = cursor_; i < members_.size(); ++i) {
      CloseMember(i);
    }
    if (!members_.empty()) {
      FUSEDSTREAM_LOG_DEBUG("closed reader with {} member(s)", members_.size());
    }
    Reset();
  }

 private:
  struct Member {
    std::unique_ptr<io::Stream> stream;
    std::uint64_t size;
    bool closed;
  };

  static std::optional<std::uint64_t> MeasureSize(io::Stream& stream) {
    const auto end = stream.Seek(io::Whence::End);
    if (!end || *end < 0) {
      return std::nullopt;
    }
    if (!stream.Seek(io::Whence::Set)) {
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(*end);
  }

  static std::optional<std::uint64_t> ParseUnsigned(std::string_view digits, int base) {
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
      FUSEDSTREAM_LOG_WARN("numeric literal '{}' (base {}) is out of range", digits, base);
      return std::nullopt;
    }
    return value;
  }

  static ReadResult ToResult(std::optional<std::string> text) {
    if (!text) {
      return ReadResult();
    }
    return ReadResult(std::move(*text));
  }

  void AttachSource(StreamSource&& source) {
    switch (source.kind_) {
      case StreamSource::Kind::Single:
        Attach(std::move(source.stream_));
        break;
      case StreamSource::Kind::Collection:
        for (StreamSource& item : source.items_) {
          AttachSource(std::move(item));
        }
        break;
      case StreamSource::Kind::Reader:
        Absorb(*source.reader_);
        break;
    }
  }

  // Moves the donor's unread members (its active one keeps its position) to
  // the end of this reader and leaves the donor empty.
  void Absorb(FusedReader& donor) {
    if (&donor == this) {
      throw std::invalid_argument("FusedReader cannot absorb itself");
    }
    for (std::size_t i = donor.cursor_; i < donor.members_.size(); ++i) {
      members_.push_back(std::move(donor.members_[i]));
    }
    FUSEDSTREAM_LOG_DEBUG("absorbed {} member(s)", donor.members_.size() - donor.cursor_);
    donor.Reset();
    RefreshActive();
  }

  void RefreshActive() noexcept {
    if (cursor_ < members_.size()) {
      active_ = members_[cursor_].stream.get();
      active_size_ = members_[cursor_].size;
    } else {
      active_ = nullptr;
      active_size_ = 0;
    }
  }

  void SkipExhausted() {
    while (active_ != nullptr && IsCurrentEof()) {
      Advance();
    }
  }

  // Called after each physical read. A read that produced nothing before the
  // recorded size was reached means the member shrank; it is skipped. Empty
  // members that follow are closed too, so IsFinished() holds once the last
  // byte is consumed.
  void AdvanceIfDrained(bool produced) {
    if (IsCurrentEof()) {
      Advance();
    } else if (!produced) {
      FUSEDSTREAM_LOG_WARN("member #{} ended before its recorded size of {} bytes", cursor_ + 1,
                           active_size_);
      Advance();
    } else {
      return;
    }
    SkipExhausted();
  }

  void CloseMember(std::size_t index) noexcept {
    Member& member = members_[index];
    if (member.closed) {
      return;
    }
    member.closed = true;
    try {
      if (!member.stream->Close()) {
        FUSEDSTREAM_LOG_WARN("closing member #{} failed", index + 1);
      }
    } catch (const std::exception& e) {
      FUSEDSTREAM_LOG_WARN("closing member #{} failed: {}", index + 1, e.what());
    } catch (...) {
      FUSEDSTREAM_LOG_WARN("closing member #{} failed: unknown exception", index + 1);
    }
  }

  void Reset() noexcept {
    members_.clear();
    cursor_ = 0;
    active_ = nullptr;
    active_size_ = 0;
  }

  std::vector<Member> members_;
  std::size_t cursor_ = 0;
  io::Stream* active_ = nullptr;
  std::uint64_t active_size_ = 0;
};

}  // namespace fusedstream::core
