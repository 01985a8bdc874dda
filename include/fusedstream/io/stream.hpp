#pragma once

// =============================================================================
// File:        include/fusedstream/io/stream.hpp
// Overview:    The stream contract every FusedReader member satisfies: bounded
//              and line-oriented reads, a seek-based position query, close.
// Ownership:   A stream handed to a FusedReader is owned by it until closed;
//              callers must not read from or close it afterwards.
// Capability:  Streams advertise what they support as a bit mask. Attachment
//              rejects any stream missing one of kRequiredCapabilities.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fusedstream::io {

enum class StreamCapability : std::uint8_t {
  Read = 0x1U,
  Seek = 0x2U,
  Close = 0x4U,
};

inline constexpr std::uint32_t kRequiredCapabilities =
    static_cast<std::uint32_t>(StreamCapability::Read) | static_cast<std::uint32_t>(StreamCapability::Seek) |
    static_cast<std::uint32_t>(StreamCapability::Close);

[[nodiscard]] constexpr bool HasCapability(std::uint32_t mask, StreamCapability capability) noexcept {
  return (mask & static_cast<std::uint32_t>(capability)) != 0U;
}

[[nodiscard]] constexpr bool SatisfiesContract(std::uint32_t mask) noexcept {
  return (mask & kRequiredCapabilities) == kRequiredCapabilities;
}

/** Origin for Stream::Seek. */
enum class Whence : std::uint8_t { Set = 0, Current = 1, End = 2 };

/**
 * @brief Abstract finite byte stream.
 *
 * Contract:
 * - Read(n) returns between 1 and n bytes, or nullopt once nothing remains.
 *   It returns fewer than n bytes only at end of stream.
 * - ReadLine() returns one line terminated by '\n' (kept or stripped). The
 *   final line may lack a terminator. nullopt once nothing remains.
 * - Seek() with no arguments reports the current position. Seek(End) and
 *   Seek(Set) are used to measure the stream. nullopt on failure.
 * - Close() may be called more than once and after exhaustion; it returns
 *   false if releasing the underlying resource failed.
 * - Physical I/O failures throw fusedstream::StreamError.
 */
class Stream {
 public:
  virtual ~Stream() = default;

  [[nodiscard]] virtual std::uint32_t Capabilities() const noexcept { return kRequiredCapabilities; }

  virtual std::optional<std::string> Read(std::size_t max_bytes) = 0;
  virtual std::optional<std::string> ReadLine(bool keep_terminator) = 0;
  virtual std::optional<std::int64_t> Seek(Whence whence = Whence::Current, std::int64_t offset = 0) = 0;
  virtual bool Close() = 0;
};

}  // namespace fusedstream::io
