#pragma once

// Read-mode selectors for FusedReader::Read and the per-mode result type.

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace fusedstream::core {

/** One Read() result: monostate when no data was available. */
using ReadResult = std::variant<std::monostate, std::string, std::uint64_t>;

[[nodiscard]] inline bool HasData(const ReadResult& result) noexcept {
  return !std::holds_alternative<std::monostate>(result);
}

struct ReadMode {
  enum class Kind : std::uint8_t { Bytes, All, Line, LineKeep, Number };

  Kind kind = Kind::Line;
  std::size_t count = 0;  // Bytes only

  static ReadMode Bytes(std::size_t count) {
    if (count == 0) {
      throw std::invalid_argument("byte count must be > 0");
    }
    return ReadMode{Kind::Bytes, count};
  }
  static constexpr ReadMode All() noexcept { return ReadMode{Kind::All, 0}; }
  static constexpr ReadMode Line() noexcept { return ReadMode{Kind::Line, 0}; }
  static constexpr ReadMode LineKeep() noexcept { return ReadMode{Kind::LineKeep, 0}; }
  static constexpr ReadMode Number() noexcept { return ReadMode{Kind::Number, 0}; }

  /// Parses "a", "l", "L" or "n". A leading '*' ("*a", "*n") is accepted.
  static ReadMode Parse(std::string_view selector) {
    if (!selector.empty() && selector.front() == '*') {
      selector.remove_prefix(1);
    }
    if (selector == "a") {
      return All();
    }
    if (selector == "l") {
      return Line();
    }
    if (selector == "L") {
      return LineKeep();
    }
    if (selector == "n") {
      return Number();
    }
    throw std::invalid_argument("invalid read mode: '" + std::string(selector) + "'");
  }
};

/** Returns the selector spelling of a mode ("a", "l", "L", "n" or the count). */
[[nodiscard]] inline std::string ToString(const ReadMode& mode) {
  switch (mode.kind) {
    case ReadMode::Kind::Bytes:
      return std::to_string(mode.count);
    case ReadMode::Kind::All:
      return "a";
    case ReadMode::Kind::Line:
      return "l";
    case ReadMode::Kind::LineKeep:
      return "L";
    case ReadMode::Kind::Number:
      return "n";
  }
  return "?";
}

}  // namespace fusedstream::core
