#pragma once

// Byte sets used as readWhile() predicates. A CharSet is built from a named
// class or from a pattern string:
//   %d %x %s %a %w %l %u %p %c   digit, hex digit, space, letter, alnum,
//                                lower, upper, punctuation, control
//   %D %X ...                    complement of the class
//   %<non-alnum>                 the literal byte (e.g. "%%", "%]")
//   [abc] [a-z] [%d_] [^...]     bracket sets, ranges, classes, negation
//   c                            any single literal byte
// Classification is ASCII only and independent of the C locale.

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fusedstream::core {

enum class CharClass : std::uint8_t {
  Digit,
  HexDigit,
  OctDigit,
  BinDigit,
  Space,
  Alpha,
  Alnum,
  Lower,
  Upper,
  Punct,
  Control,
};

namespace detail_charclass {

[[nodiscard]] constexpr bool InRange(unsigned char c, char lo, char hi) noexcept {
  return c >= static_cast<unsigned char>(lo) && c <= static_cast<unsigned char>(hi);
}

[[nodiscard]] constexpr bool IsMember(CharClass cls, unsigned char c) noexcept {
  switch (cls) {
    case CharClass::Digit:
      return InRange(c, '0', '9');
    case CharClass::HexDigit:
      return InRange(c, '0', '9') || InRange(c, 'a', 'f') || InRange(c, 'A', 'F');
    case CharClass::OctDigit:
      return InRange(c, '0', '7');
    case CharClass::BinDigit:
      return c == '0' || c == '1';
    case CharClass::Space:
      return c == ' ' || InRange(c, '\t', '\r');
    case CharClass::Alpha:
      return InRange(c, 'a', 'z') || InRange(c, 'A', 'Z');
    case CharClass::Alnum:
      return InRange(c, 'a', 'z') || InRange(c, 'A', 'Z') || InRange(c, '0', '9');
    case CharClass::Lower:
      return InRange(c, 'a', 'z');
    case CharClass::Upper:
      return InRange(c, 'A', 'Z');
    case CharClass::Punct:
      return InRange(c, '!', '/') || InRange(c, ':', '@') || InRange(c, '[', '`') || InRange(c, '{', '~');
    case CharClass::Control:
      return c < 0x20U || c == 0x7FU;
  }
  return false;
}

// Maps the letter after '%' to a class. Returns false for unknown letters.
[[nodiscard]] constexpr bool ClassFromLetter(char letter, CharClass* out) noexcept {
  switch (letter) {
    case 'd':
      *out = CharClass::Digit;
      return true;
    case 'x':
      *out = CharClass::HexDigit;
      return true;
    case 's':
      *out = CharClass::Space;
      return true;
    case 'a':
      *out = CharClass::Alpha;
      return true;
    case 'w':
      *out = CharClass::Alnum;
      return true;
    case 'l':
      *out = CharClass::Lower;
      return true;
    case 'u':
      *out = CharClass::Upper;
      return true;
    case 'p':
      *out = CharClass::Punct;
      return true;
    case 'c':
      *out = CharClass::Control;
      return true;
    default:
      return false;
  }
}

}  // namespace detail_charclass

/**
 * @brief Set of byte values.
 *
 * Invariants:
 * - Membership is fixed after construction; Complement() returns a new set.
 * - Parse() rejects malformed patterns with std::invalid_argument; the
 *   returned set never depends on locale.
 */
class CharSet {
 public:
  CharSet() = default;

  explicit CharSet(CharClass cls) {
    for (std::size_t i = 0; i < kByteValues; ++i) {
      bits_[i] = detail_charclass::IsMember(cls, static_cast<unsigned char>(i));
    }
  }

  /** Set containing exactly the bytes of `bytes`. */
  static CharSet Of(std::string_view bytes) {
    CharSet set;
    for (unsigned char c : bytes) {
      set.bits_.set(c);
    }
    return set;
  }

  static CharSet Parse(std::string_view pattern) {
    if (pattern.empty()) {
      throw std::invalid_argument("empty character class pattern");
    }
    std::size_t index = 0;
    CharSet set;
    if (pattern[0] == '[') {
      set = ParseBracket(pattern, &index);
    } else {
      set = ParseSingle(pattern, &index);
    }
    if (index != pattern.size()) {
      throw std::invalid_argument("trailing characters in pattern: " + std::string(pattern));
    }
    return set;
  }

  [[nodiscard]] bool Matches(unsigned char c) const noexcept { return bits_.test(c); }
  [[nodiscard]] bool Matches(char c) const noexcept { return Matches(static_cast<unsigned char>(c)); }

  [[nodiscard]] CharSet Complement() const {
    CharSet out;
    out.bits_ = ~bits_;
    return out;
  }

  CharSet& operator|=(const CharSet& other) noexcept {
    bits_ |= other.bits_;
    return *this;
  }

  [[nodiscard]] std::size_t Count() const noexcept { return bits_.count(); }

 private:
  static constexpr std::size_t kByteValues = 256;

  // Parses "%?" or a literal at *index.
  static CharSet ParseSingle(std::string_view pattern, std::size_t* index) {
    const char c = pattern[*index];
    if (c != '%') {
      ++*index;
      return Of(std::string_view(&pattern[*index - 1], 1));
    }
    if (*index + 1 >= pattern.size()) {
      throw std::invalid_argument("pattern ends with '%'");
    }
    const char letter = pattern[*index + 1];
    *index += 2;
    const auto uletter = static_cast<unsigned char>(letter);
    if (!detail_charclass::IsMember(CharClass::Alnum, uletter)) {
      return Of(std::string_view(&pattern[*index - 1], 1));
    }
    const bool complement = detail_charclass::IsMember(CharClass::Upper, uletter);
    const char lower = complement ? static_cast<char>(letter - 'A' + 'a') : letter;
    CharClass cls = CharClass::Digit;
    if (!detail_charclass::ClassFromLetter(lower, &cls)) {
      throw std::invalid_argument(std::string("unknown character class %") + letter);
    }
    const CharSet set(cls);
    return complement ? set.Complement() : set;
  }

  static CharSet ParseBracket(std::string_view pattern, std::size_t* index) {
    std::size_t i = 1;
    bool negate = false;
    if (i < pattern.size() && pattern[i] == '^') {
      negate = true;
      ++i;
    }
    CharSet set;
    bool first = true;
    for (;;) {
      if (i >= pattern.size()) {
        throw std::invalid_argument("missing ']' in pattern: " + std::string(pattern));
      }
      const char c = pattern[i];
      if (c == ']' && !first) {
        ++i;
        break;
      }
      first = false;
      if (c == '%') {
        set |= ParseSingle(pattern, &i);
        continue;
      }
      if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
        const auto lo = static_cast<unsigned char>(c);
        const auto hi = static_cast<unsigned char>(pattern[i + 2]);
        for (unsigned v = lo; v <= hi; ++v) {
          set.bits_.set(v);
        }
        i += 3;
        continue;
      }
      set.bits_.set(static_cast<unsigned char>(c));
      ++i;
    }
    *index = i;
    return negate ? set.Complement() : set;
  }

  std::bitset<kByteValues> bits_;
};

}  // namespace fusedstream::core
