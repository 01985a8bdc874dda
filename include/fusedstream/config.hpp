#pragma once

// FusedStream configuration: default chunk sizes, line terminator and log
// threshold, with compile-time and environment overrides.
//
// Overrides:
// - FUSEDSTREAM_READ_CHUNK_BYTES: compile-time default for the chunk size used
//   when draining a member; the environment variable of the same name
//   overrides it at runtime.
// - FUSEDSTREAM_LOG_LEVEL (environment): off|error|warn|info|debug or 0..4.

#include <cstddef>
#include <cstdint>
#include <cstdlib>  // getenv, strtoull
#include <string_view>

namespace fusedstream {
namespace config {

static constexpr const char kVersionString[] = "1.0.0";

// ---- Defaults ----
#if defined(FUSEDSTREAM_READ_CHUNK_BYTES)
static constexpr std::size_t kDefaultReadChunkBytes =
    static_cast<std::size_t>(FUSEDSTREAM_READ_CHUNK_BYTES);
#else
static constexpr std::size_t kDefaultReadChunkBytes = 4096;
#endif

// Upper bound on a single physical read issued by ReadBytes; larger requests
// are split so the temporary buffer stays bounded.
static constexpr std::size_t kMaxPhysicalReadBytes = static_cast<std::size_t>(1) << 20U;

static constexpr char kLineTerminator = '\n';

/** Ordered log levels; a message is emitted when its level <= the threshold. */
enum class LogLevel : std::uint8_t { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

static constexpr LogLevel kDefaultLogLevel = LogLevel::Warn;

static_assert(kDefaultReadChunkBytes >= 1, "Read chunk must be >= 1 byte");
static_assert(kMaxPhysicalReadBytes >= 1, "Physical read bound must be >= 1 byte");

namespace detail {
// Parses a pure positive decimal number; 0 on failure. Values above `limit`
// are clamped to it.
[[nodiscard]] inline std::size_t ParsePositive(const char* text, std::size_t limit) noexcept {
  // strtoull accepts leading blanks and a sign; "-1" would wrap.
  if (text == nullptr || *text < '0' || *text > '9') {
    return 0;
  }
  char* end = nullptr;
  static constexpr int kBase10 = 10;
  const auto parsed_value = std::strtoull(text, &end, kBase10);
  if (end == text || *end != '\0') {
    return 0;
  }
  if (parsed_value > limit) {
    return limit;
  }
  return static_cast<std::size_t>(parsed_value);
}
}  // namespace detail

/// Returns the chunk size used by ReadAll. If FUSEDSTREAM_READ_CHUNK_BYTES is
/// set to a positive integer it is used (at most kMaxPhysicalReadBytes),
/// otherwise kDefaultReadChunkBytes.
[[nodiscard]] inline std::size_t GetReadChunkBytes() noexcept {
  const std::size_t parsed_value =
      detail::ParsePositive(std::getenv("FUSEDSTREAM_READ_CHUNK_BYTES"), kMaxPhysicalReadBytes);
  return parsed_value == 0 ? kDefaultReadChunkBytes : parsed_value;
}

/// Parses a level name or digit. Returns false for anything unrecognised.
[[nodiscard]] inline bool ParseLogLevel(std::string_view text, LogLevel* out) noexcept {
  struct Named {
    std::string_view name;
    LogLevel level;
  };
  static constexpr Named kNames[] = {
      {"off", LogLevel::Off},   {"error", LogLevel::Error}, {"warn", LogLevel::Warn},
      {"info", LogLevel::Info}, {"debug", LogLevel::Debug},
  };
  for (const Named& named : kNames) {
    if (text == named.name) {
      *out = named.level;
      return true;
    }
  }
  if (text.size() == 1 && text[0] >= '0' && text[0] <= '4') {
    *out = static_cast<LogLevel>(text[0] - '0');
    return true;
  }
  return false;
}

/// Returns the log threshold from FUSEDSTREAM_LOG_LEVEL, or kDefaultLogLevel
/// when unset or invalid.
[[nodiscard]] inline LogLevel GetLogLevel() noexcept {
  const char* env = std::getenv("FUSEDSTREAM_LOG_LEVEL");
  if (env == nullptr || *env == '\0') {
    return kDefaultLogLevel;
  }
  LogLevel level = kDefaultLogLevel;
  if (!ParseLogLevel(env, &level)) {
    return kDefaultLogLevel;
  }
  return level;
}

/** Returns a human-readable level name. */
[[nodiscard]] inline const char* GetLogLevelName(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Off:
      return "off";
    case LogLevel::Error:
      return "error";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
    default:
      return "unknown";
  }
}

}  // namespace config
}  // namespace fusedstream
