#pragma once

// Levelled diagnostics for FusedStream, formatted with {fmt} and written to
// stderr. The threshold starts from FUSEDSTREAM_LOG_LEVEL (see config.hpp) and
// can be changed at runtime with SetLogLevel(). Compile with
// FUSEDSTREAM_LOGGING=0 to turn every macro into a no-op.

#include <atomic>
#include <cstdio>
#include <exception>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "fusedstream/config.hpp"

#ifndef FUSEDSTREAM_LOGGING
#define FUSEDSTREAM_LOGGING 1
#endif

namespace fusedstream::log {

using config::LogLevel;

namespace detail {
inline std::atomic<LogLevel>& Threshold() noexcept {
  static std::atomic<LogLevel> threshold{config::GetLogLevel()};
  return threshold;
}
}  // namespace detail

[[nodiscard]] inline LogLevel GetLogLevel() noexcept {
  return detail::Threshold().load(std::memory_order_relaxed);
}

inline void SetLogLevel(LogLevel level) noexcept {
  detail::Threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline bool Enabled(LogLevel level) noexcept {
  return level != LogLevel::Off && level <= GetLogLevel();
}

/// Formats and writes one line. Never throws; a formatting failure is
/// reported in place of the message.
template <typename... Args>
void Write(LogLevel level, fmt::format_string<Args...> format, Args&&... args) noexcept {
  try {
    const std::string message = fmt::format(format, std::forward<Args>(args)...);
    fmt::print(stderr, "[fusedstream] {}: {}\n", config::GetLogLevelName(level), message);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[fusedstream] log failure: %s\n", e.what());
  }
}

}  // namespace fusedstream::log

#if FUSEDSTREAM_LOGGING
#define FUSEDSTREAM_LOG(LEVEL, ...)                                    \
  do {                                                                 \
    if (::fusedstream::log::Enabled(LEVEL)) {                          \
      ::fusedstream::log::Write(LEVEL, __VA_ARGS__);                   \
    }                                                                  \
  } while (false)
#else
#define FUSEDSTREAM_LOG(LEVEL, ...) \
  do {                              \
  } while (false)
#endif

#define FUSEDSTREAM_LOG_ERROR(...) FUSEDSTREAM_LOG(::fusedstream::log::LogLevel::Error, __VA_ARGS__)
#define FUSEDSTREAM_LOG_WARN(...) FUSEDSTREAM_LOG(::fusedstream::log::LogLevel::Warn, __VA_ARGS__)
#define FUSEDSTREAM_LOG_INFO(...) FUSEDSTREAM_LOG(::fusedstream::log::LogLevel::Info, __VA_ARGS__)
#define FUSEDSTREAM_LOG_DEBUG(...) FUSEDSTREAM_LOG(::fusedstream::log::LogLevel::Debug, __VA_ARGS__)
