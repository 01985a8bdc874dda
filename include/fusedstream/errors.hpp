#pragma once

// Exceptions raised by FusedStream. End-of-data is never one of them: reads
// report exhaustion with an empty optional.

#include <cstddef>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace fusedstream {

/** A stream offered for attachment does not satisfy the stream contract. */
class InvalidStreamError : public std::invalid_argument {
 public:
  // position is 1-based, counted over the reader's member sequence.
  explicit InvalidStreamError(std::size_t position)
      : std::invalid_argument(fmt::format("invalid stream: #{}", position)), position_(position) {}

  [[nodiscard]] std::size_t Position() const noexcept { return position_; }

 private:
  std::size_t position_;
};

/** Opening a path as a raw binary stream failed. */
class OpenFailure : public std::runtime_error {
 public:
  OpenFailure(const std::string& path, int error_code, const std::string& reason)
      : std::runtime_error(fmt::format("{}: {}", path, reason)), path_(path), error_code_(error_code) {}

  [[nodiscard]] const std::string& Path() const noexcept { return path_; }
  [[nodiscard]] int ErrorCode() const noexcept { return error_code_; }

 private:
  std::string path_;
  int error_code_;
};

/** A physical read or seek on a member failed. */
class StreamError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace fusedstream
