#pragma once

// In-memory stream over an owned byte string.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "fusedstream/config.hpp"
#include "fusedstream/io/stream.hpp"

namespace fusedstream::io {

class MemoryStream : public Stream {
 public:
  explicit MemoryStream(std::string bytes) : bytes_(std::move(bytes)) {}

  std::optional<std::string> Read(std::size_t max_bytes) override {
    if (closed_ || position_ >= bytes_.size()) {
      return std::nullopt;
    }
    const std::size_t count = std::min(max_bytes, bytes_.size() - position_);
    std::string out = bytes_.substr(position_, count);
    position_ += count;
    return out;
  }

  std::optional<std::string> ReadLine(bool keep_terminator) override {
    if (closed_ || position_ >= bytes_.size()) {
      return std::nullopt;
    }
    const std::size_t eol = bytes_.find(config::kLineTerminator, position_);
    if (eol == std::string::npos) {
      std::string out = bytes_.substr(position_);
      position_ = bytes_.size();
      return out;
    }
    std::string out = bytes_.substr(position_, eol - position_ + (keep_terminator ? 1 : 0));
    position_ = eol + 1;
    return out;
  }

  std::optional<std::int64_t> Seek(Whence whence = Whence::Current, std::int64_t offset = 0) override {
    if (closed_) {
      return std::nullopt;
    }
    std::int64_t base = 0;
    switch (whence) {
      case Whence::Set:
        base = 0;
        break;
      case Whence::Current:
        base = static_cast<std::int64_t>(position_);
        break;
      case Whence::End:
        base = static_cast<std::int64_t>(bytes_.size());
        break;
    }
    const std::int64_t target = base + offset;
    if (target < 0) {
      return std::nullopt;
    }
    position_ = static_cast<std::size_t>(target);
    return target;
  }

  bool Close() override {
    closed_ = true;
    return true;
  }

  [[nodiscard]] bool IsClosed() const noexcept { return closed_; }

 private:
  std::string bytes_;
  std::size_t position_ = 0;
  bool closed_ = false;
};

}  // namespace fusedstream::io
