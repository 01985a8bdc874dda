#pragma once

// Stream adapter: presents a std::istream (read/gcount/getline/tellg/seekg)
// through the Stream contract. Pure wrapping; the adapter adds no buffering of
// its own. The caller picks adaptation explicitly by handing over an istream
// instead of a Stream.

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "fusedstream/config.hpp"
#include "fusedstream/errors.hpp"
#include "fusedstream/io/stream.hpp"

namespace fusedstream::io {

class IstreamAdapter : public Stream {
 public:
  explicit IstreamAdapter(std::unique_ptr<std::istream> handle)
      : handle_(std::move(handle)), closed_(handle_ == nullptr) {}

  // Seekability depends on the wrapped buffer; a failing tellg() means the
  // handle cannot report its position and so cannot be measured.
  [[nodiscard]] std::uint32_t Capabilities() const noexcept override {
    std::uint32_t mask = static_cast<std::uint32_t>(StreamCapability::Close);
    if (handle_ == nullptr) {
      return mask;
    }
    mask |= static_cast<std::uint32_t>(StreamCapability::Read);
    if (handle_->rdbuf() != nullptr &&
        handle_->rdbuf()->pubseekoff(0, std::ios_base::cur, std::ios_base::in) != std::streampos(-1)) {
      mask |= static_cast<std::uint32_t>(StreamCapability::Seek);
    }
    return mask;
  }

  std::optional<std::string> Read(std::size_t max_bytes) override {
    if (closed_ || max_bytes == 0) {
      return std::nullopt;
    }
    std::string out(max_bytes, '\0');
    handle_->read(out.data(), static_cast<std::streamsize>(max_bytes));
    const auto rd = static_cast<std::size_t>(handle_->gcount());
    if (handle_->bad()) {
      throw StreamError("[IstreamAdapter] Read error");
    }
    // A short read sets eof/fail; clear so position queries keep working.
    handle_->clear();
    if (rd == 0) {
      return std::nullopt;
    }
    out.resize(rd);
    return out;
  }

  std::optional<std::string> ReadLine(bool keep_terminator) override {
    if (closed_) {
      return std::nullopt;
    }
    std::string line;
    std::getline(*handle_, line, config::kLineTerminator);
    if (handle_->bad()) {
      throw StreamError("[IstreamAdapter] Read error");
    }
    const bool hit_end = handle_->eof();
    const bool extracted = !handle_->fail() || !line.empty();
    handle_->clear();
    if (!extracted) {
      return std::nullopt;
    }
    if (keep_terminator && !hit_end) {
      line.push_back(config::kLineTerminator);
    }
    return line;
  }

  std::optional<std::int64_t> Seek(Whence whence = Whence::Current, std::int64_t offset = 0) override {
    if (closed_) {
      return std::nullopt;
    }
    std::ios_base::seekdir dir = std::ios_base::cur;
    if (whence == Whence::Set) {
      dir = std::ios_base::beg;
    } else if (whence == Whence::End) {
      dir = std::ios_base::end;
    }
    handle_->clear();
    handle_->seekg(static_cast<std::streamoff>(offset), dir);
    const std::streampos position = handle_->tellg();
    if (handle_->fail() || position == std::streampos(-1)) {
      handle_->clear();
      return std::nullopt;
    }
    return static_cast<std::int64_t>(position);
  }

  bool Close() override {
    if (closed_) {
      return true;
    }
    closed_ = true;
    bool ok = true;
    if (auto* file = dynamic_cast<std::ifstream*>(handle_.get()); file != nullptr && file->is_open()) {
      file->close();
      ok = !file->fail();
    }
    handle_.reset();
    return ok;
  }

 private:
  std::unique_ptr<std::istream> handle_;
  bool closed_ = false;
};

/** Wraps a std::istream so it satisfies the Stream contract. */
[[nodiscard]] inline std::unique_ptr<Stream> Adapt(std::unique_ptr<std::istream> handle) {
  return std::make_unique<IstreamAdapter>(std::move(handle));
}

}  // namespace fusedstream::io
