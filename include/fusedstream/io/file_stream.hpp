#pragma once

// Raw binary file stream on stdio. Open() is the only way to construct one and
// throws OpenFailure when the path cannot be opened.

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "fusedstream/config.hpp"
#include "fusedstream/errors.hpp"
#include "fusedstream/io/stream.hpp"

#ifdef _WIN32
#define FUSEDSTREAM_FSEEK64 _fseeki64
#define FUSEDSTREAM_FTELL64 _ftelli64
#else
#define FUSEDSTREAM_FSEEK64 fseeko
#define FUSEDSTREAM_FTELL64 ftello
#endif

namespace fusedstream::io {

class FileStream : public Stream {
 public:
  static std::unique_ptr<FileStream> Open(const std::string& path) {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
      const int error_code = errno;
      throw OpenFailure(path, error_code, std::strerror(error_code));
    }
    return std::unique_ptr<FileStream>(new FileStream(path, file));
  }

  ~FileStream() override { (void)Close(); }

  FileStream(const FileStream&) = delete;
  FileStream& operator=(const FileStream&) = delete;

  std::optional<std::string> Read(std::size_t max_bytes) override {
    if (file_ == nullptr || max_bytes == 0) {
      return std::nullopt;
    }
    std::string out(max_bytes, '\0');
    const std::size_t rd = std::fread(out.data(), 1, max_bytes, file_);
    if (rd < max_bytes && std::ferror(file_) != 0) {
      throw StreamError("[FileStream] Read error: " + path_);
    }
    if (rd == 0) {
      return std::nullopt;
    }
    out.resize(rd);
    return out;
  }

  std::optional<std::string> ReadLine(bool keep_terminator) override {
    if (file_ == nullptr) {
      return std::nullopt;
    }
    std::string out;
    bool any = false;
    for (;;) {
      const int ch = std::getc(file_);
      if (ch == EOF) {
        if (std::ferror(file_) != 0) {
          throw StreamError("[FileStream] Read error: " + path_);
        }
        break;
      }
      any = true;
      if (static_cast<char>(ch) == config::kLineTerminator) {
        if (keep_terminator) {
          out.push_back(config::kLineTerminator);
        }
        break;
      }
      out.push_back(static_cast<char>(ch));
    }
    if (!any) {
      return std::nullopt;
    }
    return out;
  }

  std::optional<std::int64_t> Seek(Whence whence = Whence::Current, std::int64_t offset = 0) override {
    if (file_ == nullptr) {
      return std::nullopt;
    }
    int origin = SEEK_CUR;
    if (whence == Whence::Set) {
      origin = SEEK_SET;
    } else if (whence == Whence::End) {
      origin = SEEK_END;
    }
    if (FUSEDSTREAM_FSEEK64(file_, offset, origin) != 0) {
      return std::nullopt;
    }
    const auto position = FUSEDSTREAM_FTELL64(file_);
    if (position < 0) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(position);
  }

  bool Close() override {
    if (file_ == nullptr) {
      return true;
    }
    const int rc = std::fclose(file_);
    file_ = nullptr;
    return rc == 0;
  }

  [[nodiscard]] const std::string& GetPath() const noexcept { return path_; }

 private:
  FileStream(std::string path, std::FILE* file) : path_(std::move(path)), file_(file) {}

  std::string path_;
  std::FILE* file_;
};

}  // namespace fusedstream::io
