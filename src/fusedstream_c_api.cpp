// FusedStream C API implementation. Every entry point translates exceptions
// into status codes.

#define FUSEDSTREAM_C_API_BUILD 1

#include "fusedstream/fusedstream.h"

#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "fusedstream/config.hpp"
#include "fusedstream/core/fused_reader.hpp"
#include "fusedstream/errors.hpp"
#include "fusedstream/io/memory_stream.hpp"
#include "fusedstream/log.hpp"

struct fs_reader_s {
  fusedstream::core::FusedReader reader;
};

namespace {

template <typename Fn>
fs_status Guard(const char* where, Fn&& fn) noexcept {
  try {
    return fn();
  } catch (const fusedstream::InvalidStreamError& e) {
    FUSEDSTREAM_LOG_INFO("{}: {}", where, e.what());
    return FS_INVALID_STREAM;
  } catch (const fusedstream::OpenFailure& e) {
    FUSEDSTREAM_LOG_INFO("{}: {}", where, e.what());
    return FS_OPEN_FAILED;
  } catch (const fusedstream::StreamError& e) {
    FUSEDSTREAM_LOG_ERROR("{}: {}", where, e.what());
    return FS_IO_ERROR;
  } catch (const std::invalid_argument& e) {
    FUSEDSTREAM_LOG_INFO("{}: {}", where, e.what());
    return FS_INVALID_ARG;
  } catch (const std::exception& e) {
    FUSEDSTREAM_LOG_ERROR("{}: {}", where, e.what());
    return FS_INTERNAL;
  }
}

fs_status CopyOut(const std::optional<std::string>& text, char* out, std::size_t capacity,
                  std::size_t* out_len) {
  if (!text) {
    *out_len = 0;
    return FS_END_OF_DATA;
  }
  *out_len = text->size();
  if (text->size() > capacity) {
    return FS_BUFFER_TOO_SMALL;
  }
  if (!text->empty()) {
    std::memcpy(out, text->data(), text->size());
  }
  return FS_OK;
}

}  // namespace

extern "C" {

FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_create(fs_reader** out) {
  if (out == nullptr) return FS_INVALID_ARG;
  *out = new (std::nothrow) fs_reader_s();
  return *out == nullptr ? FS_INTERNAL : FS_OK;
}

FUSEDSTREAM_C_API_EXPORT void fs_reader_destroy(fs_reader* r) { delete r; }

FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_attach_path(fs_reader* r, const char* path) {
  if (r == nullptr || path == nullptr) return FS_INVALID_ARG;
  return Guard("fs_reader_attach_path", [&] {
    r->reader.Attach(fusedstream::io::FileStream::Open(path));
    return FS_OK;
  });
}

FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_attach_memory(fs_reader* r, const void* data, size_t size) {
  if (r == nullptr || (data == nullptr && size != 0)) return FS_INVALID_ARG;
  return Guard("fs_reader_attach_memory", [&] {
    std::string bytes(static_cast<const char*>(data), size);
    r->reader.Attach(std::make_unique<fusedstream::io::MemoryStream>(std::move(bytes)));
    return FS_OK;
  });
}

FUSEDSTREAM_C_API_EXPORT int fs_reader_is_finished(const fs_reader* r) {
  if (r == nullptr) return 1;
  return r->reader.IsFinished() ? 1 : 0;
}

FUSEDSTREAM_C_API_EXPORT size_t fs_reader_member_count(const fs_reader* r) {
  if (r == nullptr) return 0;
  return r->reader.MemberCount();
}

FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_bytes(fs_reader* r, size_t count, void* out,
                                                        size_t* out_len) {
  if (r == nullptr || out_len == nullptr || (out == nullptr && count != 0)) return FS_INVALID_ARG;
  return Guard("fs_reader_read_bytes", [&] {
    return CopyOut(r->reader.ReadBytes(count), static_cast<char*>(out), count, out_len);
  });
}

FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_line(fs_reader* r, int keep_terminator, char* out,
                                                       size_t capacity, size_t* out_len) {
  if (r == nullptr || out_len == nullptr || (out == nullptr && capacity != 0)) return FS_INVALID_ARG;
  return Guard("fs_reader_read_line", [&] {
    return CopyOut(r->reader.ReadLine(keep_terminator != 0), out, capacity, out_len);
  });
}

FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_all(fs_reader* r, char* out, size_t capacity,
                                                      size_t* out_len) {
  if (r == nullptr || out_len == nullptr || (out == nullptr && capacity != 0)) return FS_INVALID_ARG;
  return Guard("fs_reader_read_all", [&] { return CopyOut(r->reader.ReadAll(), out, capacity, out_len); });
}

FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_number(fs_reader* r, uint64_t* out_value) {
  if (r == nullptr || out_value == nullptr) return FS_INVALID_ARG;
  return Guard("fs_reader_read_number", [&] {
    const auto value = r->reader.ReadNumber();
    if (!value) {
      return FS_END_OF_DATA;
    }
    *out_value = *value;
    return FS_OK;
  });
}

FUSEDSTREAM_C_API_EXPORT void fs_reader_close(fs_reader* r) {
  if (r != nullptr) r->reader.Close();
}

FUSEDSTREAM_C_API_EXPORT const char* fs_status_string(fs_status status) {
  switch (status) {
    case FS_OK:
      return "ok";
    case FS_END_OF_DATA:
      return "end of data";
    case FS_INVALID_ARG:
      return "invalid argument";
    case FS_INVALID_STREAM:
      return "invalid stream";
    case FS_OPEN_FAILED:
      return "open failed";
    case FS_IO_ERROR:
      return "i/o error";
    case FS_BUFFER_TOO_SMALL:
      return "buffer too small";
    case FS_INTERNAL:
      return "internal error";
    default:
      return "unknown";
  }
}

FUSEDSTREAM_C_API_EXPORT const char* fs_version(void) { return fusedstream::config::kVersionString; }

}  // extern "C"
