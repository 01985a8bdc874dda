#pragma once

/* FusedStream C API
 * - Pure C ABI with an opaque reader handle
 * - No C++ types leak across the boundary
 * - All fallible functions return status codes; no exceptions cross the ABI
 */

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32) || defined(_WIN64)
#if defined(FUSEDSTREAM_C_API_BUILD)
#define FUSEDSTREAM_C_API_EXPORT __declspec(dllexport)
#else
#define FUSEDSTREAM_C_API_EXPORT __declspec(dllimport)
#endif
#else
#define FUSEDSTREAM_C_API_EXPORT __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

/* Status codes for all C API functions */
typedef enum fs_status_e {
  FS_OK = 0,
  FS_END_OF_DATA = 1,
  FS_INVALID_ARG = 2,
  FS_INVALID_STREAM = 3,
  FS_OPEN_FAILED = 4,
  FS_IO_ERROR = 5,
  FS_BUFFER_TOO_SMALL = 6,
  FS_INTERNAL = 255
} fs_status;

/* Opaque handle */
typedef struct fs_reader_s fs_reader;

/* Creation and destruction. destroy closes every member still open. */
FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_create(fs_reader** out);
FUSEDSTREAM_C_API_EXPORT void fs_reader_destroy(fs_reader* r);

/* Attachment. attach_memory copies `size` bytes from `data`. */
FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_attach_path(fs_reader* r, const char* path);
FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_attach_memory(fs_reader* r, const void* data, size_t size);

/* Introspection */
FUSEDSTREAM_C_API_EXPORT int fs_reader_is_finished(const fs_reader* r);
FUSEDSTREAM_C_API_EXPORT size_t fs_reader_member_count(const fs_reader* r);

/* Reads. Byte/line/all reads write at most `capacity` bytes to `out` and the
 * produced length to `out_len`. FS_END_OF_DATA when nothing was available. */
FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_bytes(fs_reader* r, size_t count, void* out,
                                                        size_t* out_len);
FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_line(fs_reader* r, int keep_terminator, char* out,
                                                       size_t capacity, size_t* out_len);
FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_all(fs_reader* r, char* out, size_t capacity,
                                                      size_t* out_len);
FUSEDSTREAM_C_API_EXPORT fs_status fs_reader_read_number(fs_reader* r, uint64_t* out_value);

/* Closes all members and empties the reader; the handle stays valid. */
FUSEDSTREAM_C_API_EXPORT void fs_reader_close(fs_reader* r);

FUSEDSTREAM_C_API_EXPORT const char* fs_status_string(fs_status status);
FUSEDSTREAM_C_API_EXPORT const char* fs_version(void);

/* Notes:
 * - fs_reader_read_bytes requires `out` to hold `count` bytes.
 * - Line and read-all results larger than `capacity` fail with
 *   FS_BUFFER_TOO_SMALL; the data is consumed and `out_len` holds the size
 *   that would have been needed.
 * - Handles are thread-unsafe (matching core); external synchronization is required.
 */

#ifdef __cplusplus
} /* extern "C" */
#endif
