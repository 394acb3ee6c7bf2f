#pragma once

/**
 * @file platform.hpp
 * @brief Cross-platform OS abstraction for positional file I/O.
 *
 * Provides a unified API over:
 *   - POSIX:   open(), pread(), pwrite(), fsync(), ftruncate() (Linux/macOS)
 *   - Win32:   CreateFile(), ReadFile()/WriteFile() with OVERLAPPED offsets
 *
 * All platform-specific headers and syscalls are confined to this single
 * translation boundary. The rest of embedcache only uses embedcache::platform.
 *
 * Every read/write helper loops until the full range is transferred, so a
 * short transfer is only reported when the OS reports an error or EOF.
 */

#include <cstddef>
#include <cstdint>

#if defined(_WIN32) || defined(_WIN64)
#define EMBEDCACHE_PLATFORM_WINDOWS 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#define EMBEDCACHE_PLATFORM_POSIX 1
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace embedcache::platform {

// ============================================================================
// File Handle Abstraction
// ============================================================================

#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
using FileHandle = HANDLE;
inline const FileHandle INVALID_FILE_HANDLE = INVALID_HANDLE_VALUE;
#else
using FileHandle = int;
inline constexpr FileHandle INVALID_FILE_HANDLE = -1;
#endif

// ============================================================================
// Open / Close
// ============================================================================

/**
 * @brief Open or create a file for read/write access.
 * @param path  Null-terminated file path (UTF-8 on POSIX, narrow on Win32)
 * @param mode  0644-style permissions (POSIX only, ignored on Windows)
 * @return File handle or INVALID_FILE_HANDLE on failure.
 */
inline FileHandle file_open(const char *path,
                            [[maybe_unused]] int mode = 0644) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  return CreateFileA(path, GENERIC_READ | GENERIC_WRITE, FILE_SHARE_READ,
                     nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
#else
  int flags = O_RDWR | O_CREAT;
#ifdef O_CLOEXEC
  flags |= O_CLOEXEC;
#endif
  return ::open(path, flags, mode);
#endif
}

/**
 * @brief Create (or truncate) a file for writing only.
 * Used for snapshot temporaries that are renamed into place.
 */
inline FileHandle file_create_truncate(const char *path,
                                       [[maybe_unused]] int mode = 0644) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  return CreateFileA(path, GENERIC_READ | GENERIC_WRITE, 0, nullptr,
                     CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
#else
  int flags = O_RDWR | O_CREAT | O_TRUNC;
#ifdef O_CLOEXEC
  flags |= O_CLOEXEC;
#endif
  return ::open(path, flags, mode);
#endif
}

/**
 * @brief Open an existing file read-only.
 */
inline FileHandle file_open_readonly(const char *path) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  return CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                     OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
#else
  int flags = O_RDONLY;
#ifdef O_CLOEXEC
  flags |= O_CLOEXEC;
#endif
  return ::open(path, flags);
#endif
}

/**
 * @brief Close a file handle.
 * @return true if the OS accepted the close.
 */
inline bool file_close(FileHandle h) {
  if (h == INVALID_FILE_HANDLE)
    return true;
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  return CloseHandle(h) != 0;
#else
  return ::close(h) == 0;
#endif
}

// ============================================================================
// Metadata
// ============================================================================

/**
 * @brief Get the size of an open file.
 * @param[out] out_size Receives the size in bytes.
 * @return true on success.
 */
inline bool file_size(FileHandle h, uint64_t &out_size) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  LARGE_INTEGER sz;
  if (!GetFileSizeEx(h, &sz))
    return false;
  out_size = static_cast<uint64_t>(sz.QuadPart);
  return true;
#else
  struct stat sb;
  if (::fstat(h, &sb) == -1)
    return false;
  out_size = static_cast<uint64_t>(sb.st_size);
  return true;
#endif
}

/**
 * @brief Resize (truncate/extend) a file.
 * @return true on success.
 */
inline bool file_resize(FileHandle h, uint64_t new_size) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  LARGE_INTEGER li;
  li.QuadPart = static_cast<LONGLONG>(new_size);
  if (!SetFilePointerEx(h, li, nullptr, FILE_BEGIN))
    return false;
  return SetEndOfFile(h) != 0;
#else
  return ::ftruncate(h, static_cast<off_t>(new_size)) == 0;
#endif
}

/**
 * @brief Flush file contents and metadata to stable storage.
 */
inline bool file_sync(FileHandle h) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  return FlushFileBuffers(h) != 0;
#else
  return ::fsync(h) == 0;
#endif
}

// ============================================================================
// Positional I/O
// ============================================================================

/**
 * @brief Read exactly `size` bytes at `offset`.
 * @param[out] out_read Bytes actually read (less than size only at EOF/error).
 * @return false on an OS error; true otherwise (check out_read for EOF).
 */
inline bool file_read_at(FileHandle h, uint64_t offset, void *buf, size_t size,
                         size_t &out_read) {
  auto *dst = static_cast<uint8_t *>(buf);
  out_read = 0;
  while (out_read < size) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
    OVERLAPPED ov{};
    uint64_t pos = offset + out_read;
    ov.Offset = static_cast<DWORD>(pos & 0xFFFFFFFF);
    ov.OffsetHigh = static_cast<DWORD>(pos >> 32);
    size_t remaining = size - out_read;
    DWORD chunk = remaining > 0x40000000 ? 0x40000000
                                         : static_cast<DWORD>(remaining);
    DWORD got = 0;
    if (!ReadFile(h, dst + out_read, chunk, &got, &ov)) {
      if (GetLastError() == ERROR_HANDLE_EOF)
        return true;
      return false;
    }
    if (got == 0)
      return true;
    out_read += got;
#else
    ssize_t got = ::pread(h, dst + out_read, size - out_read,
                          static_cast<off_t>(offset + out_read));
    if (got < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (got == 0)
      return true; // EOF
    out_read += static_cast<size_t>(got);
#endif
  }
  return true;
}

/**
 * @brief Write exactly `size` bytes at `offset`.
 * @return true only if every byte was written.
 */
inline bool file_write_at(FileHandle h, uint64_t offset, const void *buf,
                          size_t size) {
  const auto *src = static_cast<const uint8_t *>(buf);
  size_t written = 0;
  while (written < size) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
    OVERLAPPED ov{};
    uint64_t pos = offset + written;
    ov.Offset = static_cast<DWORD>(pos & 0xFFFFFFFF);
    ov.OffsetHigh = static_cast<DWORD>(pos >> 32);
    size_t remaining = size - written;
    DWORD chunk = remaining > 0x40000000 ? 0x40000000
                                         : static_cast<DWORD>(remaining);
    DWORD put = 0;
    if (!WriteFile(h, src + written, chunk, &put, &ov) || put == 0)
      return false;
    written += put;
#else
    ssize_t put = ::pwrite(h, src + written, size - written,
                           static_cast<off_t>(offset + written));
    if (put < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (put == 0)
      return false;
    written += static_cast<size_t>(put);
#endif
  }
  return true;
}

// ============================================================================
// Path Operations
// ============================================================================

/**
 * @brief Atomically replace `to` with `from`.
 */
inline bool file_rename(const char *from, const char *to) {
#if defined(EMBEDCACHE_PLATFORM_WINDOWS)
  return MoveFileExA(from, to, MOVEFILE_REPLACE_EXISTING) != 0;
#else
  return std::rename(from, to) == 0;
#endif
}

} // namespace embedcache::platform
