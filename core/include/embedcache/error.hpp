#pragma once

#include <expected>
#include <string_view>

namespace embedcache {

/**
 * @brief Failure taxonomy of the storage engine.
 *
 * "Not found" is deliberately absent: a miss is an empty std::optional inside
 * a successful result, never an Error.
 */
enum class Error {
  InvalidHandle,     // Store closed, or handle never issued
  DimensionMismatch, // Vector length differs from the store dimension
  IOError,           // open/read/write/sync/rename failed
  Corruption,        // Record length inconsistent with the bytes on disk
  InvalidFormat,     // Not an embedcache log (bad magic or version)
  InvalidArgument,   // Rejected parameter (dim == 0, oversized key, ...)
  ResourceExhausted  // No free handle slot
};

/// Short stable name, used in log lines and C ABI error messages.
constexpr std::string_view to_string(Error e) noexcept {
  switch (e) {
  case Error::InvalidHandle:
    return "invalid handle";
  case Error::DimensionMismatch:
    return "dimension mismatch";
  case Error::IOError:
    return "I/O error";
  case Error::Corruption:
    return "corruption";
  case Error::InvalidFormat:
    return "invalid format";
  case Error::InvalidArgument:
    return "invalid argument";
  case Error::ResourceExhausted:
    return "resource exhausted";
  }
  return "unknown";
}

template <typename T> using Result = std::expected<T, Error>;

} // namespace embedcache
