#pragma once

#include "embedcache/error.hpp"
#include "embedcache/platform.hpp"
#include "embedcache/schema.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace embedcache {

/// A decoded (key, vector) pair.
struct Record {
  std::string key;
  std::vector<float> vector;
};

/// A record produced by a log scan, tagged with its starting offset.
struct ScannedRecord {
  uint64_t offset;
  std::string key;
  std::vector<float> vector;
};

/**
 * @brief Append-only file of serialized (key, vector) records.
 *
 * Layout: a 64-byte LogHeader followed by `[u32 key_len][key][dim × f32]`
 * records. The log is the durable source of truth; everything else in a
 * Store can be rebuilt from it.
 *
 * Appends go to `length()` with positional writes. The logical length only
 * advances after the whole record reached the OS, so a failed append never
 * shifts the position of the next record; any partial bytes are overwritten
 * by the next append or truncated away on close.
 *
 * Not thread-safe. The owning Store serializes access.
 */
class RecordLog {
public:
  /**
   * @brief Lazy forward iterator over every record from the first one.
   *
   * The scan end is fixed to the log length at the time scan() was called.
   * A record whose length prefix or body runs past that end yields
   * Error::Corruption; offset() then still points at the start of the
   * undecodable record, i.e. the last good record boundary.
   */
  class Cursor {
  public:
    /// Next record, nullopt at a clean end, or an error.
    Result<std::optional<ScannedRecord>> next();

    /// Offset of the record the next call to next() decodes.
    uint64_t offset() const noexcept { return offset_; }

  private:
    friend class RecordLog;
    Cursor(const RecordLog &log, uint64_t end);

    /// Ensures [pos, pos + n) is buffered. Returns nullptr on read failure.
    const uint8_t *fetch(uint64_t pos, size_t n, Error &err);

    const RecordLog *log_;
    uint64_t offset_;
    uint64_t end_;
    std::vector<uint8_t> buf_;
    uint64_t buf_start_ = 0;
    size_t buf_len_ = 0;
  };

  RecordLog() = default;
  ~RecordLog();

  RecordLog(const RecordLog &) = delete;
  RecordLog &operator=(const RecordLog &) = delete;
  RecordLog(RecordLog &&other) noexcept;
  RecordLog &operator=(RecordLog &&other) noexcept;

  /**
   * @brief Opens the log at `path`, creating it with `dim` if absent or empty.
   *
   * @return InvalidArgument for dim == 0 or dim > MAX_DIMENSION,
   *         IOError if the file cannot be opened or created,
   *         InvalidFormat for a foreign or truncated header,
   *         DimensionMismatch if the stored dim differs from `dim`.
   */
  static Result<RecordLog> open(const std::filesystem::path &path,
                                uint32_t dim);

  /// Appends one record and returns the offset it starts at.
  Result<uint64_t> append(std::string_view key, std::span<const float> vector);

  /// Decodes the record starting at `offset`.
  Result<Record> read_at(uint64_t offset) const;

  /// Decodes only the key of the record starting at `offset`.
  Result<std::string> read_key_at(uint64_t offset) const;

  /// Starts a fresh scan at the first record.
  Cursor scan() const;

  /// Drops everything at and after `length` (used to cut a torn tail).
  Result<void> truncate(uint64_t length);

  /// Flushes written records to stable storage.
  Result<void> sync();

  /**
   * @brief Closes the file, optionally syncing first.
   * The file is trimmed to length() so bytes of a failed append never
   * survive a close.
   */
  Result<void> close(bool sync_first);

  bool is_open() const noexcept {
    return handle_ != platform::INVALID_FILE_HANDLE;
  }

  /// Logical byte length, header included.
  uint64_t length() const noexcept { return end_offset_; }

  uint32_t dim() const noexcept { return dim_; }

  const std::filesystem::path &path() const noexcept { return path_; }

  /// Offset of the first record.
  static constexpr uint64_t first_record_offset() noexcept {
    return sizeof(LogHeader);
  }

private:
  Result<void> read_exact(uint64_t offset, void *dst, size_t size) const;
  Result<uint32_t> read_key_length(uint64_t offset) const;

  platform::FileHandle handle_ = platform::INVALID_FILE_HANDLE;
  std::filesystem::path path_;
  uint32_t dim_ = 0;
  uint64_t end_offset_ = 0;
};

} // namespace embedcache
