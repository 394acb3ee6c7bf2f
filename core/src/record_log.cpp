#include "embedcache/record_log.hpp"
#include "embedcache/logging.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

namespace embedcache {

namespace {

/// Read-ahead window of a log scan.
constexpr size_t SCAN_CHUNK = 1u << 20;

void encode_header(const LogHeader &h, uint8_t *dst) {
  std::memset(dst, 0, sizeof(LogHeader));
  store_u64_le(dst + 0x00, h.magic);
  store_u32_le(dst + 0x08, h.version);
  store_u32_le(dst + 0x0C, h.dim);
}

LogHeader decode_header(const uint8_t *src) {
  LogHeader h{};
  h.magic = load_u64_le(src + 0x00);
  h.version = load_u32_le(src + 0x08);
  h.dim = load_u32_le(src + 0x0C);
  std::memcpy(h.reserved, src + 0x10, sizeof(h.reserved));
  return h;
}

void decode_vector(const uint8_t *src, uint32_t dim, std::vector<float> &out) {
  out.resize(dim);
  for (uint32_t i = 0; i < dim; ++i)
    out[i] = load_f32_le(src + static_cast<size_t>(i) * sizeof(float));
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

RecordLog::~RecordLog() {
  if (is_open()) {
    if (auto r = close(false); !r) {
      EMBEDCACHE_LOG_ERROR("closing record log {} failed: {}", path_.string(),
                           to_string(r.error()));
    }
  }
}

RecordLog::RecordLog(RecordLog &&other) noexcept
    : handle_(other.handle_), path_(std::move(other.path_)), dim_(other.dim_),
      end_offset_(other.end_offset_) {
  other.handle_ = platform::INVALID_FILE_HANDLE;
  other.dim_ = 0;
  other.end_offset_ = 0;
}

RecordLog &RecordLog::operator=(RecordLog &&other) noexcept {
  if (this != &other) {
    if (is_open())
      platform::file_close(handle_);
    handle_ = other.handle_;
    path_ = std::move(other.path_);
    dim_ = other.dim_;
    end_offset_ = other.end_offset_;
    other.handle_ = platform::INVALID_FILE_HANDLE;
    other.dim_ = 0;
    other.end_offset_ = 0;
  }
  return *this;
}

Result<RecordLog> RecordLog::open(const std::filesystem::path &path,
                                  uint32_t dim) {
  if (dim == 0 || dim > MAX_DIMENSION) [[unlikely]]
    return std::unexpected(Error::InvalidArgument);

  RecordLog log;
  log.path_ = path;
  log.handle_ = platform::file_open(path.string().c_str());
  if (!log.is_open()) {
    EMBEDCACHE_LOG_ERROR("cannot open record log {}", path.string());
    return std::unexpected(Error::IOError);
  }

  uint64_t size = 0;
  if (!platform::file_size(log.handle_, size))
    return std::unexpected(Error::IOError);

  LogHeader fresh{};
  fresh.magic = LOG_MAGIC;
  fresh.version = LOG_VERSION;
  fresh.dim = dim;
  uint8_t stamp[sizeof(LogHeader)];
  encode_header(fresh, stamp);

  if (size > 0 && size < sizeof(LogHeader)) {
    // A crash while stamping leaves a prefix of the header (or zero fill).
    // Such a file holds no records and is stamped again; anything else is
    // not ours.
    uint8_t partial[sizeof(LogHeader)];
    if (auto r = log.read_exact(0, partial, static_cast<size_t>(size));
        !r)
      return std::unexpected(r.error() == Error::Corruption
                                 ? Error::InvalidFormat
                                 : r.error());
    for (uint64_t i = 0; i < size; ++i) {
      if (partial[i] != stamp[i] && partial[i] != 0) {
        EMBEDCACHE_LOG_ERROR("{} is {} bytes, shorter than a log header",
                             path.string(), size);
        return std::unexpected(Error::InvalidFormat);
      }
    }
    EMBEDCACHE_LOG_WARN("{} has a torn {}-byte header; restamping",
                        path.string(), size);
    size = 0;
  }

  if (size == 0) {
    // Fresh file: stamp the header. dim is fixed from here on.
    if (!platform::file_write_at(log.handle_, 0, stamp, sizeof(stamp)))
      return std::unexpected(Error::IOError);
    log.dim_ = dim;
    log.end_offset_ = sizeof(LogHeader);
    return log;
  }

  uint8_t raw[sizeof(LogHeader)];
  if (auto r = log.read_exact(0, raw, sizeof(raw)); !r)
    return std::unexpected(r.error() == Error::Corruption ? Error::InvalidFormat
                                                          : r.error());
  LogHeader header = decode_header(raw);

  if (header.magic != LOG_MAGIC || header.version != LOG_VERSION) {
    EMBEDCACHE_LOG_ERROR("{} is not an embedcache log", path.string());
    return std::unexpected(Error::InvalidFormat);
  }
  if (header.dim != dim) {
    EMBEDCACHE_LOG_ERROR("{} has dimension {}, requested {}", path.string(),
                         header.dim, dim);
    return std::unexpected(Error::DimensionMismatch);
  }

  log.dim_ = header.dim;
  log.end_offset_ = size;
  return log;
}

Result<void> RecordLog::close(bool sync_first) {
  if (!is_open())
    return {};

  Result<void> result;
  // dim_ is only set once open() validated the header; a half-opened log is
  // never trimmed.
  uint64_t size = 0;
  if (dim_ != 0) {
    if (!platform::file_size(handle_, size)) {
      result = std::unexpected(Error::IOError);
    } else if (size > end_offset_ &&
               !platform::file_resize(handle_, end_offset_)) {
      result = std::unexpected(Error::IOError);
    }
  }

  if (sync_first && !platform::file_sync(handle_) && result)
    result = std::unexpected(Error::IOError);

  if (!platform::file_close(handle_) && result)
    result = std::unexpected(Error::IOError);
  handle_ = platform::INVALID_FILE_HANDLE;
  return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Write path
// ═══════════════════════════════════════════════════════════════════════════

Result<uint64_t> RecordLog::append(std::string_view key,
                                   std::span<const float> vector) {
  if (!is_open()) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (vector.size() != dim_) [[unlikely]]
    return std::unexpected(Error::DimensionMismatch);
  if (key.size() > MAX_KEY_LENGTH) [[unlikely]]
    return std::unexpected(Error::InvalidArgument);

  const auto key_len = static_cast<uint32_t>(key.size());
  std::vector<uint8_t> buf(record_size(key_len, dim_));
  store_u32_le(buf.data(), key_len);
  if (key_len > 0)
    std::memcpy(buf.data() + RECORD_KEY_PREFIX, key.data(), key_len);
  uint8_t *dst = buf.data() + RECORD_KEY_PREFIX + key_len;
  for (float v : vector) {
    store_f32_le(dst, v);
    dst += sizeof(float);
  }

  if (!platform::file_write_at(handle_, end_offset_, buf.data(), buf.size())) {
    EMBEDCACHE_LOG_ERROR("append of {} bytes at offset {} to {} failed",
                         buf.size(), end_offset_, path_.string());
    return std::unexpected(Error::IOError);
  }

  const uint64_t offset = end_offset_;
  end_offset_ += buf.size();
  return offset;
}

Result<void> RecordLog::truncate(uint64_t length) {
  if (!is_open()) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (length < first_record_offset() || length > end_offset_)
    return std::unexpected(Error::InvalidArgument);
  if (!platform::file_resize(handle_, length))
    return std::unexpected(Error::IOError);
  end_offset_ = length;
  return {};
}

Result<void> RecordLog::sync() {
  if (!is_open()) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (!platform::file_sync(handle_))
    return std::unexpected(Error::IOError);
  return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Read path
// ═══════════════════════════════════════════════════════════════════════════

Result<void> RecordLog::read_exact(uint64_t offset, void *dst,
                                   size_t size) const {
  size_t got = 0;
  if (!platform::file_read_at(handle_, offset, dst, size, got))
    return std::unexpected(Error::IOError);
  if (got != size)
    return std::unexpected(Error::Corruption);
  return {};
}

Result<uint32_t> RecordLog::read_key_length(uint64_t offset) const {
  if (!is_open()) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (offset < first_record_offset() || offset >= end_offset_ ||
      end_offset_ - offset < RECORD_KEY_PREFIX)
    return std::unexpected(Error::Corruption);

  uint8_t prefix[RECORD_KEY_PREFIX];
  if (auto r = read_exact(offset, prefix, sizeof(prefix)); !r)
    return std::unexpected(r.error());

  const uint32_t key_len = load_u32_le(prefix);
  if (key_len > MAX_KEY_LENGTH ||
      record_size(key_len, dim_) > end_offset_ - offset)
    return std::unexpected(Error::Corruption);
  return key_len;
}

Result<Record> RecordLog::read_at(uint64_t offset) const {
  auto key_len = read_key_length(offset);
  if (!key_len)
    return std::unexpected(key_len.error());

  const size_t body = static_cast<size_t>(*key_len) +
                      static_cast<size_t>(dim_) * sizeof(float);
  std::vector<uint8_t> buf(body);
  if (auto r = read_exact(offset + RECORD_KEY_PREFIX, buf.data(), body); !r)
    return std::unexpected(r.error());

  Record rec;
  rec.key.assign(reinterpret_cast<const char *>(buf.data()), *key_len);
  decode_vector(buf.data() + *key_len, dim_, rec.vector);
  return rec;
}

Result<std::string> RecordLog::read_key_at(uint64_t offset) const {
  auto key_len = read_key_length(offset);
  if (!key_len)
    return std::unexpected(key_len.error());

  std::string key(*key_len, '\0');
  if (*key_len > 0) {
    if (auto r = read_exact(offset + RECORD_KEY_PREFIX, key.data(), *key_len);
        !r)
      return std::unexpected(r.error());
  }
  return key;
}

RecordLog::Cursor RecordLog::scan() const {
  return Cursor(*this, end_offset_);
}

// ═══════════════════════════════════════════════════════════════════════════
// Cursor
// ═══════════════════════════════════════════════════════════════════════════

RecordLog::Cursor::Cursor(const RecordLog &log, uint64_t end)
    : log_(&log), offset_(RecordLog::first_record_offset()), end_(end) {}

const uint8_t *RecordLog::Cursor::fetch(uint64_t pos, size_t n, Error &err) {
  if (pos >= buf_start_ && pos + n <= buf_start_ + buf_len_)
    return buf_.data() + (pos - buf_start_);

  const size_t want = static_cast<size_t>(
      std::min<uint64_t>(std::max(n, SCAN_CHUNK), end_ - pos));
  if (buf_.size() < want)
    buf_.resize(want);

  size_t got = 0;
  if (!platform::file_read_at(log_->handle_, pos, buf_.data(), want, got)) {
    err = Error::IOError;
    return nullptr;
  }
  buf_start_ = pos;
  buf_len_ = got;
  if (got < n) {
    // File is shorter than the length recorded when the scan began.
    err = Error::Corruption;
    return nullptr;
  }
  return buf_.data();
}

Result<std::optional<ScannedRecord>> RecordLog::Cursor::next() {
  if (!log_->is_open()) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (offset_ >= end_)
    return std::optional<ScannedRecord>{};

  if (end_ - offset_ < RECORD_KEY_PREFIX)
    return std::unexpected(Error::Corruption);

  Error err = Error::Corruption;
  const uint8_t *p = fetch(offset_, RECORD_KEY_PREFIX, err);
  if (!p)
    return std::unexpected(err);

  const uint32_t key_len = load_u32_le(p);
  if (key_len > MAX_KEY_LENGTH)
    return std::unexpected(Error::Corruption);

  const uint64_t total = record_size(key_len, log_->dim_);
  if (total > end_ - offset_)
    return std::unexpected(Error::Corruption);

  p = fetch(offset_, static_cast<size_t>(total), err);
  if (!p)
    return std::unexpected(err);

  ScannedRecord rec;
  rec.offset = offset_;
  rec.key.assign(reinterpret_cast<const char *>(p + RECORD_KEY_PREFIX),
                 key_len);
  decode_vector(p + RECORD_KEY_PREFIX + key_len, log_->dim_, rec.vector);
  offset_ += total;
  return rec;
}

} // namespace embedcache
