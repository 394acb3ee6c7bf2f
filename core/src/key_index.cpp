#include "embedcache/key_index.hpp"
#include "embedcache/logging.hpp"
#include "embedcache/platform.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

namespace embedcache {

namespace {

void encode_snapshot_header(const SnapshotHeader &h, uint8_t *dst) {
  std::memset(dst, 0, sizeof(SnapshotHeader));
  store_u64_le(dst + 0x00, h.magic);
  store_u32_le(dst + 0x08, h.version);
  store_u32_le(dst + 0x0C, h.dim);
  store_u64_le(dst + 0x10, h.record_count);
  store_u64_le(dst + 0x18, h.log_length);
  store_u64_le(dst + 0x20, h.entries_checksum);
}

SnapshotHeader decode_snapshot_header(const uint8_t *src) {
  SnapshotHeader h{};
  h.magic = load_u64_le(src + 0x00);
  h.version = load_u32_le(src + 0x08);
  h.dim = load_u32_le(src + 0x0C);
  h.record_count = load_u64_le(src + 0x10);
  h.log_length = load_u64_le(src + 0x18);
  h.entries_checksum = load_u64_le(src + 0x20);
  return h;
}

/// Closes a platform handle on scope exit.
class ScopedFile {
public:
  explicit ScopedFile(platform::FileHandle h) : h_(h) {}
  ~ScopedFile() {
    if (h_ != platform::INVALID_FILE_HANDLE)
      platform::file_close(h_);
  }
  ScopedFile(const ScopedFile &) = delete;
  ScopedFile &operator=(const ScopedFile &) = delete;

  platform::FileHandle get() const noexcept { return h_; }
  bool valid() const noexcept { return h_ != platform::INVALID_FILE_HANDLE; }

  /// Closes now and reports whether the OS accepted it.
  bool close() {
    bool ok = platform::file_close(h_);
    h_ = platform::INVALID_FILE_HANDLE;
    return ok;
  }

private:
  platform::FileHandle h_;
};

} // namespace

void KeyIndex::assign(std::string_view key, std::optional<uint64_t> previous,
                      uint64_t offset) {
  const uint64_t h = hash::key_hash(key);
  if (previous) {
    auto [it, last] = entries_.equal_range(h);
    for (; it != last; ++it) {
      if (it->second == *previous) {
        it->second = offset;
        return;
      }
    }
  }
  entries_.emplace(h, offset);
}

std::vector<uint64_t> KeyIndex::sorted_offsets() const {
  std::vector<uint64_t> out;
  out.reserve(entries_.size());
  for (const auto &[h, off] : entries_)
    out.push_back(off);
  std::sort(out.begin(), out.end());
  return out;
}

std::filesystem::path
KeyIndex::snapshot_path_for(const std::filesystem::path &log_path) {
  std::filesystem::path p = log_path;
  p += SNAPSHOT_SUFFIX;
  return p;
}

// ═══════════════════════════════════════════════════════════════════════════
// Snapshot write: header + entries → <path>.tmp → fsync → rename
// ═══════════════════════════════════════════════════════════════════════════

Result<void> KeyIndex::save_snapshot(const std::filesystem::path &path,
                                     uint32_t dim,
                                     uint64_t log_length) const {
  // Entries in log order so identical indexes produce identical files.
  std::vector<std::pair<uint64_t, uint64_t>> sorted(entries_.begin(),
                                                    entries_.end());
  std::sort(sorted.begin(), sorted.end(),
            [](const auto &a, const auto &b) { return a.second < b.second; });

  std::vector<uint8_t> buf(sizeof(SnapshotHeader) +
                           sorted.size() * sizeof(SnapshotEntry));
  uint8_t *dst = buf.data() + sizeof(SnapshotHeader);
  for (const auto &[h, off] : sorted) {
    store_u64_le(dst, h);
    store_u64_le(dst + 8, off);
    dst += sizeof(SnapshotEntry);
  }

  SnapshotHeader header{};
  header.magic = SNAPSHOT_MAGIC;
  header.version = SNAPSHOT_VERSION;
  header.dim = dim;
  header.record_count = sorted.size();
  header.log_length = log_length;
  header.entries_checksum =
      hash::fnv1a_64(buf.data() + sizeof(SnapshotHeader),
                     buf.size() - sizeof(SnapshotHeader));
  encode_snapshot_header(header, buf.data());

  std::filesystem::path tmp = path;
  tmp += SNAPSHOT_TMP_SUFFIX;
  const std::string tmp_str = tmp.string();

  ScopedFile file(platform::file_create_truncate(tmp_str.c_str()));
  if (!file.valid()) {
    EMBEDCACHE_LOG_ERROR("cannot create snapshot {}", tmp_str);
    return std::unexpected(Error::IOError);
  }
  if (!platform::file_write_at(file.get(), 0, buf.data(), buf.size()) ||
      !platform::file_sync(file.get())) {
    EMBEDCACHE_LOG_ERROR("writing snapshot {} failed", tmp_str);
    if (!file.close())
      EMBEDCACHE_LOG_WARN("closing {} failed", tmp_str);
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return std::unexpected(Error::IOError);
  }
  if (!file.close() ||
      !platform::file_rename(tmp_str.c_str(), path.string().c_str())) {
    EMBEDCACHE_LOG_ERROR("publishing snapshot {} failed", path.string());
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return std::unexpected(Error::IOError);
  }

  EMBEDCACHE_LOG_DEBUG("wrote snapshot {} with {} entries at log length {}",
                       path.string(), sorted.size(), log_length);
  return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Snapshot load: every field must agree with the live log
// ═══════════════════════════════════════════════════════════════════════════

Result<void> KeyIndex::load_snapshot(const std::filesystem::path &path,
                                     uint32_t dim, uint64_t log_length) {
  const std::string path_str = path.string();
  ScopedFile file(platform::file_open_readonly(path_str.c_str()));
  if (!file.valid())
    return std::unexpected(Error::IOError);

  uint64_t size = 0;
  if (!platform::file_size(file.get(), size))
    return std::unexpected(Error::IOError);
  if (size < sizeof(SnapshotHeader)) {
    EMBEDCACHE_LOG_WARN("snapshot {} is truncated", path_str);
    return std::unexpected(Error::InvalidFormat);
  }

  uint8_t raw[sizeof(SnapshotHeader)];
  size_t got = 0;
  if (!platform::file_read_at(file.get(), 0, raw, sizeof(raw), got) ||
      got != sizeof(raw))
    return std::unexpected(Error::IOError);
  const SnapshotHeader header = decode_snapshot_header(raw);

  if (header.magic != SNAPSHOT_MAGIC || header.version != SNAPSHOT_VERSION) {
    EMBEDCACHE_LOG_WARN("snapshot {} has a foreign header", path_str);
    return std::unexpected(Error::InvalidFormat);
  }
  if (header.dim != dim) {
    EMBEDCACHE_LOG_WARN("snapshot {} dimension {} does not match log "
                        "dimension {}",
                        path_str, header.dim, dim);
    return std::unexpected(Error::InvalidFormat);
  }
  if (header.log_length != log_length) {
    EMBEDCACHE_LOG_INFO("snapshot {} covers {} log bytes, log has {}; stale",
                        path_str, header.log_length, log_length);
    return std::unexpected(Error::InvalidFormat);
  }

  const uint64_t body = size - sizeof(SnapshotHeader);
  if (header.record_count > body / sizeof(SnapshotEntry) ||
      header.record_count * sizeof(SnapshotEntry) != body) {
    EMBEDCACHE_LOG_WARN("snapshot {} entry count {} disagrees with its size",
                        path_str, header.record_count);
    return std::unexpected(Error::Corruption);
  }

  std::vector<uint8_t> buf(static_cast<size_t>(body));
  if (body > 0) {
    if (!platform::file_read_at(file.get(), sizeof(SnapshotHeader), buf.data(),
                                buf.size(), got) ||
        got != buf.size())
      return std::unexpected(Error::IOError);
  }
  if (hash::fnv1a_64(buf.data(), buf.size()) != header.entries_checksum) {
    EMBEDCACHE_LOG_WARN("snapshot {} checksum mismatch", path_str);
    return std::unexpected(Error::Corruption);
  }

  constexpr uint64_t first_record = sizeof(LogHeader);
  std::unordered_multimap<uint64_t, uint64_t> loaded;
  loaded.reserve(static_cast<size_t>(header.record_count));
  for (uint64_t i = 0; i < header.record_count; ++i) {
    const uint8_t *src = buf.data() + i * sizeof(SnapshotEntry);
    const uint64_t h = load_u64_le(src);
    const uint64_t off = load_u64_le(src + 8);
    if (off < first_record || off >= log_length ||
        log_length - off < RECORD_KEY_PREFIX) {
      EMBEDCACHE_LOG_WARN("snapshot {} offset {} lies outside the log",
                          path_str, off);
      return std::unexpected(Error::Corruption);
    }
    loaded.emplace(h, off);
  }

  entries_ = std::move(loaded);
  return {};
}

} // namespace embedcache
