#include "embedcache/store.hpp"
#include "embedcache/logging.hpp"
#include <system_error>
#include <utility>

namespace embedcache {

namespace {

const char *source_name(IndexSource s) {
  switch (s) {
  case IndexSource::Fresh:
    return "fresh";
  case IndexSource::Snapshot:
    return "snapshot";
  case IndexSource::Rebuilt:
    return "log scan";
  }
  return "?";
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Open / Recovery
// ═══════════════════════════════════════════════════════════════════════════

Store::Store(std::filesystem::path path, const StoreOptions &options,
             RecordLog log)
    : path_(std::move(path)), options_(options), log_(std::move(log)),
      cache_(options.cache_capacity) {}

Result<std::unique_ptr<Store>> Store::open(std::filesystem::path path,
                                           const StoreOptions &options) {
  if (options.dim == 0 || options.dim > MAX_DIMENSION) {
    EMBEDCACHE_LOG_ERROR("refusing to open {} with dimension {}", path.string(),
                         options.dim);
    return std::unexpected(Error::InvalidArgument);
  }

  auto log = RecordLog::open(path, options.dim);
  if (!log)
    return std::unexpected(log.error());

  std::unique_ptr<Store> store(
      new Store(std::move(path), options, std::move(*log)));

  if (auto r = store->build_index(); !r) {
    EMBEDCACHE_LOG_ERROR("building index for {} failed: {}",
                         store->path_.string(), to_string(r.error()));
    // Nothing was persisted yet; drop the half-built store without a snapshot.
    store->open_ = false;
    return std::unexpected(r.error());
  }

  EMBEDCACHE_LOG_INFO("opened {} dim={} records={} index={} log_bytes={}",
                      store->path_.string(), options.dim,
                      store->index_.size(),
                      source_name(store->index_source_),
                      store->log_.length());
  return store;
}

Result<void> Store::build_index() {
  if (log_.length() == RecordLog::first_record_offset()) {
    index_source_ = IndexSource::Fresh;
    return {};
  }

  const auto snapshot = KeyIndex::snapshot_path_for(path_);
  std::error_code ec;
  if (std::filesystem::exists(snapshot, ec)) {
    if (index_.load_snapshot(snapshot, options_.dim, log_.length())) {
      index_source_ = IndexSource::Snapshot;
      return {};
    }
    EMBEDCACHE_LOG_INFO("snapshot {} rejected; rebuilding index from log",
                        snapshot.string());
  }
  return rebuild_index();
}

Result<void> Store::rebuild_index() {
  index_.clear();
  auto cursor = log_.scan();

  while (true) {
    auto next = cursor.next();
    if (!next) {
      if (next.error() != Error::Corruption)
        return std::unexpected(next.error());

      // Torn trailing record: keep everything before it, cut the rest so the
      // next append starts on a record boundary.
      const uint64_t good = cursor.offset();
      EMBEDCACHE_LOG_WARN("log {} has an undecodable record at offset {}; "
                          "discarding {} trailing bytes",
                          path_.string(), good, log_.length() - good);
      if (auto t = log_.truncate(good); !t)
        return std::unexpected(t.error());
      break;
    }
    if (!next->has_value())
      break;

    const ScannedRecord &rec = **next;
    auto same_key = [this, &rec](uint64_t off) -> Result<bool> {
      auto k = log_.read_key_at(off);
      if (!k)
        return std::unexpected(k.error());
      return *k == rec.key;
    };
    if (auto put = index_.put(rec.key, rec.offset, same_key); !put)
      return std::unexpected(put.error());
  }

  index_source_ = IndexSource::Rebuilt;
  return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Data path
// ═══════════════════════════════════════════════════════════════════════════

Result<void> Store::insert(std::string_view key,
                           std::span<const float> vector) {
  std::lock_guard lock(mutex_);
  if (!open_) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (vector.size() != options_.dim)
    return std::unexpected(Error::DimensionMismatch);
  if (key.size() > MAX_KEY_LENGTH)
    return std::unexpected(Error::InvalidArgument);

  // Resolve the previous entry before touching the log, so that a read
  // failure here leaves both the log and the index unchanged.
  auto same_key = [this, key](uint64_t off) -> Result<bool> {
    auto k = log_.read_key_at(off);
    if (!k)
      return std::unexpected(k.error());
    return *k == key;
  };
  auto previous = index_.find(key, same_key);
  if (!previous)
    return std::unexpected(previous.error());

  auto offset = log_.append(key, vector);
  if (!offset)
    return std::unexpected(offset.error());

  index_.assign(key, *previous, *offset);
  cache_.put(key, vector);
  return {};
}

Result<std::optional<std::vector<float>>> Store::get(std::string_view key) {
  std::lock_guard lock(mutex_);
  if (!open_) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);

  if (auto hit = cache_.get(key))
    return hit;

  // Decode the full record while confirming the key: one read per probe.
  std::vector<float> found;
  auto take_if_same = [this, key, &found](uint64_t off) -> Result<bool> {
    auto rec = log_.read_at(off);
    if (!rec)
      return std::unexpected(rec.error());
    if (rec->key != key)
      return false;
    found = std::move(rec->vector);
    return true;
  };
  auto offset = index_.find(key, take_if_same);
  if (!offset) {
    EMBEDCACHE_LOG_ERROR("get from {} failed: {}", path_.string(),
                         to_string(offset.error()));
    return std::unexpected(offset.error());
  }
  if (!offset->has_value())
    return std::optional<std::vector<float>>{};

  cache_.put(key, found);
  return std::optional<std::vector<float>>{std::move(found)};
}

Result<bool> Store::contains(std::string_view key) {
  std::lock_guard lock(mutex_);
  if (!open_) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (cache_.contains(key))
    return true;

  auto same_key = [this, key](uint64_t off) -> Result<bool> {
    auto k = log_.read_key_at(off);
    if (!k)
      return std::unexpected(k.error());
    return *k == key;
  };
  auto offset = index_.find(key, same_key);
  if (!offset)
    return std::unexpected(offset.error());
  return offset->has_value();
}

Result<std::optional<Match>> Store::find_similar(std::span<const float> query,
                                                 float threshold) {
  std::lock_guard lock(mutex_);
  if (!open_) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  if (query.size() != options_.dim)
    return std::unexpected(Error::DimensionMismatch);
  return find_best_match(log_, index_, query, threshold);
}

Result<StoreStats> Store::stats() const {
  std::lock_guard lock(mutex_);
  if (!open_) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);

  StoreStats s;
  s.records = index_.size();
  s.dimension = options_.dim;
  s.file_size = log_.length();
  s.index_size = index_.size();
  s.cache_size = cache_.size();
  s.cache_capacity = cache_.capacity();
  s.index_memory_bytes = index_.memory_bytes();
  s.cache_memory_bytes =
      s.cache_size * static_cast<uint64_t>(options_.dim) * sizeof(float);
  s.memory_usage_bytes = s.index_memory_bytes + s.cache_memory_bytes;
  return s;
}

// ═══════════════════════════════════════════════════════════════════════════
// Durability / Close
// ═══════════════════════════════════════════════════════════════════════════

Result<void> Store::persist_locked() {
  if (auto r = log_.sync(); !r) {
    EMBEDCACHE_LOG_ERROR("sync of {} failed", path_.string());
    return r;
  }
  if (options_.persist_snapshot) {
    return index_.save_snapshot(KeyIndex::snapshot_path_for(path_),
                                options_.dim, log_.length());
  }
  return {};
}

Result<void> Store::flush() {
  std::lock_guard lock(mutex_);
  if (!open_) [[unlikely]]
    return std::unexpected(Error::InvalidHandle);
  return persist_locked();
}

Result<void> Store::close_locked() {
  open_ = false;

  const uint64_t final_length = log_.length();
  auto result = log_.close(options_.sync_on_close);
  if (!result) {
    EMBEDCACHE_LOG_ERROR("closing {} failed: {}", path_.string(),
                         to_string(result.error()));
  } else if (options_.persist_snapshot) {
    // Only describe a log that was closed cleanly.
    result = index_.save_snapshot(KeyIndex::snapshot_path_for(path_),
                                  options_.dim, final_length);
  }

  if (result) {
    EMBEDCACHE_LOG_INFO("closed {} records={} log_bytes={}", path_.string(),
                        index_.size(), final_length);
  }
  cache_.clear();
  index_.clear();
  return result;
}

Result<void> Store::close() {
  std::lock_guard lock(mutex_);
  if (!open_)
    return std::unexpected(Error::InvalidHandle);
  return close_locked();
}

bool Store::is_open() const {
  std::lock_guard lock(mutex_);
  return open_;
}

Store::~Store() {
  std::lock_guard lock(mutex_);
  if (open_) {
    if (auto r = close_locked(); !r) {
      EMBEDCACHE_LOG_ERROR("implicit close of {} failed: {}", path_.string(),
                           to_string(r.error()));
    }
  }
}

} // namespace embedcache
