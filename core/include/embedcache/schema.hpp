#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace embedcache {

// ═══════════════════════════════════════════════════════════════════════════
// Magic & Version
// ═══════════════════════════════════════════════════════════════════════════

/// Magic bytes of the record log: "EMBEDLOG" read as a little-endian u64.
constexpr uint64_t LOG_MAGIC = 0x474F4C4445424D45;

/// Magic bytes of the index snapshot: "EMBEDIDX" read as a little-endian u64.
constexpr uint64_t SNAPSHOT_MAGIC = 0x5844494445424D45;

/// Record log format version.
constexpr uint32_t LOG_VERSION = 1;

/// Index snapshot format version.
constexpr uint32_t SNAPSHOT_VERSION = 1;

// ═══════════════════════════════════════════════════════════════════════════
// Defaults & Limits
// ═══════════════════════════════════════════════════════════════════════════

/// Default number of decoded vectors kept in the Hot Cache.
constexpr size_t CACHE_CAPACITY_DEFAULT = 100;

/// Upper bound on a single key. Anything larger in a length prefix is treated
/// as a torn or corrupted record.
constexpr uint32_t MAX_KEY_LENGTH = 64u * 1024u * 1024u;

/// Upper bound on the embedding dimension accepted at open.
constexpr uint32_t MAX_DIMENSION = 1u << 20;

/// Accounting footprint of one index entry: 64-bit hash + 64-bit offset.
constexpr size_t INDEX_ENTRY_FOOTPRINT = 16;

/// Suffix appended to the log path to form the snapshot path.
inline constexpr const char *SNAPSHOT_SUFFIX = ".idx";

/// Appended to the snapshot path for the temporary written before the rename.
inline constexpr const char *SNAPSHOT_TMP_SUFFIX = ".tmp";

// ═══════════════════════════════════════════════════════════════════════════
// LogHeader: 64-byte record log header
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Header at offset 0 of the record log.
 *
 * Records start at offset 64 and are concatenated in append order:
 *
 *   [u32 key_length][key bytes][dim × f32]
 *
 * All integers and floats are little-endian. There is no per-record checksum;
 * a torn record is only detectable when a length runs past end-of-file.
 */
struct LogHeader {
  uint64_t magic;       // 0x00: LOG_MAGIC
  uint32_t version;     // 0x08: LOG_VERSION
  uint32_t dim;         // 0x0C: Embedding dimensionality, fixed at creation
  uint8_t reserved[48]; // 0x10: Zeroed on creation
};

static_assert(sizeof(LogHeader) == 64, "LogHeader must be exactly 64 bytes");
static_assert(std::is_standard_layout_v<LogHeader>);
static_assert(std::is_trivially_copyable_v<LogHeader>);

/// Size of the length prefix in front of every key.
constexpr size_t RECORD_KEY_PREFIX = sizeof(uint32_t);

/// Total encoded size of a record.
constexpr uint64_t record_size(uint32_t key_length, uint32_t dim) noexcept {
  return RECORD_KEY_PREFIX + static_cast<uint64_t>(key_length) +
         static_cast<uint64_t>(dim) * sizeof(float);
}

// ═══════════════════════════════════════════════════════════════════════════
// Index Snapshot: written on clean close, validated on open
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Header of the `<log>.idx` snapshot file.
 *
 * Followed by `record_count` SnapshotEntry records. The snapshot only applies
 * to a log whose current byte length equals `log_length`; any other length
 * means the log moved on after the snapshot was taken (or a crash left an
 * unpersisted tail) and the index must be rebuilt by scanning the log.
 */
struct SnapshotHeader {
  uint64_t magic;            // 0x00: SNAPSHOT_MAGIC
  uint32_t version;          // 0x08: SNAPSHOT_VERSION
  uint32_t dim;              // 0x0C: Must match LogHeader::dim
  uint64_t record_count;     // 0x10: Number of entries that follow
  uint64_t log_length;       // 0x18: Log byte length when written
  uint64_t entries_checksum; // 0x20: FNV-1a 64 of the entry bytes
  uint8_t reserved[24];      // 0x28: Zeroed
};

static_assert(sizeof(SnapshotHeader) == 64,
              "SnapshotHeader must be exactly 64 bytes");
static_assert(std::is_trivially_copyable_v<SnapshotHeader>);

/// One persisted index entry.
struct SnapshotEntry {
  uint64_t key_hash;
  uint64_t log_offset;
};

static_assert(sizeof(SnapshotEntry) == INDEX_ENTRY_FOOTPRINT,
              "SnapshotEntry must be 16 bytes");
static_assert(std::is_trivially_copyable_v<SnapshotEntry>);

// ═══════════════════════════════════════════════════════════════════════════
// Little-endian codec helpers
// ═══════════════════════════════════════════════════════════════════════════

inline void store_u32_le(uint8_t *dst, uint32_t v) noexcept {
  dst[0] = static_cast<uint8_t>(v);
  dst[1] = static_cast<uint8_t>(v >> 8);
  dst[2] = static_cast<uint8_t>(v >> 16);
  dst[3] = static_cast<uint8_t>(v >> 24);
}

inline uint32_t load_u32_le(const uint8_t *src) noexcept {
  return static_cast<uint32_t>(src[0]) | (static_cast<uint32_t>(src[1]) << 8) |
         (static_cast<uint32_t>(src[2]) << 16) |
         (static_cast<uint32_t>(src[3]) << 24);
}

inline void store_u64_le(uint8_t *dst, uint64_t v) noexcept {
  store_u32_le(dst, static_cast<uint32_t>(v));
  store_u32_le(dst + 4, static_cast<uint32_t>(v >> 32));
}

inline uint64_t load_u64_le(const uint8_t *src) noexcept {
  return static_cast<uint64_t>(load_u32_le(src)) |
         (static_cast<uint64_t>(load_u32_le(src + 4)) << 32);
}

inline void store_f32_le(uint8_t *dst, float v) noexcept {
  uint32_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  store_u32_le(dst, bits);
}

inline float load_f32_le(const uint8_t *src) noexcept {
  uint32_t bits = load_u32_le(src);
  float v;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

} // namespace embedcache
