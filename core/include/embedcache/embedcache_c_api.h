/**
 * @file embedcache_c_api.h
 * @brief Flat C ABI of the embedcache engine.
 *
 * CONSUMERS:
 *   - Python (ctypes / cffi), Node (ffi-napi), Go (cgo), C# (P/Invoke)
 *   - The header-only C++ client in bindings/cpp/EmbedCacheClient.hpp
 *
 * DESIGN INVARIANTS:
 *   1. All functions are `extern "C"` for flat ABI compatibility.
 *   2. Stores are addressed by positive integer handles, never pointers.
 *      A closed handle is rejected with EMBEDCACHE_ERR_INVALID_HANDLE.
 *   3. C++ exceptions NEVER cross the boundary.
 *   4. Buffers returned by get / find_similar / get_stats are allocated by
 *      the engine and OWNED BY THE CALLER until released with
 *      embedcache_free_vector() or embedcache_free_string(). The engine keeps
 *      no reference to them.
 *   5. Negative values always mean failure. A miss is reported as
 *      EMBEDCACHE_ERR_NOT_FOUND with every out-pointer left untouched.
 *   6. EMBEDCACHE_API handles DLL export on Windows and visibility on POSIX.
 */

#ifndef EMBEDCACHE_C_API_H
#define EMBEDCACHE_C_API_H

#include <stddef.h>
#include <stdint.h>

/* ═══════════════════════════════════════════════════════════════════════════
 * DLL EXPORT MACRO
 * ═══════════════════════════════════════════════════════════════════════════
 */
#if defined(_WIN32) || defined(_WIN64)
#ifdef EMBEDCACHE_BUILDING_SHARED
#define EMBEDCACHE_API __declspec(dllexport)
#else
#define EMBEDCACHE_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define EMBEDCACHE_API __attribute__((visibility("default")))
#else
#define EMBEDCACHE_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ═══════════════════════════════════════════════════════════════════════════
 * ERROR CODES: embedcache_error_t
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef enum {
  EMBEDCACHE_OK = 0,                      /**< Success */
  EMBEDCACHE_ERR_NULL_PTR = -1,           /**< Required pointer was NULL */
  EMBEDCACHE_ERR_INVALID_HANDLE = -2,     /**< Unknown or closed handle */
  EMBEDCACHE_ERR_DIMENSION_MISMATCH = -3, /**< Vector length != store dim */
  EMBEDCACHE_ERR_NOT_FOUND = -4,          /**< No entry / no match */
  EMBEDCACHE_ERR_FILE_IO = -5,            /**< open, read, write, sync */
  EMBEDCACHE_ERR_CORRUPTION = -6,         /**< Record inconsistent with file */
  EMBEDCACHE_ERR_INVALID_FORMAT = -7,     /**< Not an embedcache log */
  EMBEDCACHE_ERR_OUT_OF_MEMORY = -8,      /**< Allocation or handle slots */
  EMBEDCACHE_ERR_INVALID_ARG = -9,        /**< dim == 0, path already open */
  EMBEDCACHE_ERR_UNKNOWN = -99            /**< Unexpected internal error */
} embedcache_error_t;

typedef enum {
  EMBEDCACHE_LOG_LEVEL_DEBUG = 0,
  EMBEDCACHE_LOG_LEVEL_INFO = 1,
  EMBEDCACHE_LOG_LEVEL_WARN = 2,
  EMBEDCACHE_LOG_LEVEL_ERROR = 3,
  EMBEDCACHE_LOG_LEVEL_OFF = 4
} embedcache_log_level_t;

/** Default Hot Cache bound in vectors. */
#define EMBEDCACHE_DEFAULT_CACHE_CAPACITY 100

/**
 * @brief Open-time options. Initialize with embedcache_default_options().
 */
typedef struct {
  uint32_t dim;            /**< Embedding dimension (required, > 0) */
  uint64_t cache_capacity; /**< Hot Cache bound; 0 disables caching */
  int persist_snapshot;    /**< 1 = write <path>.idx on flush/close */
  int sync_on_close;       /**< 1 = fsync the log on close */
} embedcache_options_t;

/**
 * @brief Store figures, all derived at call time.
 */
typedef struct {
  uint64_t records;            /**< Live keys */
  uint64_t dimension;          /**< Store dimension */
  uint64_t file_size;          /**< Log bytes, superseded records included */
  uint64_t index_size;         /**< Index entries (== records) */
  uint64_t cache_size;         /**< Vectors in the Hot Cache */
  uint64_t cache_capacity;     /**< Hot Cache bound */
  uint64_t index_memory_bytes; /**< index_size * 16 */
  uint64_t cache_memory_bytes; /**< cache_size * dimension * 4 */
  uint64_t memory_usage_bytes; /**< index + cache */
} embedcache_stats_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * LIBRARY
 * ═══════════════════════════════════════════════════════════════════════════
 */

/** Static version string. Never free it. */
EMBEDCACHE_API const char *embedcache_version(void);

/**
 * @brief Message of the last failing call on the calling thread.
 * Empty string if none. Static thread-local storage: never free it.
 */
EMBEDCACHE_API const char *embedcache_last_error(void);

/** Overrides the EMBEDCACHE_LOG_LEVEL environment setting. */
EMBEDCACHE_API void embedcache_set_log_level(embedcache_log_level_t level);

/** Fills `opts` with defaults (dim 0, capacity 100, snapshot and sync on). */
EMBEDCACHE_API void embedcache_default_options(embedcache_options_t *opts);

/* ═══════════════════════════════════════════════════════════════════════════
 * LIFECYCLE
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @brief Opens or creates the store at `path` with default options.
 *
 * @param[in] path Null-terminated file path (UTF-8).
 * @param[in] dim  Embedding dimension. Must match an existing file.
 * @return A positive handle, or a negative embedcache_error_t.
 */
EMBEDCACHE_API int32_t embedcache_open(const char *path, uint32_t dim);

/**
 * @brief Opens or creates the store at `path` with explicit options.
 * @param[out] out_handle Receives the positive handle on success.
 */
EMBEDCACHE_API embedcache_error_t embedcache_open_ex(
    const char *path, const embedcache_options_t *opts, int32_t *out_handle);

/**
 * @brief Persists the index snapshot, syncs and releases the store.
 * The handle is invalid afterwards, even if persisting failed.
 */
EMBEDCACHE_API embedcache_error_t embedcache_close(int32_t handle);

/** Persists the snapshot and syncs the log; the handle stays open. */
EMBEDCACHE_API embedcache_error_t embedcache_flush(int32_t handle);

EMBEDCACHE_API embedcache_error_t embedcache_get_dim(int32_t handle,
                                                     uint32_t *out_dim);

/* ═══════════════════════════════════════════════════════════════════════════
 * DATA
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @brief Stores `vector` under the `key_len` bytes at `key`.
 * `key` may be NULL only when key_len is 0. `len` must equal the store dim.
 */
EMBEDCACHE_API embedcache_error_t embedcache_insert(int32_t handle,
                                                   const char *key,
                                                   size_t key_len,
                                                   const float *vector,
                                                   size_t len);

/**
 * @brief Copies the latest vector for `key` into a new buffer.
 *
 * @param[out] out_vector Receives a buffer of *out_len floats. Release it
 *                        with embedcache_free_vector().
 * @return EMBEDCACHE_ERR_NOT_FOUND if the key was never inserted.
 */
EMBEDCACHE_API embedcache_error_t embedcache_get(int32_t handle,
                                                const char *key,
                                                size_t key_len,
                                                float **out_vector,
                                                size_t *out_len);

/** Sets *out_found to 1 if `key` is live, 0 otherwise. */
EMBEDCACHE_API embedcache_error_t embedcache_contains(int32_t handle,
                                                     const char *key,
                                                     size_t key_len,
                                                     int *out_found);

/**
 * @brief Exhaustive cosine search for the best match at or above threshold.
 *
 * @param[out] out_vector  Matched vector; free with embedcache_free_vector().
 * @param[out] out_len     Length of out_vector.
 * @param[out] out_score   Cosine similarity of the match.
 * @param[out] out_key     Optional (may be NULL). NUL-terminated copy of the
 *                         matched key; free with embedcache_free_string().
 * @param[out] out_key_len Optional (may be NULL). Key length in bytes.
 * @return EMBEDCACHE_ERR_NOT_FOUND if nothing reaches the threshold.
 */
EMBEDCACHE_API embedcache_error_t embedcache_find_similar(
    int32_t handle, const float *query, size_t len, float threshold,
    float **out_vector, size_t *out_len, float *out_score, char **out_key,
    size_t *out_key_len);

/* ═══════════════════════════════════════════════════════════════════════════
 * STATS
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @brief Serializes the store figures as a JSON object.
 * Keys: records, dimension, file_size, index_size, cache_size,
 * cache_capacity, index_memory_bytes, cache_memory_bytes, memory_usage_bytes.
 *
 * @param[out] out_json NUL-terminated; free with embedcache_free_string().
 */
EMBEDCACHE_API embedcache_error_t embedcache_get_stats(int32_t handle,
                                                      char **out_json);

/** Caller-allocated variant of embedcache_get_stats(). */
EMBEDCACHE_API embedcache_error_t
embedcache_get_stats_struct(int32_t handle, embedcache_stats_t *out_stats);

/* ═══════════════════════════════════════════════════════════════════════════
 * OWNERSHIP
 * ═══════════════════════════════════════════════════════════════════════════
 */

/** Releases a buffer from embedcache_get / embedcache_find_similar. NULL ok. */
EMBEDCACHE_API void embedcache_free_vector(float *vector);

/** Releases a string from embedcache_get_stats / find_similar. NULL ok. */
EMBEDCACHE_API void embedcache_free_string(char *str);

#ifdef __cplusplus
}
#endif

#endif /* EMBEDCACHE_C_API_H */
