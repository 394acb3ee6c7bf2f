/**
 * @file embedcache_c_api.cpp
 * @brief C ABI implementation. Exception-safe boundary.
 *
 * Every extern "C" function runs its body through `guarded()`, which turns
 * any escaping C++ exception into an error code:
 *   bad_alloc → EMBEDCACHE_ERR_OUT_OF_MEMORY, anything else → ..._UNKNOWN.
 *
 * Engine errors (embedcache::Error) map one-to-one onto embedcache_error_t.
 * Every failure also records a message for embedcache_last_error().
 */

#include "embedcache/embedcache_c_api.h"
#include "embedcache/core.hpp"
#include "embedcache/instance_table.hpp"
#include "embedcache/logging.hpp"
#include "embedcache/stats.hpp"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <new>
#include <string>
#include <string_view>

using embedcache::Error;
using embedcache::InstanceTable;

// ===========================================================================
// Internal: error plumbing
// ===========================================================================

namespace {

thread_local std::string g_last_error;

embedcache_error_t to_c_error(Error e) {
  switch (e) {
  case Error::InvalidHandle:
    return EMBEDCACHE_ERR_INVALID_HANDLE;
  case Error::DimensionMismatch:
    return EMBEDCACHE_ERR_DIMENSION_MISMATCH;
  case Error::IOError:
    return EMBEDCACHE_ERR_FILE_IO;
  case Error::Corruption:
    return EMBEDCACHE_ERR_CORRUPTION;
  case Error::InvalidFormat:
    return EMBEDCACHE_ERR_INVALID_FORMAT;
  case Error::InvalidArgument:
    return EMBEDCACHE_ERR_INVALID_ARG;
  case Error::ResourceExhausted:
    return EMBEDCACHE_ERR_OUT_OF_MEMORY;
  }
  return EMBEDCACHE_ERR_UNKNOWN;
}

embedcache_error_t fail(const char *op, embedcache_error_t code,
                        std::string_view detail) {
  g_last_error.assign(op);
  g_last_error += ": ";
  g_last_error += detail;
  return code;
}

embedcache_error_t fail(const char *op, Error e) {
  return fail(op, to_c_error(e), embedcache::to_string(e));
}

template <typename Body>
embedcache_error_t guarded(const char *op, Body &&body) noexcept {
  try {
    return body();
  } catch (const std::bad_alloc &) {
    return fail(op, EMBEDCACHE_ERR_OUT_OF_MEMORY, "out of memory");
  } catch (const std::exception &e) {
    EMBEDCACHE_LOG_ERROR("{} threw: {}", op, e.what());
    return fail(op, EMBEDCACHE_ERR_UNKNOWN, e.what());
  } catch (...) {
    return fail(op, EMBEDCACHE_ERR_UNKNOWN, "unknown exception");
  }
}

/// Copies `n` floats into a malloc'd buffer owned by the caller.
float *copy_out(const float *src, size_t n) {
  auto *dst = static_cast<float *>(std::malloc(n * sizeof(float)));
  if (!dst)
    throw std::bad_alloc();
  std::memcpy(dst, src, n * sizeof(float));
  return dst;
}

/// NUL-terminated malloc'd copy owned by the caller.
char *copy_out(std::string_view s) {
  auto *dst = static_cast<char *>(std::malloc(s.size() + 1));
  if (!dst)
    throw std::bad_alloc();
  if (!s.empty())
    std::memcpy(dst, s.data(), s.size());
  dst[s.size()] = '\0';
  return dst;
}

/// Resolves a key argument; NULL is only valid with key_len == 0.
bool key_arg(const char *key, size_t key_len, std::string_view &out) {
  if (!key && key_len != 0)
    return false;
  out = key ? std::string_view(key, key_len) : std::string_view();
  return true;
}

} // namespace

// ===========================================================================
// Library
// ===========================================================================

extern "C" {

EMBEDCACHE_API const char *embedcache_version(void) {
  return embedcache::core::version().data();
}

EMBEDCACHE_API const char *embedcache_last_error(void) {
  return g_last_error.c_str();
}

EMBEDCACHE_API void embedcache_set_log_level(embedcache_log_level_t level) {
  auto lvl = embedcache::log::Level::Warn;
  switch (level) {
  case EMBEDCACHE_LOG_LEVEL_DEBUG:
    lvl = embedcache::log::Level::Debug;
    break;
  case EMBEDCACHE_LOG_LEVEL_INFO:
    lvl = embedcache::log::Level::Info;
    break;
  case EMBEDCACHE_LOG_LEVEL_WARN:
    lvl = embedcache::log::Level::Warn;
    break;
  case EMBEDCACHE_LOG_LEVEL_ERROR:
    lvl = embedcache::log::Level::Error;
    break;
  case EMBEDCACHE_LOG_LEVEL_OFF:
    lvl = embedcache::log::Level::Off;
    break;
  }
  embedcache::log::Logger::instance().set_level(lvl);
}

EMBEDCACHE_API void embedcache_default_options(embedcache_options_t *opts) {
  if (!opts)
    return;
  opts->dim = 0;
  opts->cache_capacity = EMBEDCACHE_DEFAULT_CACHE_CAPACITY;
  opts->persist_snapshot = 1;
  opts->sync_on_close = 1;
}

// ===========================================================================
// Lifecycle
// ===========================================================================

EMBEDCACHE_API embedcache_error_t embedcache_open_ex(
    const char *path, const embedcache_options_t *opts, int32_t *out_handle) {
  if (!path || !opts || !out_handle)
    return fail("open", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("open", [&]() -> embedcache_error_t {
    embedcache::StoreOptions cpp_opts;
    cpp_opts.dim = opts->dim;
    cpp_opts.cache_capacity = static_cast<size_t>(opts->cache_capacity);
    cpp_opts.persist_snapshot = opts->persist_snapshot != 0;
    cpp_opts.sync_on_close = opts->sync_on_close != 0;

    auto handle =
        InstanceTable::global().open(std::filesystem::path(path), cpp_opts);
    if (!handle)
      return fail("open", handle.error());
    *out_handle = *handle;
    return EMBEDCACHE_OK;
  });
}

EMBEDCACHE_API int32_t embedcache_open(const char *path, uint32_t dim) {
  embedcache_options_t opts;
  embedcache_default_options(&opts);
  opts.dim = dim;

  int32_t handle = 0;
  embedcache_error_t err = embedcache_open_ex(path, &opts, &handle);
  return err == EMBEDCACHE_OK ? handle : static_cast<int32_t>(err);
}

EMBEDCACHE_API embedcache_error_t embedcache_close(int32_t handle) {
  return guarded("close", [&]() -> embedcache_error_t {
    if (auto r = InstanceTable::global().close(handle); !r)
      return fail("close", r.error());
    return EMBEDCACHE_OK;
  });
}

EMBEDCACHE_API embedcache_error_t embedcache_flush(int32_t handle) {
  return guarded("flush", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("flush", store.error());
    if (auto r = (*store)->flush(); !r)
      return fail("flush", r.error());
    return EMBEDCACHE_OK;
  });
}

EMBEDCACHE_API embedcache_error_t embedcache_get_dim(int32_t handle,
                                                     uint32_t *out_dim) {
  if (!out_dim)
    return fail("get_dim", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("get_dim", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("get_dim", store.error());
    if (!(*store)->is_open())
      return fail("get_dim", Error::InvalidHandle);
    *out_dim = (*store)->dim();
    return EMBEDCACHE_OK;
  });
}

// ===========================================================================
// Data
// ===========================================================================

EMBEDCACHE_API embedcache_error_t embedcache_insert(int32_t handle,
                                                   const char *key,
                                                   size_t key_len,
                                                   const float *vector,
                                                   size_t len) {
  std::string_view k;
  if (!key_arg(key, key_len, k) || (!vector && len != 0))
    return fail("insert", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("insert", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("insert", store.error());
    if (auto r = (*store)->insert(k, std::span<const float>(vector, len)); !r)
      return fail("insert", r.error());
    return EMBEDCACHE_OK;
  });
}

EMBEDCACHE_API embedcache_error_t embedcache_get(int32_t handle,
                                                const char *key,
                                                size_t key_len,
                                                float **out_vector,
                                                size_t *out_len) {
  std::string_view k;
  if (!key_arg(key, key_len, k) || !out_vector || !out_len)
    return fail("get", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("get", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("get", store.error());
    auto vec = (*store)->get(k);
    if (!vec)
      return fail("get", vec.error());
    if (!vec->has_value())
      return fail("get", EMBEDCACHE_ERR_NOT_FOUND, "key not found");

    const auto &v = **vec;
    *out_vector = copy_out(v.data(), v.size());
    *out_len = v.size();
    return EMBEDCACHE_OK;
  });
}

EMBEDCACHE_API embedcache_error_t embedcache_contains(int32_t handle,
                                                     const char *key,
                                                     size_t key_len,
                                                     int *out_found) {
  std::string_view k;
  if (!key_arg(key, key_len, k) || !out_found)
    return fail("contains", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("contains", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("contains", store.error());
    auto found = (*store)->contains(k);
    if (!found)
      return fail("contains", found.error());
    *out_found = *found ? 1 : 0;
    return EMBEDCACHE_OK;
  });
}

EMBEDCACHE_API embedcache_error_t embedcache_find_similar(
    int32_t handle, const float *query, size_t len, float threshold,
    float **out_vector, size_t *out_len, float *out_score, char **out_key,
    size_t *out_key_len) {
  if ((!query && len != 0) || !out_vector || !out_len || !out_score)
    return fail("find_similar", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("find_similar", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("find_similar", store.error());
    auto match =
        (*store)->find_similar(std::span<const float>(query, len), threshold);
    if (!match)
      return fail("find_similar", match.error());
    if (!match->has_value())
      return fail("find_similar", EMBEDCACHE_ERR_NOT_FOUND,
                  "no match at or above threshold");

    const auto &m = **match;
    char *key_copy = out_key ? copy_out(m.key) : nullptr;
    float *vec_copy = nullptr;
    try {
      vec_copy = copy_out(m.vector.data(), m.vector.size());
    } catch (...) {
      std::free(key_copy);
      throw;
    }

    *out_vector = vec_copy;
    *out_len = m.vector.size();
    *out_score = m.score;
    if (out_key)
      *out_key = key_copy;
    if (out_key_len)
      *out_key_len = m.key.size();
    return EMBEDCACHE_OK;
  });
}

// ===========================================================================
// Stats
// ===========================================================================

EMBEDCACHE_API embedcache_error_t embedcache_get_stats(int32_t handle,
                                                      char **out_json) {
  if (!out_json)
    return fail("get_stats", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("get_stats", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("get_stats", store.error());
    auto stats = (*store)->stats();
    if (!stats)
      return fail("get_stats", stats.error());
    *out_json = copy_out(embedcache::stats_to_json(*stats));
    return EMBEDCACHE_OK;
  });
}

EMBEDCACHE_API embedcache_error_t
embedcache_get_stats_struct(int32_t handle, embedcache_stats_t *out_stats) {
  if (!out_stats)
    return fail("get_stats_struct", EMBEDCACHE_ERR_NULL_PTR, "null argument");

  return guarded("get_stats_struct", [&]() -> embedcache_error_t {
    auto store = InstanceTable::global().get(handle);
    if (!store)
      return fail("get_stats_struct", store.error());
    auto stats = (*store)->stats();
    if (!stats)
      return fail("get_stats_struct", stats.error());

    out_stats->records = stats->records;
    out_stats->dimension = stats->dimension;
    out_stats->file_size = stats->file_size;
    out_stats->index_size = stats->index_size;
    out_stats->cache_size = stats->cache_size;
    out_stats->cache_capacity = stats->cache_capacity;
    out_stats->index_memory_bytes = stats->index_memory_bytes;
    out_stats->cache_memory_bytes = stats->cache_memory_bytes;
    out_stats->memory_usage_bytes = stats->memory_usage_bytes;
    return EMBEDCACHE_OK;
  });
}

// ===========================================================================
// Ownership
// ===========================================================================

EMBEDCACHE_API void embedcache_free_vector(float *vector) { std::free(vector); }

EMBEDCACHE_API void embedcache_free_string(char *str) { std::free(str); }

} // extern "C"
