/**
 * @file EmbedCacheClient.hpp
 * @brief Header-only, exception-free C++ wrapper over the embedcache C ABI.
 *
 * HOST CONSTRAINTS:
 *   1. Usable with exceptions disabled (-fno-exceptions). Every call returns
 *      embedcache_error_t and stores it in LastError.
 *   2. Buffers handed out by the engine are wrapped in move-only owners
 *      (FEmbedVector, FEmbedString) that release them exactly once.
 *   3. Serverless hosts that keep a process warm between invocations use
 *      FEmbedCacheRegistry to reuse an open handle by name instead of
 *      reopening (and re-indexing) the store on every call.
 *
 * USAGE:
 *   FEmbedCacheClient Cache;
 *   if (Cache.Open("embeddings.cache", 1536)) {
 *     FEmbedVector Vec;
 *     Cache.GetOrCompute("hello", [] { return Embed("hello"); }, Vec);
 *   }
 *
 *   // Warm-container reuse:
 *   int32_t Handle = FEmbedCacheRegistry::Get().Acquire("default",
 *                                                       "/tmp/emb.cache",
 *                                                       1536);
 *   FEmbedCacheClient Borrowed = FEmbedCacheClient::Borrow(Handle);
 */

#pragma once

#include "embedcache/embedcache_c_api.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Owned buffers
// ============================================================================

/// Owns a float buffer returned by embedcache_get / embedcache_find_similar.
class FEmbedVector {
public:
  FEmbedVector() = default;
  ~FEmbedVector() { Reset(); }

  FEmbedVector(const FEmbedVector &) = delete;
  FEmbedVector &operator=(const FEmbedVector &) = delete;

  FEmbedVector(FEmbedVector &&Other) noexcept
      : Data(Other.Data), Length(Other.Length) {
    Other.Data = nullptr;
    Other.Length = 0;
  }

  FEmbedVector &operator=(FEmbedVector &&Other) noexcept {
    if (this != &Other) {
      Reset();
      Data = Other.Data;
      Length = Other.Length;
      Other.Data = nullptr;
      Other.Length = 0;
    }
    return *this;
  }

  void Reset() {
    if (Data) {
      embedcache_free_vector(Data);
      Data = nullptr;
    }
    Length = 0;
  }

  const float *GetData() const { return Data; }
  size_t Num() const { return Length; }
  bool IsEmpty() const { return Data == nullptr; }
  float operator[](size_t I) const { return Data[I]; }

private:
  friend class FEmbedCacheClient;
  float *Data = nullptr;
  size_t Length = 0;
};

/// Owns a NUL-terminated string returned by the engine.
class FEmbedString {
public:
  FEmbedString() = default;
  ~FEmbedString() { Reset(); }

  FEmbedString(const FEmbedString &) = delete;
  FEmbedString &operator=(const FEmbedString &) = delete;

  FEmbedString(FEmbedString &&Other) noexcept
      : Data(Other.Data), Length(Other.Length) {
    Other.Data = nullptr;
    Other.Length = 0;
  }

  FEmbedString &operator=(FEmbedString &&Other) noexcept {
    if (this != &Other) {
      Reset();
      Data = Other.Data;
      Length = Other.Length;
      Other.Data = nullptr;
      Other.Length = 0;
    }
    return *this;
  }

  void Reset() {
    if (Data) {
      embedcache_free_string(Data);
      Data = nullptr;
    }
    Length = 0;
  }

  const char *CStr() const { return Data ? Data : ""; }
  std::string_view View() const {
    return Data ? std::string_view(Data, Length) : std::string_view();
  }

private:
  friend class FEmbedCacheClient;
  char *Data = nullptr;
  size_t Length = 0;
};

// ============================================================================
// FEmbedCacheClient: one store handle
// ============================================================================

class FEmbedCacheClient {
public:
  FEmbedCacheClient() = default;
  ~FEmbedCacheClient() { Close(); }

  FEmbedCacheClient(const FEmbedCacheClient &) = delete;
  FEmbedCacheClient &operator=(const FEmbedCacheClient &) = delete;

  FEmbedCacheClient(FEmbedCacheClient &&Other) noexcept
      : Handle(Other.Handle), bOwnsHandle(Other.bOwnsHandle),
        LastError(Other.LastError) {
    Other.Handle = 0;
    Other.bOwnsHandle = false;
  }

  FEmbedCacheClient &operator=(FEmbedCacheClient &&Other) noexcept {
    if (this != &Other) {
      Close();
      Handle = Other.Handle;
      bOwnsHandle = Other.bOwnsHandle;
      LastError = Other.LastError;
      Other.Handle = 0;
      Other.bOwnsHandle = false;
    }
    return *this;
  }

  /// Wraps a handle owned elsewhere (e.g. FEmbedCacheRegistry). Close() on
  /// the returned client only forgets the handle.
  static FEmbedCacheClient Borrow(int32_t BorrowedHandle) {
    FEmbedCacheClient Client;
    Client.Handle = BorrowedHandle > 0 ? BorrowedHandle : 0;
    Client.bOwnsHandle = false;
    return Client;
  }

  // -----------------------------------------------------------------
  // Lifecycle
  // -----------------------------------------------------------------

  bool Open(const char *Path, uint32_t Dim) {
    Close();
    int32_t Result = embedcache_open(Path, Dim);
    if (Result < 0) {
      LastError = static_cast<embedcache_error_t>(Result);
      return false;
    }
    Handle = Result;
    bOwnsHandle = true;
    LastError = EMBEDCACHE_OK;
    return true;
  }

  bool Open(const char *Path, const embedcache_options_t &Options) {
    Close();
    int32_t NewHandle = 0;
    LastError = embedcache_open_ex(Path, &Options, &NewHandle);
    if (LastError != EMBEDCACHE_OK)
      return false;
    Handle = NewHandle;
    bOwnsHandle = true;
    return true;
  }

  /// Closes an owned handle; a borrowed one is only released.
  embedcache_error_t Close() {
    embedcache_error_t Err = EMBEDCACHE_OK;
    if (Handle > 0 && bOwnsHandle)
      Err = embedcache_close(Handle);
    Handle = 0;
    bOwnsHandle = false;
    return Err;
  }

  bool IsOpen() const { return Handle > 0; }
  int32_t GetHandle() const { return Handle; }

  // -----------------------------------------------------------------
  // Data
  // -----------------------------------------------------------------

  embedcache_error_t Insert(std::string_view Key, const float *Vector,
                            size_t Len) {
    if (!IsOpen())
      return LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
    LastError = embedcache_insert(Handle, Key.data(), Key.size(), Vector, Len);
    return LastError;
  }

  /// EMBEDCACHE_ERR_NOT_FOUND on a miss; OutVector is left empty.
  embedcache_error_t Get(std::string_view Key, FEmbedVector &OutVector) {
    OutVector.Reset();
    if (!IsOpen())
      return LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
    LastError = embedcache_get(Handle, Key.data(), Key.size(), &OutVector.Data,
                               &OutVector.Length);
    return LastError;
  }

  bool Contains(std::string_view Key) {
    if (!IsOpen()) {
      LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
      return false;
    }
    int Found = 0;
    LastError = embedcache_contains(Handle, Key.data(), Key.size(), &Found);
    return LastError == EMBEDCACHE_OK && Found != 0;
  }

  /**
   * Get, and on a miss call Compute() (returning std::vector<float>), store
   * its result and hand it back through OutVector. Compute runs only on a
   * miss; a result of the wrong length fails with
   * EMBEDCACHE_ERR_DIMENSION_MISMATCH and nothing is stored.
   */
  template <typename ComputeFn>
  embedcache_error_t GetOrCompute(std::string_view Key, ComputeFn &&Compute,
                                  FEmbedVector &OutVector) {
    if (Get(Key, OutVector) != EMBEDCACHE_ERR_NOT_FOUND)
      return LastError;
    const std::vector<float> Computed = Compute();
    if (Insert(Key, Computed.data(), Computed.size()) != EMBEDCACHE_OK)
      return LastError;
    return Get(Key, OutVector);
  }

  embedcache_error_t FindSimilar(const float *Query, size_t Len,
                                 float Threshold, FEmbedVector &OutVector,
                                 float &OutScore,
                                 FEmbedString *OutKey = nullptr) {
    OutVector.Reset();
    if (OutKey)
      OutKey->Reset();
    if (!IsOpen())
      return LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
    LastError = embedcache_find_similar(
        Handle, Query, Len, Threshold, &OutVector.Data, &OutVector.Length,
        &OutScore, OutKey ? &OutKey->Data : nullptr,
        OutKey ? &OutKey->Length : nullptr);
    return LastError;
  }

  // -----------------------------------------------------------------
  // Inspection
  // -----------------------------------------------------------------

  embedcache_error_t GetStatsJson(FEmbedString &OutJson) {
    OutJson.Reset();
    if (!IsOpen())
      return LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
    LastError = embedcache_get_stats(Handle, &OutJson.Data);
    if (LastError == EMBEDCACHE_OK)
      OutJson.Length = std::char_traits<char>::length(OutJson.Data);
    return LastError;
  }

  embedcache_error_t GetStats(embedcache_stats_t &OutStats) {
    if (!IsOpen())
      return LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
    LastError = embedcache_get_stats_struct(Handle, &OutStats);
    return LastError;
  }

  embedcache_error_t GetDim(uint32_t &OutDim) {
    if (!IsOpen())
      return LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
    LastError = embedcache_get_dim(Handle, &OutDim);
    return LastError;
  }

  embedcache_error_t Flush() {
    if (!IsOpen())
      return LastError = EMBEDCACHE_ERR_INVALID_HANDLE;
    LastError = embedcache_flush(Handle);
    return LastError;
  }

  /// Result of the most recent call on this client.
  embedcache_error_t GetLastError() const { return LastError; }

private:
  int32_t Handle = 0;
  bool bOwnsHandle = false;
  embedcache_error_t LastError = EMBEDCACHE_OK;
};

// ============================================================================
// FEmbedCacheRegistry: named handle reuse across warm invocations
// ============================================================================

/**
 * Process-wide map from a caller-chosen name to an open handle.
 *
 * Acquire() returns the cached handle if it is still live (checked with
 * embedcache_get_dim and the recorded dimension); otherwise it opens the
 * path and records the new handle. Handles stay open until Release().
 */
class FEmbedCacheRegistry {
public:
  static FEmbedCacheRegistry &Get() {
    static FEmbedCacheRegistry Instance;
    return Instance;
  }

  /// Positive handle, or a negative embedcache_error_t.
  int32_t Acquire(const std::string &Name, const char *Path, uint32_t Dim) {
    if (!Path)
      return EMBEDCACHE_ERR_NULL_PTR;
    std::lock_guard<std::mutex> Lock(Mutex);

    auto It = Entries.find(Name);
    if (It != Entries.end()) {
      uint32_t LiveDim = 0;
      if (embedcache_get_dim(It->second.Handle, &LiveDim) == EMBEDCACHE_OK &&
          LiveDim == Dim && It->second.Path == Path)
        return It->second.Handle;
      // Stale or reconfigured: drop it and fall through to a fresh open.
      embedcache_close(It->second.Handle);
      Entries.erase(It);
    }

    int32_t Handle = embedcache_open(Path, Dim);
    if (Handle > 0)
      Entries[Name] = FEntry{Handle, Path};
    return Handle;
  }

  /// Closes and forgets the handle registered under Name.
  embedcache_error_t Release(const std::string &Name) {
    std::lock_guard<std::mutex> Lock(Mutex);
    auto It = Entries.find(Name);
    if (It == Entries.end())
      return EMBEDCACHE_ERR_NOT_FOUND;
    embedcache_error_t Err = embedcache_close(It->second.Handle);
    Entries.erase(It);
    return Err;
  }

  /// Closes every registered handle.
  void ReleaseAll() {
    std::lock_guard<std::mutex> Lock(Mutex);
    for (auto &Entry : Entries)
      embedcache_close(Entry.second.Handle);
    Entries.clear();
  }

  size_t Num() const {
    std::lock_guard<std::mutex> Lock(Mutex);
    return Entries.size();
  }

private:
  struct FEntry {
    int32_t Handle;
    std::string Path;
  };

  FEmbedCacheRegistry() = default;

  mutable std::mutex Mutex;
  std::map<std::string, FEntry> Entries;
};
