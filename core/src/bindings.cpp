#include "embedcache/core.hpp"
#include "embedcache/store.hpp"
#include <nanobind/nanobind.h>
#include <nanobind/stl/filesystem.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/unique_ptr.h>
#include <nanobind/stl/vector.h>

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace {

/// Engine errors surface as Python exceptions; misses stay None.
[[noreturn]] void throw_error(embedcache::Error e, const char *op) {
  std::string msg =
      std::string(op) + ": " + std::string(embedcache::to_string(e));
  switch (e) {
  case embedcache::Error::DimensionMismatch:
  case embedcache::Error::InvalidArgument:
    throw std::invalid_argument(msg);
  default:
    throw std::runtime_error(msg);
  }
}

void check_dim(const embedcache::Store &self, size_t n) {
  if (n != self.dim())
    throw std::invalid_argument("Vector dim mismatch (expected " +
                                std::to_string(self.dim()) + ", got " +
                                std::to_string(n) + ")");
}

} // namespace

NB_MODULE(embedcache_py, m) {
  m.doc() = "embedcache: file-backed embedding cache (C++23 core)";

  // --- Core Utils ---
  m.def("version", &embedcache::core::version, "Get the library version");

  nb::class_<embedcache::core::BuildInfo>(m, "BuildInfo")
      .def_ro("compiler", &embedcache::core::BuildInfo::compiler)
      .def_ro("architecture", &embedcache::core::BuildInfo::architecture)
      .def_ro("simd_kernel", &embedcache::core::BuildInfo::simd_kernel)
      .def_ro("standard", &embedcache::core::BuildInfo::standard)
      .def("__repr__", [](const embedcache::core::BuildInfo &b) {
        return "<BuildInfo arch='" + b.architecture + "' simd='" +
               b.simd_kernel + "' compiler='" + b.compiler + "'>";
      });

  m.def("get_build_info", &embedcache::core::get_build_info,
        "Get build environment details");

  // --- Store ---

  nb::class_<embedcache::Store>(m, "Store")
      .def_static(
          "open",
          [](const std::filesystem::path &path, uint32_t dimension,
             size_t cache_size, bool persist_snapshot) {
            embedcache::StoreOptions opts;
            opts.dim = dimension;
            opts.cache_capacity = cache_size;
            opts.persist_snapshot = persist_snapshot;
            embedcache::Result<std::unique_ptr<embedcache::Store>> store;
            {
              nb::gil_scoped_release release;
              store = embedcache::Store::open(path, opts);
            }
            if (!store)
              throw_error(store.error(), "open");
            return std::move(*store);
          },
          "path"_a, "dimension"_a = 1536,
          "cache_size"_a = embedcache::CACHE_CAPACITY_DEFAULT,
          "persist_snapshot"_a = true,
          "Open or create a cache file. Recovers the index from the log if "
          "the snapshot is missing or stale.")

      .def_prop_ro("dimension", &embedcache::Store::dim)
      .def_prop_ro("path", &embedcache::Store::path)
      .def_prop_ro("closed",
                   [](const embedcache::Store &self) { return !self.is_open(); })

      .def(
          "set",
          [](embedcache::Store &self, std::string_view key,
             const std::vector<float> &vec) {
            check_dim(self, vec.size());
            embedcache::Result<void> r;
            {
              nb::gil_scoped_release release;
              r = self.insert(key, std::span<const float>(vec));
            }
            if (!r)
              throw_error(r.error(), "set");
          },
          "key"_a, "vector"_a, "Store a vector under key")

      .def(
          "get",
          [](embedcache::Store &self, std::string_view key) {
            embedcache::Result<std::optional<std::vector<float>>> r;
            {
              nb::gil_scoped_release release;
              r = self.get(key);
            }
            if (!r)
              throw_error(r.error(), "get");
            return std::move(*r);
          },
          "key"_a, "Latest vector for key, or None")

      .def(
          "get_or_compute",
          [](embedcache::Store &self, std::string_view key,
             nb::callable compute_fn) {
            embedcache::Result<std::optional<std::vector<float>>> cached;
            {
              nb::gil_scoped_release release;
              cached = self.get(key);
            }
            if (!cached)
              throw_error(cached.error(), "get_or_compute");
            if (cached->has_value())
              return std::move(**cached);

            auto vec = nb::cast<std::vector<float>>(compute_fn());
            check_dim(self, vec.size());
            embedcache::Result<void> r;
            {
              nb::gil_scoped_release release;
              r = self.insert(key, std::span<const float>(vec));
            }
            if (!r)
              throw_error(r.error(), "get_or_compute");
            return vec;
          },
          "key"_a, "compute_fn"_a,
          "Cached vector for key; on a miss, store and return compute_fn()")

      .def(
          "__contains__",
          [](embedcache::Store &self, std::string_view key) {
            auto r = self.contains(key);
            if (!r)
              throw_error(r.error(), "contains");
            return *r;
          },
          "key"_a)

      .def(
          "find_similar",
          [](embedcache::Store &self, const std::vector<float> &query,
             float threshold) -> nb::object {
            check_dim(self, query.size());
            embedcache::Result<std::optional<embedcache::Match>> r;
            {
              nb::gil_scoped_release release;
              r = self.find_similar(std::span<const float>(query), threshold);
            }
            if (!r)
              throw_error(r.error(), "find_similar");
            if (!r->has_value())
              return nb::none();
            auto &match = **r;
            return nb::make_tuple(match.key, match.vector, match.score);
          },
          "vector"_a, "threshold"_a,
          "Best (key, vector, score) at or above threshold, or None")

      .def(
          "stats",
          [](const embedcache::Store &self) {
            auto r = self.stats();
            if (!r)
              throw_error(r.error(), "stats");
            nb::dict d;
            d["records"] = r->records;
            d["dimension"] = r->dimension;
            d["file_size"] = r->file_size;
            d["index_size"] = r->index_size;
            d["cache_size"] = r->cache_size;
            d["cache_capacity"] = r->cache_capacity;
            d["index_memory_bytes"] = r->index_memory_bytes;
            d["cache_memory_bytes"] = r->cache_memory_bytes;
            d["memory_usage_bytes"] = r->memory_usage_bytes;
            return d;
          },
          "Store figures as a dict")

      .def(
          "flush",
          [](embedcache::Store &self) {
            embedcache::Result<void> r;
            {
              nb::gil_scoped_release release;
              r = self.flush();
            }
            if (!r)
              throw_error(r.error(), "flush");
          },
          "Persist the index snapshot and sync the log")

      .def(
          "close",
          [](embedcache::Store &self) {
            if (!self.is_open())
              return; // idempotent from Python
            embedcache::Result<void> r;
            {
              nb::gil_scoped_release release;
              r = self.close();
            }
            if (!r)
              throw_error(r.error(), "close");
          },
          "Persist the snapshot and release the file")

      .def("__enter__", [](nb::object self) -> nb::object { return self; })
      .def("__exit__", [](embedcache::Store &self, nb::args) {
        if (self.is_open()) {
          if (auto r = self.close(); !r)
            throw_error(r.error(), "close");
        }
      });
}
