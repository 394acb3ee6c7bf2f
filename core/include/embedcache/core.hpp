#pragma once

#include <string>
#include <string_view>

namespace embedcache::core {

struct BuildInfo {
  std::string compiler;
  std::string architecture;
  std::string simd_kernel;
  std::string standard;
};

/**
 * @brief Returns the version of the embedcache engine.
 */
std::string_view version() noexcept;

/**
 * @brief Returns build-time information about the library.
 */
BuildInfo get_build_info();

} // namespace embedcache::core
