#pragma once

#include <filesystem>
#include <string_view>

namespace benchgen {

  enum class platform_target { windows, unix_like };

  constexpr platform_target
  host_platform() noexcept {
#if defined(_WIN32)
    return platform_target::windows;
#elif defined(__unix__) || defined(__APPLE__)
    return platform_target::unix_like;
#else
#error "benchgen: unsupported host platform"
#endif
  }

  // Schema compiler location for each platform, relative to the directory
  // the build runs in.
  std::string_view
  tool_path_for(platform_target target) noexcept;

  std::filesystem::path
  resolve_tool_path();

  std::string_view
  to_string(platform_target target) noexcept;

  platform_target
  parse_platform_target(std::string_view name);

} // namespace benchgen
