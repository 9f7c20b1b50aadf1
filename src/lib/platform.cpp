#include <benchgen/platform.hpp>

#include <benchgen/error.hpp>

#include <array>
#include <string>
#include <utility>

namespace benchgen {

  namespace {

    constexpr std::array<std::pair<platform_target, std::string_view>, 2>
        tool_paths = {{
            {platform_target::windows,
             "../../../bin/compiler/Windows-Debug/bebopc.exe"},
            {platform_target::unix_like,
             "../../../bin/compiler/Linux-Debug/bebopc"},
        }};

  } // namespace

  std::string_view
  tool_path_for(platform_target target) noexcept {
    for (const auto& [t, path] : tool_paths) {
      if (t == target) return path;
    }
    // Unreachable: every enumerator has a table entry.
    return tool_paths.back().second;
  }

  std::filesystem::path
  resolve_tool_path() {
    return std::filesystem::path(std::string(tool_path_for(host_platform())));
  }

  std::string_view
  to_string(platform_target target) noexcept {
    switch (target) {
      case platform_target::windows:
        return "windows";
      case platform_target::unix_like:
        return "unix-like";
    }
    return "unix-like";
  }

  platform_target
  parse_platform_target(std::string_view name) {
    if (name == "windows") return platform_target::windows;
    if (name == "unix-like" || name == "unix" || name == "linux")
      return platform_target::unix_like;
    throw generation_error(error_kind::configuration_error,
                           "unknown platform '" + std::string(name) + "'");
  }

} // namespace benchgen
