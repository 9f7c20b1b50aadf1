#include <benchgen/error.hpp>
#include <benchgen/platform.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace benchgen;

// ---------------------------------------------------------------------------
// tool_path_for
// ---------------------------------------------------------------------------

TEST_CASE("tool_path_for: windows maps to the Windows bebopc build",
          "[platform]") {
  CHECK(tool_path_for(platform_target::windows) ==
        "../../../bin/compiler/Windows-Debug/bebopc.exe");
}

TEST_CASE("tool_path_for: unix-like maps to the Linux bebopc build",
          "[platform]") {
  CHECK(tool_path_for(platform_target::unix_like) ==
        "../../../bin/compiler/Linux-Debug/bebopc");
}

TEST_CASE("tool_path_for: every platform has a non-empty path",
          "[platform]") {
  for (auto target : {platform_target::windows, platform_target::unix_like}) {
    SECTION(std::string(to_string(target))) {
      CHECK_FALSE(tool_path_for(target).empty());
    }
  }
}

TEST_CASE("tool_path_for: only the windows path carries .exe", "[platform]") {
  auto win = std::string(tool_path_for(platform_target::windows));
  auto nix = std::string(tool_path_for(platform_target::unix_like));
  CHECK(win.ends_with(".exe"));
  CHECK_FALSE(nix.ends_with(".exe"));
}

TEST_CASE("tool_path_for: repeated lookups agree", "[platform]") {
  for (auto target : {platform_target::windows, platform_target::unix_like})
    CHECK(tool_path_for(target) == tool_path_for(target));
}

// ---------------------------------------------------------------------------
// host platform and resolution
// ---------------------------------------------------------------------------

TEST_CASE("host_platform matches the compilation target", "[platform]") {
#ifdef _WIN32
  CHECK(host_platform() == platform_target::windows);
#else
  CHECK(host_platform() == platform_target::unix_like);
#endif
}

TEST_CASE("host_platform is usable in constant expressions", "[platform]") {
  constexpr auto target = host_platform();
  STATIC_CHECK((target == platform_target::windows ||
                target == platform_target::unix_like));
}

TEST_CASE("resolve_tool_path returns the host platform's entry",
          "[platform]") {
  CHECK(resolve_tool_path().string() ==
        std::string(tool_path_for(host_platform())));
}

// ---------------------------------------------------------------------------
// names
// ---------------------------------------------------------------------------

TEST_CASE("platform names round-trip", "[platform]") {
  CHECK(parse_platform_target(to_string(platform_target::windows)) ==
        platform_target::windows);
  CHECK(parse_platform_target(to_string(platform_target::unix_like)) ==
        platform_target::unix_like);
}

TEST_CASE("parse_platform_target accepts unix aliases", "[platform]") {
  CHECK(parse_platform_target("unix") == platform_target::unix_like);
  CHECK(parse_platform_target("linux") == platform_target::unix_like);
}

TEST_CASE("parse_platform_target rejects unknown names", "[platform]") {
  try {
    parse_platform_target("beos");
    FAIL("expected generation_error");
  } catch (const generation_error& e) {
    CHECK(e.kind() == error_kind::configuration_error);
    CHECK(e.subject().find("beos") != std::string::npos);
  }
}
