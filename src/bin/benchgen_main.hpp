#pragma once

#include <nlohmann/json.hpp>

namespace benchgen_cli {

  constexpr int exit_success = 0;
  constexpr int exit_usage = 1;
  constexpr int exit_io = 2;
  constexpr int exit_compile = 3;
  constexpr int exit_codegen = 4;
  constexpr int exit_tool = 5;

  // Runs the command described by config, as produced from the command line
  // by main(). Returns the process exit status.
  int
  run(const nlohmann::json& config);

} // namespace benchgen_cli
