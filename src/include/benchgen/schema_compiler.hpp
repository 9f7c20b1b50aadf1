#pragma once

#include <benchgen/process.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace benchgen {

  enum class stale_policy { overwrite_only, clean_before_generate };

  struct schema_dir_options {
    // Overrides the platform's compiled-in compiler location when set.
    std::optional<std::string> tool_path;
    std::string schema_dir = "schemas";
    std::string output_dir = "src/bebops";
    // Empty selects every regular file in schema_dir.
    std::string schema_extension = ".bop";
    std::string language = "cpp";
    std::string artifact_extension = ".hpp";
    stale_policy stale = stale_policy::overwrite_only;
    std::chrono::milliseconds timeout{0};
  };

  struct compiled_schema {
    std::filesystem::path schema;
    std::filesystem::path artifact;
    // Whatever the compiler printed while succeeding.
    std::string output;
  };

  struct schema_dir_result {
    std::vector<compiled_schema> compiled;
    std::vector<std::filesystem::path> removed;
  };

  // Enumerates schema_dir and names the artifact each schema produces,
  // without touching the output directory or spawning anything.
  std::vector<compiled_schema>
  plan_schema_dir(const schema_dir_options& opts);

  // Compiles every schema in opts.schema_dir with the compiler at tool, one
  // process per schema, stopping at the first failure.
  schema_dir_result
  compile_schema_dir(const std::filesystem::path& tool,
                     const schema_dir_options& opts,
                     const process_runner& runner = run_process);

} // namespace benchgen
