#pragma once

#include <benchgen/proto_codegen.hpp>
#include <benchgen/schema_compiler.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>

namespace benchgen {

  struct build_plan {
    schema_dir_options compiler;
    codegen_tool generator;
    codegen_request codegen;
    bool parallel = false;

    // Applies one per-process timeout to both pipelines.
    void
    set_timeout(std::chrono::milliseconds timeout) {
      compiler.timeout = timeout;
      generator.timeout = timeout;
    }
  };

  // The benchmark harness layout: Bebop schemas under schemas/, generated
  // into src/bebops; schemas/jazz.proto generated into src/protos.
  build_plan
  default_build_plan();

  // Applies the keys present in config onto base.
  build_plan
  load_build_plan(const nlohmann::json& config,
                  build_plan base = default_build_plan());

  // Reads a JSON plan file. Relative paths in the file are taken relative to
  // the file's own directory.
  build_plan
  read_build_plan(const std::filesystem::path& path);

} // namespace benchgen
