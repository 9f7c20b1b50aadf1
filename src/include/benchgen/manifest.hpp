#pragma once

#include <benchgen/orchestrator.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace benchgen {

  nlohmann::json
  to_json(const generation_report& report, const build_plan& plan);

  // Writes the report as indented JSON, stamped with generated_at.
  void
  write_manifest(const std::filesystem::path& path,
                 const generation_report& report, const build_plan& plan,
                 const std::string& generated_at);

} // namespace benchgen
