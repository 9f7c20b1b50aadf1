#include <benchgen/manifest.hpp>

#include <benchgen/error.hpp>

#include <fstream>

namespace benchgen {

  nlohmann::json
  to_json(const generation_report& report, const build_plan& plan) {
    nlohmann::json artifacts = nlohmann::json::array();
    for (const auto& c : report.compiled.compiled) {
      artifacts.push_back(
          {{"schema", c.schema.string()}, {"artifact", c.artifact.string()}});
    }

    nlohmann::json removed = nlohmann::json::array();
    for (const auto& path : report.compiled.removed)
      removed.push_back(path.string());

    nlohmann::json inputs = nlohmann::json::array();
    for (const auto& input : report.generated.inputs)
      inputs.push_back(input.string());

    return {
        {"platform", std::string(to_string(report.platform))},
        {"tool", report.tool_path.string()},
        {"compiler",
         {{"schema-dir", plan.compiler.schema_dir},
          {"output-dir", plan.compiler.output_dir},
          {"artifacts", artifacts},
          {"removed", removed}}},
        {"codegen",
         {{"output-dir", report.generated.output_dir.string()},
          {"inputs", inputs}}},
    };
  }

  void
  write_manifest(const std::filesystem::path& path,
                 const generation_report& report, const build_plan& plan,
                 const std::string& generated_at) {
    auto doc = to_json(report, plan);
    doc["generated"] = generated_at;

    std::ofstream out(path);
    if (!out)
      throw generation_error(error_kind::io_error, path.string(),
                             "cannot write manifest");
    out << doc.dump(2) << "\n";
    if (!out)
      throw generation_error(error_kind::io_error, path.string(),
                             "cannot write manifest");
  }

} // namespace benchgen
