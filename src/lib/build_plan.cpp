#include <benchgen/build_plan.hpp>

#include <benchgen/error.hpp>
#include <benchgen/process.hpp>

#include <fstream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace benchgen {

  namespace {

    const std::set<std::string> top_level_keys = {"compiler", "codegen",
                                                  "parallel", "timeout-ms"};

    const std::set<std::string> compiler_keys = {
        "tool",     "schema-dir",         "output-dir", "schema-extension",
        "language", "artifact-extension", "clean"};

    const std::set<std::string> codegen_keys = {
        "program", "output-flag", "output-dir", "inputs", "include"};

    [[noreturn]] void
    config_error(const std::string& what) {
      throw generation_error(error_kind::configuration_error, "build plan",
                             what);
    }

    void
    check_keys(const nlohmann::json& section,
               const std::set<std::string>& known, const std::string& where) {
      if (!section.is_object()) config_error(where + " must be an object");
      for (const auto& item : section.items()) {
        if (known.find(item.key()) == known.end())
          config_error("unknown key '" + item.key() + "' in " + where);
      }
    }

    void
    read_string(const nlohmann::json& section, const char* key,
                std::string& out) {
      if (!section.contains(key)) return;
      const auto& value = section[key];
      if (!value.is_string())
        config_error(std::string("'") + key + "' must be a string");
      out = value.get<std::string>();
    }

    void
    read_string_list(const nlohmann::json& section, const char* key,
                     std::vector<std::string>& out) {
      if (!section.contains(key)) return;
      const auto& value = section[key];
      if (!value.is_array())
        config_error(std::string("'") + key + "' must be an array of strings");

      std::vector<std::string> items;
      for (const auto& item : value) {
        if (!item.is_string())
          config_error(std::string("'") + key +
                       "' must be an array of strings");
        items.push_back(item.get<std::string>());
      }
      out = std::move(items);
    }

    void
    read_bool(const nlohmann::json& section, const char* key, bool& out) {
      if (!section.contains(key)) return;
      const auto& value = section[key];
      if (!value.is_boolean())
        config_error(std::string("'") + key + "' must be a boolean");
      out = value.get<bool>();
    }

    void
    rebase(std::string& path, const fs::path& base) {
      if (path.empty()) return;
      fs::path p(path);
      if (p.is_relative()) path = (base / p).lexically_normal().string();
    }

    // Bare program names are looked up on PATH and stay as they are.
    void
    rebase_program(std::string& program, const fs::path& base) {
      if (fs::path(program).has_parent_path()) rebase(program, base);
    }

  } // namespace

  build_plan
  default_build_plan() {
    build_plan plan;
    plan.codegen.out_dir("src/protos")
        .input("schemas/jazz.proto")
        .include("schemas");
    return plan;
  }

  build_plan
  load_build_plan(const nlohmann::json& config, build_plan base) {
    check_keys(config, top_level_keys, "the build plan");

    if (config.contains("compiler")) {
      const auto& c = config["compiler"];
      check_keys(c, compiler_keys, "'compiler'");

      if (c.contains("tool")) {
        std::string tool;
        read_string(c, "tool", tool);
        base.compiler.tool_path = std::move(tool);
      }
      read_string(c, "schema-dir", base.compiler.schema_dir);
      read_string(c, "output-dir", base.compiler.output_dir);
      read_string(c, "schema-extension", base.compiler.schema_extension);
      read_string(c, "language", base.compiler.language);
      read_string(c, "artifact-extension", base.compiler.artifact_extension);

      bool clean = base.compiler.stale == stale_policy::clean_before_generate;
      read_bool(c, "clean", clean);
      base.compiler.stale = clean ? stale_policy::clean_before_generate
                                  : stale_policy::overwrite_only;
    }

    if (config.contains("codegen")) {
      const auto& g = config["codegen"];
      check_keys(g, codegen_keys, "'codegen'");

      read_string(g, "program", base.generator.program);
      read_string(g, "output-flag", base.generator.output_flag);
      read_string(g, "output-dir", base.codegen.output_dir);
      read_string_list(g, "inputs", base.codegen.inputs);
      read_string_list(g, "include", base.codegen.includes);
    }

    read_bool(config, "parallel", base.parallel);

    if (config.contains("timeout-ms")) {
      const auto& t = config["timeout-ms"];
      if (!t.is_number_integer())
        config_error("'timeout-ms' must be a non-negative integer");

      const auto limit = max_process_timeout.count();
      bool in_range = t.is_number_unsigned()
                          ? t.get<unsigned long long>() <=
                                static_cast<unsigned long long>(limit)
                          : t.get<long long>() >= 0 &&
                                t.get<long long>() <= limit;
      if (!in_range)
        config_error("'timeout-ms' must be between 0 and " +
                     std::to_string(limit));
      base.set_timeout(std::chrono::milliseconds(t.get<long long>()));
    }

    return base;
  }

  build_plan
  read_build_plan(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw generation_error(error_kind::io_error, path.string(),
                             "cannot open build plan");

    nlohmann::json config;
    try {
      config = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw generation_error(error_kind::configuration_error, path.string(),
                             e.what());
    }

    build_plan plan = load_build_plan(config);

    // Only the paths the file itself names are relative to the file.
    const fs::path base = path.parent_path();
    if (base.empty()) return plan;

    auto named = [&](const char* section, const char* key) {
      return config.contains(section) && config[section].contains(key);
    };

    if (named("compiler", "tool")) rebase_program(*plan.compiler.tool_path, base);
    if (named("compiler", "schema-dir")) rebase(plan.compiler.schema_dir, base);
    if (named("compiler", "output-dir")) rebase(plan.compiler.output_dir, base);
    if (named("codegen", "program")) rebase_program(plan.generator.program, base);
    if (named("codegen", "output-dir")) rebase(plan.codegen.output_dir, base);
    if (named("codegen", "inputs")) {
      for (auto& input : plan.codegen.inputs)
        rebase(input, base);
    }
    if (named("codegen", "include")) {
      for (auto& dir : plan.codegen.includes)
        rebase(dir, base);
    }

    return plan;
  }

} // namespace benchgen
