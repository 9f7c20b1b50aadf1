#include "benchgen_main.hpp"

#include <benchgen/build_plan.hpp>
#include <benchgen/error.hpp>
#include <benchgen/manifest.hpp>
#include <benchgen/orchestrator.hpp>
#include <benchgen/platform.hpp>
#include <benchgen/schema_compiler.hpp>

#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace benchgen_cli {

  namespace {

    // -------------------------------------------------------------------------
    // Shared utilities
    // -------------------------------------------------------------------------

    int
    exit_code_for(benchgen::error_kind kind) {
      switch (kind) {
        case benchgen::error_kind::tool_not_found:
          return exit_tool;
        case benchgen::error_kind::compilation_failed:
          return exit_compile;
        case benchgen::error_kind::codegen_failed:
          return exit_codegen;
        case benchgen::error_kind::configuration_error:
          return exit_usage;
        case benchgen::error_kind::io_error:
          return exit_io;
      }
      return exit_usage;
    }

    int
    report_error(const benchgen::generation_error& e) {
      std::cerr << "benchgen: " << e.what() << "\n";
      return exit_code_for(e.kind());
    }

    // Prints a tool's output under a header line, indented.
    void
    print_tool_output(const std::string& header, const std::string& output) {
      if (output.empty()) return;
      std::cerr << "benchgen: " << header << ":\n";
      std::istringstream lines(output);
      std::string line;
      while (std::getline(lines, line))
        std::cerr << "  " << line << "\n";
    }

    std::string
    utc_timestamp() {
      auto now = std::chrono::system_clock::now();
      auto t = std::chrono::system_clock::to_time_t(now);
      char time_buf[32];
      std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%SZ",
                    std::gmtime(&t));
      return time_buf;
    }

    // -------------------------------------------------------------------------
    // Plan assembly: defaults, then the plan file, then command-line options
    // -------------------------------------------------------------------------

    benchgen::build_plan
    make_plan(const nlohmann::json& config) {
      std::string plan_file = config.value("plan", "");
      benchgen::build_plan plan = plan_file.empty()
                                      ? benchgen::default_build_plan()
                                      : benchgen::read_build_plan(plan_file);

      if (config.contains("compiler"))
        plan.compiler.tool_path = config["compiler"].get<std::string>();

      plan.compiler.schema_dir =
          config.value("schema-dir", plan.compiler.schema_dir);
      plan.compiler.output_dir =
          config.value("out-dir", plan.compiler.output_dir);
      plan.compiler.schema_extension =
          config.value("schema-ext", plan.compiler.schema_extension);
      plan.compiler.language = config.value("lang", plan.compiler.language);
      plan.compiler.artifact_extension =
          config.value("artifact-ext", plan.compiler.artifact_extension);
      if (config.value("clean", false))
        plan.compiler.stale = benchgen::stale_policy::clean_before_generate;

      plan.generator.program = config.value("protoc", plan.generator.program);
      plan.generator.output_flag =
          config.value("proto-out-flag", plan.generator.output_flag);
      plan.codegen.output_dir =
          config.value("proto-out", plan.codegen.output_dir);
      if (config.contains("proto"))
        plan.codegen.inputs = config["proto"].get<std::vector<std::string>>();
      if (config.contains("include"))
        plan.codegen.includes =
            config["include"].get<std::vector<std::string>>();

      if (config.value("parallel", false)) plan.parallel = true;
      if (config.contains("timeout"))
        plan.set_timeout(
            std::chrono::milliseconds(config["timeout"].get<long long>()));

      return plan;
    }

    // -------------------------------------------------------------------------
    // --platform
    // -------------------------------------------------------------------------

    int
    run_platform(const benchgen::build_plan& plan,
                 const nlohmann::json& config) {
      auto target = config.contains("target")
                        ? benchgen::parse_platform_target(
                              config["target"].get<std::string>())
                        : benchgen::host_platform();

      std::cout << "platform: " << benchgen::to_string(target) << "\n";
      std::cout << "compiler: "
                << (plan.compiler.tool_path
                        ? *plan.compiler.tool_path
                        : std::string(benchgen::tool_path_for(target)))
                << "\n";
      return exit_success;
    }

    // -------------------------------------------------------------------------
    // --list-outputs
    // -------------------------------------------------------------------------

    int
    run_list_outputs(const benchgen::build_plan& plan) {
      for (const auto& c : benchgen::plan_schema_dir(plan.compiler))
        std::cout << c.artifact.string() << "\n";
      for (const auto& input : plan.codegen.inputs)
        std::cout << plan.codegen.output_dir << " <- " << input << "\n";
      return exit_success;
    }

    // -------------------------------------------------------------------------
    // generate (default command)
    // -------------------------------------------------------------------------

    int
    run_generate(const benchgen::build_plan& plan, const nlohmann::json& config) {
      bool verbose = config.value("verbose", false);
      std::string manifest_file = config.value("manifest", "");

      benchgen::orchestrator orch(plan);
      if (verbose) {
        orch.on_transition([](benchgen::orchestrator_state from,
                              benchgen::orchestrator_state to) {
          std::cerr << "benchgen: " << benchgen::to_string(from) << " -> "
                    << benchgen::to_string(to) << "\n";
        });
      }

      auto report = orch.run();

      if (verbose) {
        std::cerr << "benchgen: schema compiler: " << report.tool_path.string()
                  << " (" << benchgen::to_string(report.platform) << ")\n";
        for (const auto& path : report.compiled.removed)
          std::cerr << "benchgen: removed stale " << path.string() << "\n";
        for (const auto& c : report.compiled.compiled) {
          std::cerr << "benchgen: " << c.schema.string() << " -> "
                    << c.artifact.string() << "\n";
          print_tool_output(c.schema.string(), c.output);
        }
        print_tool_output(plan.generator.program, report.generated.output);
      }

      if (!manifest_file.empty()) {
        benchgen::write_manifest(manifest_file, report, plan, utc_timestamp());
        if (verbose)
          std::cerr << "benchgen: manifest: " << manifest_file << "\n";
      }

      std::cerr << "benchgen: generated " << report.compiled.compiled.size()
                << " artifact(s) in " << plan.compiler.output_dir << "; "
                << report.generated.inputs.size() << " input(s) in "
                << report.generated.output_dir.string() << "\n";
      return exit_success;
    }

  } // anonymous namespace

  // ---------------------------------------------------------------------------
  // Public entry point: dispatches on the command-line flags
  // ---------------------------------------------------------------------------

  int
  run(const nlohmann::json& config) {
    try {
      auto plan = make_plan(config);
      if (config.value("platform", false)) return run_platform(plan, config);
      if (config.value("list-outputs", false)) return run_list_outputs(plan);
      return run_generate(plan, config);
    } catch (const benchgen::generation_error& e) {
      return report_error(e);
    }
  }

} // namespace benchgen_cli
