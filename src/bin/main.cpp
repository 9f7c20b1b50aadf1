#include "benchgen_main.hpp"

#include <benchgen/process.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#ifndef BENCHGEN_VERSION
#define BENCHGEN_VERSION "0.0.0"
#endif

namespace {

  void
  print_usage(std::ostream& os) {
    os << "Usage: benchgen [options]\n"
       << "\n"
       << "Generates the schema sources the serialization benchmarks build "
          "against.\n"
       << "\n"
       << "Options:\n"
       << "  --plan <file>            JSON build plan\n"
       << "  --compiler <path>        Schema compiler (default: platform "
          "build of bebopc)\n"
       << "  --schema-dir <dir>       Schema source directory (default: "
          "schemas)\n"
       << "  --out-dir <dir>          Schema compiler output directory "
          "(default: src/bebops)\n"
       << "  --schema-ext <ext>       Schema file extension (default: .bop)\n"
       << "  --lang <name>            Schema compiler target language "
          "(default: cpp)\n"
       << "  --artifact-ext <ext>     Generated file extension (default: "
          ".hpp)\n"
       << "  --clean                  Remove stale generated files first\n"
       << "  --protoc <path>          Protocol buffer compiler (default: "
          "protoc)\n"
       << "  --proto-out-flag <flag>  Generator output flag (default: "
          "--cpp_out)\n"
       << "  --proto-out <dir>        Generator output directory (default: "
          "src/protos)\n"
       << "  --proto <file>           Generator input (repeatable)\n"
       << "  -I <dir>                 Generator include directory "
          "(repeatable)\n"
       << "  --parallel               Run both generators concurrently\n"
       << "  --timeout <ms>           Per-process timeout (default: none)\n"
       << "  --list-outputs           Print planned outputs and exit\n"
       << "  --manifest <file>        Write a JSON manifest of the run\n"
       << "  --platform               Print host platform and compiler path\n"
       << "  --target <platform>      Platform for --platform (windows, "
          "unix-like)\n"
       << "  -v, --verbose            Report each step\n"
       << "  -h, --help               Show this help message\n"
       << "  --version                Show version information\n";
  }

  void
  print_version(std::ostream& os) {
    os << "benchgen " << BENCHGEN_VERSION << "\n";
  }

  std::string
  require_value(int argc, char* argv[], int& i, const std::string& opt) {
    if (i + 1 >= argc) {
      std::cerr << "benchgen: " << opt << " requires an argument\n";
      std::exit(benchgen_cli::exit_usage);
    }
    return argv[++i];
  }

  nlohmann::json
  parse_args(int argc, char* argv[]) {
    nlohmann::json config = nlohmann::json::object();

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        config["help"] = true;
        return config;
      }

      if (arg == "--version") {
        config["version"] = true;
        return config;
      }

      if (arg == "--clean" || arg == "--parallel" || arg == "--list-outputs" ||
          arg == "--platform") {
        config[arg.substr(2)] = true;
        continue;
      }

      if (arg == "-v" || arg == "--verbose") {
        config["verbose"] = true;
        continue;
      }

      if (arg == "--proto") {
        config["proto"].push_back(require_value(argc, argv, i, arg));
        continue;
      }

      if (arg == "-I") {
        config["include"].push_back(require_value(argc, argv, i, arg));
        continue;
      }

      if (arg.size() > 2 && arg.compare(0, 2, "-I") == 0) {
        config["include"].push_back(arg.substr(2));
        continue;
      }

      if (arg == "--timeout") {
        auto value = require_value(argc, argv, i, arg);
        try {
          std::size_t used = 0;
          long long ms = std::stoll(value, &used);
          if (used != value.size() || ms < 0 ||
              ms > benchgen::max_process_timeout.count())
            throw std::out_of_range(value);
          config["timeout"] = ms;
        } catch (const std::exception&) {
          std::cerr << "benchgen: --timeout expects milliseconds between 0 "
                       "and "
                    << benchgen::max_process_timeout.count() << ", got '"
                    << value << "'\n";
          std::exit(benchgen_cli::exit_usage);
        }
        continue;
      }

      if (arg == "--plan" || arg == "--compiler" || arg == "--schema-dir" ||
          arg == "--out-dir" || arg == "--schema-ext" || arg == "--lang" ||
          arg == "--artifact-ext" || arg == "--protoc" ||
          arg == "--proto-out-flag" || arg == "--proto-out" ||
          arg == "--manifest" || arg == "--target") {
        config[arg.substr(2)] = require_value(argc, argv, i, arg);
        continue;
      }

      if (arg[0] == '-') {
        std::cerr << "benchgen: unknown option: " << arg << "\n";
        std::exit(benchgen_cli::exit_usage);
      }

      std::cerr << "benchgen: unexpected argument: " << arg << "\n";
      std::exit(benchgen_cli::exit_usage);
    }

    return config;
  }

} // namespace

int
main(int argc, char* argv[]) {
  auto config = parse_args(argc, argv);

  if (config.value("help", false)) {
    print_usage(std::cerr);
    return benchgen_cli::exit_success;
  }

  if (config.value("version", false)) {
    print_version(std::cerr);
    return benchgen_cli::exit_success;
  }

  return benchgen_cli::run(config);
}
