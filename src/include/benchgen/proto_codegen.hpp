#pragma once

#include <benchgen/process.hpp>

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace benchgen {

  struct codegen_request {
    std::string output_dir;
    std::vector<std::string> inputs;
    std::vector<std::string> includes;

    codegen_request&
    out_dir(std::string dir) {
      output_dir = std::move(dir);
      return *this;
    }

    codegen_request&
    input(std::string file) {
      inputs.push_back(std::move(file));
      return *this;
    }

    codegen_request&
    with_inputs(std::initializer_list<std::string> files) {
      inputs.insert(inputs.end(), files.begin(), files.end());
      return *this;
    }

    codegen_request&
    include(std::string dir) {
      includes.push_back(std::move(dir));
      return *this;
    }
  };

  struct codegen_tool {
    std::string program = "protoc";
    std::string output_flag = "--cpp_out";
    std::chrono::milliseconds timeout{0};
  };

  struct codegen_result {
    std::filesystem::path output_dir;
    std::vector<std::filesystem::path> inputs;
    // Whatever the generator printed while succeeding.
    std::string output;
  };

  process_request
  make_codegen_invocation(const codegen_request& request,
                          const codegen_tool& tool);

  // Runs the generator once over every input of request.
  codegen_result
  run_codegen(const codegen_request& request, const codegen_tool& tool = {},
              const process_runner& runner = run_process);

} // namespace benchgen
