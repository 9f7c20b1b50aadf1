#include <benchgen/proto_codegen.hpp>

#include <benchgen/error.hpp>

#include <system_error>

namespace fs = std::filesystem;

namespace benchgen {

  namespace {

    void
    validate(const codegen_request& request) {
      if (request.inputs.empty()) {
        throw generation_error(error_kind::configuration_error,
                               "codegen request",
                               "no input files were supplied");
      }
      if (request.output_dir.empty()) {
        throw generation_error(error_kind::configuration_error,
                               "codegen request",
                               "no output directory was supplied");
      }

      for (const auto& input : request.inputs) {
        std::error_code ec;
        if (!fs::is_regular_file(input, ec)) {
          throw generation_error(error_kind::io_error, input,
                                 ec ? ec.message()
                                    : "input file does not exist");
        }
      }
    }

  } // namespace

  process_request
  make_codegen_invocation(const codegen_request& request,
                          const codegen_tool& tool) {
    process_request invocation;
    invocation.program = tool.program;
    invocation.timeout = tool.timeout;

    for (const auto& dir : request.includes)
      invocation.args.push_back("-I" + dir);
    invocation.args.push_back(tool.output_flag + "=" + request.output_dir);
    for (const auto& input : request.inputs)
      invocation.args.push_back(input);

    return invocation;
  }

  codegen_result
  run_codegen(const codegen_request& request, const codegen_tool& tool,
              const process_runner& runner) {
    validate(request);

    std::error_code ec;
    fs::create_directories(request.output_dir, ec);
    if (ec || !fs::is_directory(request.output_dir, ec)) {
      throw generation_error(error_kind::io_error, request.output_dir,
                             ec ? ec.message()
                                : "output path exists and is not a "
                                  "directory");
    }

    auto run = runner(make_codegen_invocation(request, tool));

    if (!run.launched)
      throw generation_error(error_kind::tool_not_found, tool.program,
                             run.error);

    if (!run.succeeded()) {
      std::string diagnostics = std::move(run.output);
      if (run.timed_out) {
        if (!diagnostics.empty() && diagnostics.back() != '\n')
          diagnostics += '\n';
        diagnostics +=
            "timed out after " + std::to_string(tool.timeout.count()) + " ms";
      } else if (diagnostics.empty()) {
        diagnostics = "exited with status " + std::to_string(run.exit_code);
      }
      throw generation_error(error_kind::codegen_failed, tool.program,
                             std::move(diagnostics));
    }

    codegen_result result;
    result.output_dir = request.output_dir;
    result.inputs.assign(request.inputs.begin(), request.inputs.end());
    result.output = std::move(run.output);
    return result;
  }

} // namespace benchgen
