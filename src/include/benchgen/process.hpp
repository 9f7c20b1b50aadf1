#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace benchgen {

  // Longest timeout a process can be given; longer requests are rejected by
  // the configuration layers and clamped by run_process.
  inline constexpr std::chrono::milliseconds max_process_timeout{
      std::numeric_limits<int>::max()};

  struct process_request {
    std::string program;
    std::vector<std::string> args;
    // Zero means wait indefinitely.
    std::chrono::milliseconds timeout{0};
  };

  struct process_result {
    // False when the program could not be started at all; error then holds
    // the reason and the remaining fields are meaningless.
    bool launched = false;
    int exit_code = -1;
    bool timed_out = false;
    // Combined stdout and stderr, in the order the child wrote them.
    std::string output;
    std::string error;

    bool
    succeeded() const noexcept {
      return launched && !timed_out && exit_code == 0;
    }
  };

  using process_runner =
      std::function<process_result(const process_request& request)>;

  // Spawns request.program with request.args and blocks until it exits or
  // the timeout elapses, in which case the child is killed. Output still
  // buffered when the child exits is collected; pipes held open by its
  // background descendants are not waited for.
  process_result
  run_process(const process_request& request);

  // A path with a directory component is checked as given; a bare program
  // name is looked up on PATH.
  std::optional<std::filesystem::path>
  find_executable(const std::filesystem::path& program);

  // Renders the invocation as a shell-like command line, for diagnostics.
  std::string
  format_command(const process_request& request);

} // namespace benchgen
