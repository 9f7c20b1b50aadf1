#pragma once

#include <benchgen/build_plan.hpp>
#include <benchgen/platform.hpp>
#include <benchgen/process.hpp>
#include <benchgen/proto_codegen.hpp>
#include <benchgen/schema_compiler.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>

namespace benchgen {

  enum class orchestrator_state {
    not_started,
    resolving,
    generating_batch,
    generating_single,
    done,
    failed,
  };

  std::string_view
  to_string(orchestrator_state state) noexcept;

  struct generation_report {
    platform_target platform = host_platform();
    std::filesystem::path tool_path;
    schema_dir_result compiled;
    codegen_result generated;
  };

  using transition_fn = std::function<void(orchestrator_state from,
                                           orchestrator_state to)>;

  // Runs tool resolution, the schema directory batch and the single codegen
  // request, in that order. The first generation_error stops the run and is
  // rethrown as is; the orchestrator is then in the failed state for good.
  class orchestrator {
    build_plan plan_;
    process_runner runner_;
    transition_fn on_transition_;
    orchestrator_state state_ = orchestrator_state::not_started;
    std::optional<std::filesystem::path> tool_path_;

    void
    transition(orchestrator_state next);

    void
    run_sequential(generation_report& report);

    void
    run_parallel(generation_report& report);

  public:
    explicit orchestrator(build_plan plan,
                          process_runner runner = run_process);

    void
    on_transition(transition_fn fn);

    // May be called once.
    generation_report
    run();

    orchestrator_state
    state() const noexcept {
      return state_;
    }

    // Empty until the resolving step has completed.
    const std::optional<std::filesystem::path>&
    tool_path() const noexcept {
      return tool_path_;
    }

    const build_plan&
    plan() const noexcept {
      return plan_;
    }
  };

} // namespace benchgen
