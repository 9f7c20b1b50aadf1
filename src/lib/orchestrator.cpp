#include <benchgen/orchestrator.hpp>

#include <benchgen/error.hpp>

#include <exception>
#include <future>
#include <utility>

namespace fs = std::filesystem;

namespace benchgen {

  std::string_view
  to_string(orchestrator_state state) noexcept {
    switch (state) {
      case orchestrator_state::not_started:
        return "not-started";
      case orchestrator_state::resolving:
        return "resolving";
      case orchestrator_state::generating_batch:
        return "generating-batch";
      case orchestrator_state::generating_single:
        return "generating-single";
      case orchestrator_state::done:
        return "done";
      case orchestrator_state::failed:
        return "failed";
    }
    return "failed";
  }

  orchestrator::orchestrator(build_plan plan, process_runner runner)
      : plan_(std::move(plan)), runner_(std::move(runner)) {}

  void
  orchestrator::on_transition(transition_fn fn) {
    on_transition_ = std::move(fn);
  }

  void
  orchestrator::transition(orchestrator_state next) {
    auto prev = std::exchange(state_, next);
    if (on_transition_) on_transition_(prev, next);
  }

  generation_report
  orchestrator::run() {
    if (state_ != orchestrator_state::not_started) {
      throw generation_error(error_kind::configuration_error, "orchestrator",
                             "run() called more than once");
    }

    generation_report report;
    try {
      transition(orchestrator_state::resolving);
      if (plan_.compiler.tool_path)
        tool_path_ = fs::path(*plan_.compiler.tool_path);
      else
        tool_path_ = resolve_tool_path();
      report.platform = host_platform();
      report.tool_path = *tool_path_;

      if (plan_.parallel)
        run_parallel(report);
      else
        run_sequential(report);
    } catch (...) {
      transition(orchestrator_state::failed);
      throw;
    }

    transition(orchestrator_state::done);
    return report;
  }

  void
  orchestrator::run_sequential(generation_report& report) {
    transition(orchestrator_state::generating_batch);
    report.compiled = compile_schema_dir(*tool_path_, plan_.compiler, runner_);

    transition(orchestrator_state::generating_single);
    report.generated = run_codegen(plan_.codegen, plan_.generator, runner_);
  }

  void
  orchestrator::run_parallel(generation_report& report) {
    // The pipelines write disjoint directories and share nothing mutable.
    // Both are always joined; a batch failure takes precedence so it is
    // never hidden behind the second pipeline's error.
    transition(orchestrator_state::generating_batch);
    auto batch = std::async(std::launch::async, [this] {
      return compile_schema_dir(*tool_path_, plan_.compiler, runner_);
    });
    auto single = std::async(std::launch::async, [this] {
      return run_codegen(plan_.codegen, plan_.generator, runner_);
    });

    std::exception_ptr first_error;
    try {
      report.compiled = batch.get();
    } catch (...) {
      first_error = std::current_exception();
    }

    if (!first_error) transition(orchestrator_state::generating_single);

    try {
      report.generated = single.get();
    } catch (...) {
      if (!first_error) first_error = std::current_exception();
    }

    if (first_error) std::rethrow_exception(first_error);
  }

} // namespace benchgen
