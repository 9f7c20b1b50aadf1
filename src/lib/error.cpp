#include <benchgen/error.hpp>

#include <utility>

namespace benchgen {

  namespace {

    std::string
    format_message(error_kind kind, const std::string& subject,
                   const std::string& diagnostics) {
      std::string msg(to_string(kind));
      if (!subject.empty()) {
        msg += ": ";
        msg += subject;
      }
      if (!diagnostics.empty()) {
        msg += '\n';
        msg += diagnostics;
        if (msg.back() == '\n') msg.pop_back();
      }
      return msg;
    }

  } // namespace

  std::string_view
  to_string(error_kind kind) {
    switch (kind) {
      case error_kind::tool_not_found:
        return "tool not found";
      case error_kind::compilation_failed:
        return "schema compilation failed";
      case error_kind::codegen_failed:
        return "code generation failed";
      case error_kind::configuration_error:
        return "configuration error";
      case error_kind::io_error:
        return "i/o error";
    }
    return "unknown error";
  }

  generation_error::generation_error(error_kind kind, std::string subject,
                                     std::string diagnostics)
      : std::runtime_error(format_message(kind, subject, diagnostics)),
        kind_(kind), subject_(std::move(subject)),
        diagnostics_(std::move(diagnostics)) {}

} // namespace benchgen
