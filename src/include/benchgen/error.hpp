#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace benchgen {

  enum class error_kind {
    tool_not_found,
    compilation_failed,
    codegen_failed,
    configuration_error,
    io_error,
  };

  std::string_view
  to_string(error_kind kind);

  // Raised by every generation step. diagnostics() holds the external
  // process output (or the system error text) exactly as it was produced.
  class generation_error : public std::runtime_error {
    error_kind kind_;
    std::string subject_;
    std::string diagnostics_;

  public:
    generation_error(error_kind kind, std::string subject,
                     std::string diagnostics = {});

    error_kind
    kind() const noexcept {
      return kind_;
    }

    const std::string&
    subject() const noexcept {
      return subject_;
    }

    const std::string&
    diagnostics() const noexcept {
      return diagnostics_;
    }
  };

} // namespace benchgen
