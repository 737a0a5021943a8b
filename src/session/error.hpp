#ifndef ARBOR_SESSION_ERROR_HPP
#define ARBOR_SESSION_ERROR_HPP

#include <expected>
#include <string>
#include <vector>
#include <common.hpp>

namespace arbor::session {
#include "macros_open.hpp"

  // The failure value of every session and engine operation.
  // Converted to the wire format only by the dispatcher.
  struct Error {
    enum class Kind: uint32_t {
      InvalidParams,   // Unknown node id or malformed arguments
      StepParse,       // Step text does not parse
      StepExecution,   // Step failed, ran out of budget, or logged errors
      ExpressionParse, // Expression text does not parse
      Elaboration      // Expression does not elaborate
    };
    using enum Kind;

    Kind kind;
    std::string message;
    std::vector<std::string> details; // Diagnostic messages (for `StepExecution`).
  };

  template <typename T>
  using Result = std::expected<T, Error>;

  inline auto fail(Error::Kind kind, std::string message, std::vector<std::string> details = {})
    -> std::unexpected<Error> {
    return std::unexpected(Error{kind, std::move(message), std::move(details)});
  }

#include "macros_close.hpp"
}

#endif // ARBOR_SESSION_ERROR_HPP
