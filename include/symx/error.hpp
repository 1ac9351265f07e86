#pragma once
#include <stdexcept>
#include <string>

namespace symx {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Precondition violation on a public entry point (e.g. no candidates to choose from)
struct EmptyInputError : Error {
  explicit EmptyInputError(const std::string& what) : Error("empty input: " + what) {}
};

// Numeric evaluation hit an unbound variable or an unknown function
struct EvalError : Error {
  using Error::Error;
};

} // namespace symx
