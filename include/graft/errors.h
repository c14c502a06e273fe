#pragma once

#include <stdexcept>
#include <string>

namespace graft {

// Thrown at the call site when an operand is not a live node of the graph
// the operation is recorded in (unbound handle, or a handle from another graph)
class InvalidOperandError : public std::invalid_argument {
  public:
    explicit InvalidOperandError(const std::string& what) : std::invalid_argument(what) {}
};

// Thrown only when GraphOptions::checkFinite is set and an operation produces NaN or Inf
class NumericalError : public std::domain_error {
  public:
    explicit NumericalError(const std::string& what) : std::domain_error(what) {}
};

}  // namespace graft
