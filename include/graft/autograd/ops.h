#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <variant>

namespace graft {
namespace autograd {

// Gradient contributions for the (at most two) parents of a node, in parent order
using Contributions = std::array<double, 2>;

// ============================================================================
// Operation Records
// ============================================================================
// Each record carries only what its local derivative needs. backward() receives
// the node's forward result and its accumulated gradient g, and returns what
// must be added to each parent's gradient.

// Leaf: input or lifted constant, nothing to propagate
struct LeafOp {
    static constexpr std::size_t kArity = 0;
    Contributions backward(double /*out*/, double /*grad*/) const { return {0.0, 0.0}; }
    std::string name() const { return ""; }
};

// AddOp
// Forward:  z = x + y
// Backward: dL/dx = g
//           dL/dy = g
struct AddOp {
    static constexpr std::size_t kArity = 2;
    Contributions backward(double /*out*/, double grad) const { return {grad, grad}; }
    std::string name() const { return "+"; }
};

// MulOp
// Forward:  z = x * y
// Backward: dL/dx = g * y
//           dL/dy = g * x
struct MulOp {
    static constexpr std::size_t kArity = 2;
    double lhs;
    double rhs;
    Contributions backward(double /*out*/, double grad) const { return {grad * rhs, grad * lhs}; }
    std::string name() const { return "*"; }
};

// PowOp: exponent is a plain number, never a node
// Forward:  z = x ** k
// Backward: dL/dx = g * k * x ** (k - 1)
struct PowOp {
    static constexpr std::size_t kArity = 1;
    double base;
    double exponent;
    Contributions backward(double out, double grad) const;
    std::string name() const;
};

// ExpOp
// Forward:  z = e ** x
// Backward: dL/dx = g * z
struct ExpOp {
    static constexpr std::size_t kArity = 1;
    Contributions backward(double out, double grad) const { return {grad * out, 0.0}; }
    std::string name() const { return "exp"; }
};

// TanhOp
// Forward:  z = (e^2x - 1) / (e^2x + 1)
// Backward: dL/dx = g * (1 - z^2)
struct TanhOp {
    static constexpr std::size_t kArity = 1;
    Contributions backward(double out, double grad) const {
        return {grad * (1.0 - out * out), 0.0};
    }
    std::string name() const { return "tanh"; }
};

// ReluOp
// Forward:  z = max(x, 0)
// Backward: dL/dx = g if x > 0 else 0 (x > 0 exactly when z > 0)
struct ReluOp {
    static constexpr std::size_t kArity = 1;
    Contributions backward(double out, double grad) const {
        return {out > 0.0 ? grad : 0.0, 0.0};
    }
    std::string name() const { return "ReLU"; }
};

using Op = std::variant<LeafOp, AddOp, MulOp, PowOp, ExpOp, TanhOp, ReluOp>;

// ============================================================================
// Dispatch
// ============================================================================

// Local gradient rule of whichever operation produced a node
Contributions localGradients(const Op& op, double out, double grad);

// Symbol used in traces and DOT output ("+", "*", "**2", "tanh", ...)
std::string opName(const Op& op);

// Number of parents the operation records
std::size_t arity(const Op& op);

// ============================================================================
// Forward Evaluation
// ============================================================================

double tanhForward(double x);

}  // namespace autograd
}  // namespace graft
