#include "graft/autograd/ops.h"

#include <cmath>
#include <sstream>

namespace graft {
namespace autograd {

// ============================================================================
// PowOp: z = x ** k
// ============================================================================

Contributions PowOp::backward(double /*out*/, double grad) const {
    // Negative base with fractional k yields NaN here, same as the forward value
    return {grad * exponent * std::pow(base, exponent - 1.0), 0.0};
}

std::string PowOp::name() const {
    std::ostringstream ss;
    ss << "**" << exponent;
    return ss.str();
}

// ============================================================================
// Dispatch
// ============================================================================

Contributions localGradients(const Op& op, double out, double grad) {
    return std::visit([out, grad](const auto& record) { return record.backward(out, grad); }, op);
}

std::string opName(const Op& op) {
    return std::visit([](const auto& record) { return record.name(); }, op);
}

std::size_t arity(const Op& op) {
    return std::visit([](const auto& record) { return record.kArity; }, op);
}

// ============================================================================
// Forward Evaluation
// ============================================================================

double tanhForward(double x) {
    // Written out as in the textbook definition; overflows to NaN for x > ~354
    const double e2x = std::exp(2.0 * x);
    return (e2x - 1.0) / (e2x + 1.0);
}

}  // namespace autograd
}  // namespace graft
