#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "graft/autograd/node.h"
#include "graft/autograd/ops.h"

namespace graft {

class Graph;

/**
 * @brief Handle to one scalar node of a Graph.
 *
 * Value is what user code manipulates: it is cheap to copy, and every arithmetic
 * operator on it records a new node in the owning Graph and returns a handle to
 * that node. Plain doubles mixed into an expression are first lifted to leaf nodes
 * of the same graph.
 *
 * A Value does not own anything. It stays usable as long as its Graph is alive and
 * has not been cleared. A default-constructed Value is unbound; using it as an
 * operand throws InvalidOperandError.
 *
 * Example:
 *   Graph graph;
 *   Value a = graph.leaf(2.0, "a");
 *   Value b = graph.leaf(-3.0, "b");
 *   Value c = (a * b + 10.0).tanh();
 *   c.backward();  // a.grad(), b.grad() now hold dc/da, dc/db
 */
class Value {
  public:
    Value() = default;
    Value(Graph* graph, NodeId id);

    // ========================================================================
    // Identity
    // ========================================================================

    bool valid() const { return mGraph != nullptr; }
    NodeId id() const { return mId; }

    /// @throws InvalidOperandError if unbound
    Graph& graph() const;

    // ========================================================================
    // Node Access
    // ========================================================================

    double data() const;
    double grad() const;

    /// Overwrite the accumulated gradient, typically to reset it to 0 between passes
    void setGrad(double grad);

    const std::string& label() const;
    Value& setLabel(std::string label);

    /// Operands that produced this value, in order (empty for leaves)
    std::vector<Value> parents() const;

    const autograd::Op& op() const;
    std::string opName() const;
    bool isLeaf() const;

    // ========================================================================
    // Operations
    // ========================================================================

    Value pow(double exponent) const;
    Value exp() const;
    Value tanh() const;
    Value relu() const;

    /**
     * @brief Backpropagate from this value.
     *
     * Seeds this node's gradient with 1 and adds d(this)/d(n) into every ancestor n.
     * Gradients are accumulated, so call Graph::zeroGrad() first when running more
     * than one pass over the same nodes.
     */
    void backward();

    // Compound assignment rebinds this handle to the newly recorded node
    Value& operator+=(const Value& other);
    Value& operator+=(double other);
    Value& operator-=(const Value& other);
    Value& operator-=(double other);
    Value& operator*=(const Value& other);
    Value& operator*=(double other);
    Value& operator/=(const Value& other);
    Value& operator/=(double other);

  private:
    const autograd::Node& node() const;
    autograd::Node& node();

    Graph* mGraph = nullptr;
    NodeId mId = 0;
};

// ============================================================================
// Expression Builder
// ============================================================================

Value operator+(const Value& lhs, const Value& rhs);
Value operator+(const Value& lhs, double rhs);
Value operator+(double lhs, const Value& rhs);

Value operator*(const Value& lhs, const Value& rhs);
Value operator*(const Value& lhs, double rhs);
Value operator*(double lhs, const Value& rhs);

// -x is recorded as x * -1
Value operator-(const Value& operand);

// x - y is recorded as x + (-y)
Value operator-(const Value& lhs, const Value& rhs);
Value operator-(const Value& lhs, double rhs);
Value operator-(double lhs, const Value& rhs);

// x / y is recorded as x * y ** -1
Value operator/(const Value& lhs, const Value& rhs);
Value operator/(const Value& lhs, double rhs);
Value operator/(double lhs, const Value& rhs);

Value pow(const Value& base, double exponent);
Value exp(const Value& operand);
Value tanh(const Value& operand);
Value relu(const Value& operand);

/// Writes "Value(data=...)"
std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace graft
