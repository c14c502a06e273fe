#include "graft/value.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "graft/errors.h"
#include "graft/graph.h"

namespace graft {

namespace {

// Graph both operands live in. Rejects unbound handles and cross-graph operands.
Graph& commonGraph(const Value& lhs, const Value& rhs, const char* op) {
    if (!lhs.valid() || !rhs.valid()) {
        throw InvalidOperandError(std::string("operand of '") + op + "' is not bound to a graph");
    }
    if (&lhs.graph() != &rhs.graph()) {
        throw InvalidOperandError(std::string("operands of '") + op +
                                  "' belong to different graphs");
    }
    return lhs.graph();
}

Graph& graphOf(const Value& operand, const char* op) {
    if (!operand.valid()) {
        throw InvalidOperandError(std::string("operand of '") + op + "' is not bound to a graph");
    }
    return operand.graph();
}

}  // namespace

Value::Value(Graph* graph, NodeId id) : mGraph(graph), mId(id) {}

// ============================================================================
// Identity
// ============================================================================

Graph& Value::graph() const {
    if (!mGraph) {
        throw InvalidOperandError("Value is not bound to a graph");
    }
    return *mGraph;
}

// ============================================================================
// Node Access
// ============================================================================

const autograd::Node& Value::node() const {
    return graph().node(mId);
}

autograd::Node& Value::node() {
    return graph().node(mId);
}

double Value::data() const {
    return node().data;
}

double Value::grad() const {
    return node().grad;
}

void Value::setGrad(double grad) {
    node().grad = grad;
}

const std::string& Value::label() const {
    return node().label;
}

Value& Value::setLabel(std::string label) {
    node().label = std::move(label);
    return *this;
}

std::vector<Value> Value::parents() const {
    const autograd::Node& self = node();
    std::vector<Value> result;
    result.reserve(self.numParents);
    for (std::size_t i = 0; i < self.numParents; ++i) {
        result.emplace_back(mGraph, self.parents[i]);
    }
    return result;
}

const autograd::Op& Value::op() const {
    return node().op;
}

std::string Value::opName() const {
    return autograd::opName(node().op);
}

bool Value::isLeaf() const {
    return node().isLeaf();
}

void Value::backward() {
    graph().backward(*this);
}

// ============================================================================
// Operations
// ============================================================================

Value Value::pow(double exponent) const {
    return graft::pow(*this, exponent);
}

Value Value::exp() const {
    return graft::exp(*this);
}

Value Value::tanh() const {
    return graft::tanh(*this);
}

Value Value::relu() const {
    return graft::relu(*this);
}

Value& Value::operator+=(const Value& other) {
    return *this = *this + other;
}

Value& Value::operator+=(double other) {
    return *this = *this + other;
}

Value& Value::operator-=(const Value& other) {
    return *this = *this - other;
}

Value& Value::operator-=(double other) {
    return *this = *this - other;
}

Value& Value::operator*=(const Value& other) {
    return *this = *this * other;
}

Value& Value::operator*=(double other) {
    return *this = *this * other;
}

Value& Value::operator/=(const Value& other) {
    return *this = *this / other;
}

Value& Value::operator/=(double other) {
    return *this = *this / other;
}

// ============================================================================
// Expression Builder: primitive operations
// ============================================================================

Value operator+(const Value& lhs, const Value& rhs) {
    Graph& graph = commonGraph(lhs, rhs, "+");
    return graph.record(lhs.data() + rhs.data(), autograd::AddOp{}, {lhs.id(), rhs.id()});
}

Value operator*(const Value& lhs, const Value& rhs) {
    Graph& graph = commonGraph(lhs, rhs, "*");
    const double x = lhs.data();
    const double y = rhs.data();
    return graph.record(x * y, autograd::MulOp{x, y}, {lhs.id(), rhs.id()});
}

Value pow(const Value& base, double exponent) {
    Graph& graph = graphOf(base, "**");
    const double x = base.data();
    return graph.record(std::pow(x, exponent), autograd::PowOp{x, exponent}, {base.id()});
}

Value exp(const Value& operand) {
    Graph& graph = graphOf(operand, "exp");
    return graph.record(std::exp(operand.data()), autograd::ExpOp{}, {operand.id()});
}

Value tanh(const Value& operand) {
    Graph& graph = graphOf(operand, "tanh");
    return graph.record(autograd::tanhForward(operand.data()), autograd::TanhOp{},
                        {operand.id()});
}

Value relu(const Value& operand) {
    Graph& graph = graphOf(operand, "ReLU");
    const double x = operand.data();
    return graph.record(x > 0.0 ? x : 0.0, autograd::ReluOp{}, {operand.id()});
}

// ============================================================================
// Expression Builder: constants are lifted to leaves of the operand's graph
// ============================================================================

Value operator+(const Value& lhs, double rhs) {
    return lhs + graphOf(lhs, "+").leaf(rhs);
}

Value operator+(double lhs, const Value& rhs) {
    return rhs + lhs;
}

Value operator*(const Value& lhs, double rhs) {
    return lhs * graphOf(lhs, "*").leaf(rhs);
}

Value operator*(double lhs, const Value& rhs) {
    return rhs * lhs;
}

// ============================================================================
// Expression Builder: composite operations
// ============================================================================

Value operator-(const Value& operand) {
    return operand * -1.0;
}

Value operator-(const Value& lhs, const Value& rhs) {
    // Validate before -rhs records anything
    commonGraph(lhs, rhs, "-");
    return lhs + (-rhs);
}

Value operator-(const Value& lhs, double rhs) {
    return lhs + graphOf(lhs, "-").leaf(rhs) * -1.0;
}

Value operator-(double lhs, const Value& rhs) {
    return lhs + (-rhs);
}

Value operator/(const Value& lhs, const Value& rhs) {
    commonGraph(lhs, rhs, "/");
    return lhs * pow(rhs, -1.0);
}

Value operator/(const Value& lhs, double rhs) {
    return lhs * pow(graphOf(lhs, "/").leaf(rhs), -1.0);
}

Value operator/(double lhs, const Value& rhs) {
    return lhs * pow(rhs, -1.0);
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << "Value(data=" << value.data() << ")";
}

}  // namespace graft
