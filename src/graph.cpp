#include "graft/graph.h"

#include <atomic>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "graft/autograd/engine.h"
#include "graft/errors.h"
#include "graft/logger.h"

namespace graft {

Graph::Graph(GraphOptions options) : mOptions(std::move(options)), mSerial(nextSerial()) {}

std::uint64_t Graph::nextSerial() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

// ============================================================================
// Construction
// ============================================================================

Value Graph::leaf(double data, std::string label) {
    autograd::Node node;
    node.data = data;
    node.label = std::move(label);
    mNodes.push_back(std::move(node));
    return Value(this, mNodes.size() - 1);
}

Value Graph::record(double data, const autograd::Op& op, std::initializer_list<NodeId> parents) {
    if (parents.size() != autograd::arity(op)) {
        throw InvalidOperandError("operation '" + autograd::opName(op) + "' expects " +
                                  std::to_string(autograd::arity(op)) + " operand(s), got " +
                                  std::to_string(parents.size()));
    }

    if (mOptions.checkFinite && !std::isfinite(data)) {
        Logger::getInstance("Graph").error("[{}] '{}' produced a non-finite value ({})",
                                           mOptions.name, autograd::opName(op), data);
        throw NumericalError("operation '" + autograd::opName(op) + "' produced " +
                             std::to_string(data) + " in graph '" + mOptions.name + "'");
    }

    autograd::Node node;
    node.data = data;
    node.op = op;
    for (const NodeId parent : parents) {
        if (parent >= mNodes.size()) {
            throw InvalidOperandError("operand id " + std::to_string(parent) +
                                      " is not a node of graph '" + mOptions.name + "'");
        }
        node.parents[node.numParents++] = parent;
    }

    mNodes.push_back(std::move(node));
    return Value(this, mNodes.size() - 1);
}

// ============================================================================
// Access
// ============================================================================

Value Graph::value(NodeId id) {
    static_cast<void>(node(id));
    return Value(this, id);
}

const autograd::Node& Graph::node(NodeId id) const {
    if (id >= mNodes.size()) {
        throw std::out_of_range("node id " + std::to_string(id) + " out of range for graph '" +
                                mOptions.name + "' of size " + std::to_string(mNodes.size()));
    }
    return mNodes[id];
}

autograd::Node& Graph::node(NodeId id) {
    return const_cast<autograd::Node&>(std::as_const(*this).node(id));
}

bool Graph::owns(const Value& value) const {
    return value.valid() && &value.graph() == this && value.id() < mNodes.size();
}

// ============================================================================
// Gradients
// ============================================================================

void Graph::backward(const Value& terminal) {
    if (!owns(terminal)) {
        throw InvalidOperandError("backward() called with a value that is not a node of graph '" +
                                  mOptions.name + "'");
    }
    autograd::Engine::backward(*this, terminal.id());
}

void Graph::zeroGrad() {
    for (auto& node : mNodes) {
        node.grad = 0.0;
    }
}

void Graph::clear() {
    Logger::getInstance("Graph").debug("[{}] Releasing {} nodes", mOptions.name, mNodes.size());
    mNodes.clear();
    mSerial = nextSerial();
}

}  // namespace graft
