#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "graft/autograd/node.h"
#include "graft/autograd/ops.h"
#include "graft/value.h"

namespace graft {

/**
 * @brief Construction-time options of a Graph.
 */
struct GraphOptions {
    // Throw NumericalError when an operation produces NaN or Inf instead of
    // letting it propagate. Off by default: IEEE-754 semantics are kept.
    bool checkFinite = false;

    // Shown in log lines
    std::string name = "graph";
};

/**
 * @brief Arena owning every node of one computation.
 *
 * Nodes are appended in creation order and addressed by NodeId. Operands are always
 * recorded before their results, so the arena can never describe a cycle. All nodes
 * are released together when the Graph is destroyed or cleared, which also
 * invalidates every Value handle issued by it.
 *
 * A Graph is pinned in memory: Values keep a pointer to it, so it can be neither
 * copied nor moved.
 */
class Graph {
  public:
    explicit Graph(GraphOptions options = {});

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;
    Graph(Graph&&) = delete;
    Graph& operator=(Graph&&) = delete;

    // ========================================================================
    // Construction
    // ========================================================================

    /// New input or constant node with gradient 0
    Value leaf(double data, std::string label = {});

    /**
     * @brief Append the result of an operation.
     *
     * Used by the expression builder; parents must already belong to this graph.
     *
     * @throws InvalidOperandError if a parent id is not in the arena or the parent
     *         count does not match the operation
     * @throws NumericalError if options().checkFinite is set and data is not finite
     */
    Value record(double data, const autograd::Op& op, std::initializer_list<NodeId> parents);

    // ========================================================================
    // Access
    // ========================================================================

    /// Handle to an existing node
    Value value(NodeId id);

    /// @throws std::out_of_range if id is past the arena
    const autograd::Node& node(NodeId id) const;
    autograd::Node& node(NodeId id);

    std::size_t size() const { return mNodes.size(); }
    bool empty() const { return mNodes.empty(); }

    /// True if the handle was issued by this graph and still points into the arena
    bool owns(const Value& value) const;

    const GraphOptions& options() const { return mOptions; }

    /// Process-unique id of the current arena generation, renewed by clear().
    /// Lets long-lived holders (nn::Parameter) tell a fresh graph from a stale one
    /// even when it reuses the same address.
    std::uint64_t serial() const { return mSerial; }

    // ========================================================================
    // Gradients
    // ========================================================================

    /// Backpropagate from terminal, see Value::backward()
    void backward(const Value& terminal);

    /// Reset every gradient in the arena to 0
    void zeroGrad();

    /// Drop every node. Outstanding Values become dangling.
    void clear();

  private:
    static std::uint64_t nextSerial();

    std::vector<autograd::Node> mNodes;
    GraphOptions mOptions;
    std::uint64_t mSerial;
};

}  // namespace graft
