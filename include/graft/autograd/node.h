#pragma once

#include <array>
#include <cstddef>
#include <string>

#include "graft/autograd/ops.h"

namespace graft {

// Position of a node in its Graph's arena
using NodeId = std::size_t;

namespace autograd {

// Node: one scalar in the computation graph
// Nodes live in a Graph arena and refer to their operands by index. A node is always
// recorded after its operands, so every parent id is smaller than the node's own id
// and the graph cannot contain a cycle.
struct Node {
    double data = 0.0;  // forward value, fixed at construction
    double grad = 0.0;  // d(terminal)/d(this), accumulated by the backward pass

    // Operands in order; only the first numParents entries are meaningful.
    // The same id may appear twice (x + x), which counts as two edges.
    std::array<NodeId, 2> parents{};
    std::size_t numParents = 0;

    // Operation that produced this node, carries its local gradient rule
    Op op = LeafOp{};

    // Cosmetic, for traces and DOT output
    std::string label;

    bool isLeaf() const { return numParents == 0; }
};

}  // namespace autograd
}  // namespace graft
