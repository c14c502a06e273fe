#pragma once

#include <string>
#include <utility>
#include <vector>

#include "graft/value.h"

namespace graft {
namespace viz {

/**
 * @brief Nodes and edges reachable from a root value.
 *
 * nodes are ordered by NodeId (creation order). edges are (parent, child) pairs,
 * one per distinct pair, in the order they are discovered.
 */
struct GraphTrace {
    std::vector<Value> nodes;
    std::vector<std::pair<Value, Value>> edges;
};

enum class RankDir { LR, TB };

/**
 * @brief Walk the graph behind root without touching data or gradients.
 */
GraphTrace trace(const Value& root);

/**
 * @brief Render the graph behind root as Graphviz DOT text.
 *
 * Every node becomes a record "label | data | grad". Every non-leaf also gets a
 * small op node ("+", "*", "tanh", ...) between its operands and itself.
 *
 * Example:
 *   std::ofstream("graph.dot") << viz::toDot(loss);
 *   // dot -Tsvg graph.dot -o graph.svg
 */
std::string toDot(const Value& root, RankDir rankdir = RankDir::LR);

}  // namespace viz
}  // namespace graft
