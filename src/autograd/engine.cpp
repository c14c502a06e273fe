#include "graft/autograd/engine.h"

#include <algorithm>
#include <utility>

#include "graft/graph.h"
#include "graft/logger.h"

namespace graft {
namespace autograd {

void Engine::backward(Graph& graph, NodeId root) {
    auto& logger = Logger::getInstance("Autograd");

    // Every node reachable from root, root first
    const std::vector<NodeId> sorted = topologicalSort(graph, root);
    logger.debug("[{}] Topological sort completed {} nodes", graph.options().name, sorted.size());

    // d(root)/d(root) = 1
    graph.node(root).grad = 1.0;

    // Reverse topological order guarantees a node has received the contributions of
    // all its children before its own rule runs
    for (const NodeId id : sorted) {
        const Node& node = graph.node(id);
        if (node.isLeaf()) {
            continue;
        }

        const Contributions contributions = localGradients(node.op, node.data, node.grad);

        // One contribution per edge. For x + x both slots name the same parent and it
        // receives both.
        for (std::size_t i = 0; i < node.numParents; ++i) {
            graph.node(node.parents[i]).grad += contributions[i];
        }
    }

    logger.debug("[{}] Backward pass completed", graph.options().name);
}

std::vector<NodeId> Engine::topologicalSort(const Graph& graph, NodeId root) {
    std::vector<bool> visited(graph.size(), false);
    std::vector<NodeId> sorted;

    // Validates root before the traversal starts
    static_cast<void>(graph.node(root));

    topologicalSortDFS(graph, root, visited, sorted);

    // DFS gives post-order (parents first), we need root first
    std::reverse(sorted.begin(), sorted.end());
    return sorted;
}

void Engine::topologicalSortDFS(const Graph& graph, NodeId root, std::vector<bool>& visited,
                                std::vector<NodeId>& sorted) {
    // Explicit stack of (node, next parent to visit); graph depth is unbounded
    std::vector<std::pair<NodeId, std::size_t>> stack;
    visited[root] = true;
    stack.emplace_back(root, 0);

    while (!stack.empty()) {
        auto& [id, next] = stack.back();
        const Node& node = graph.node(id);

        if (next < node.numParents) {
            const NodeId parent = node.parents[next++];
            if (!visited[parent]) {
                visited[parent] = true;
                stack.emplace_back(parent, 0);
            }
            continue;
        }

        // All parents emitted
        sorted.push_back(id);
        stack.pop_back();
    }
}

}  // namespace autograd
}  // namespace graft
