#pragma once

#include <vector>

#include "graft/autograd/node.h"

namespace graft {

class Graph;

namespace autograd {

// Engine: Orchestrates the backward pass through a Graph
// Implements reverse-mode automatic differentiation
class Engine {
  public:
    // Execute backward pass starting from root
    // Seeds root's gradient with 1, then adds every node's local contributions
    // into its parents, children strictly before parents
    static void backward(Graph& graph, NodeId root);

    // Perform topological sort of the subgraph reachable from root using DFS
    // Returns node ids in reverse topological order (root first)
    static std::vector<NodeId> topologicalSort(const Graph& graph, NodeId root);

  private:
    // Iterative DFS helper for topological sort
    // Appends a node only after all of its parents (post-order)
    static void topologicalSortDFS(const Graph& graph, NodeId root, std::vector<bool>& visited,
                                   std::vector<NodeId>& sorted);
};

}  // namespace autograd
}  // namespace graft
