#include "graft/viz/trace.h"

#include <algorithm>
#include <set>
#include <sstream>

#include <fmt/core.h>

#include "graft/graph.h"

namespace graft {
namespace viz {

namespace {

// Record labels treat | { } < > as field syntax and " ends the string
std::string escapeRecordLabel(const std::string& label) {
    std::string escaped;
    escaped.reserve(label.size());
    for (const char c : label) {
        switch (c) {
            case '"':
            case '\\':
            case '|':
            case '{':
            case '}':
            case '<':
            case '>':
                escaped.push_back('\\');
                break;
            default:
                break;
        }
        escaped.push_back(c);
    }
    return escaped;
}

}  // namespace

GraphTrace trace(const Value& root) {
    Graph& graph = root.graph();
    static_cast<void>(graph.node(root.id()));

    std::vector<bool> visited(graph.size(), false);
    std::set<std::pair<NodeId, NodeId>> seen_edges;
    std::vector<NodeId> stack{root.id()};
    std::vector<NodeId> node_ids;

    GraphTrace result;
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();
        if (visited[id]) {
            continue;
        }
        visited[id] = true;
        node_ids.push_back(id);

        const autograd::Node& node = graph.node(id);
        for (std::size_t i = 0; i < node.numParents; ++i) {
            const NodeId parent = node.parents[i];
            // x + x is a single edge in the picture
            if (seen_edges.insert({parent, id}).second) {
                result.edges.emplace_back(Value(&graph, parent), Value(&graph, id));
            }
            stack.push_back(parent);
        }
    }

    std::sort(node_ids.begin(), node_ids.end());
    result.nodes.reserve(node_ids.size());
    for (const NodeId id : node_ids) {
        result.nodes.emplace_back(&graph, id);
    }
    return result;
}

std::string toDot(const Value& root, RankDir rankdir) {
    const GraphTrace graph_trace = trace(root);

    std::ostringstream dot;
    dot << "digraph {\n";
    dot << "  rankdir=" << (rankdir == RankDir::LR ? "LR" : "TB") << ";\n";

    for (const Value& node : graph_trace.nodes) {
        dot << fmt::format("  n{} [shape=record, label=\"{{ {} | data {:.4f} | grad {:.4f} }}\"];\n",
                           node.id(), escapeRecordLabel(node.label()), node.data(), node.grad());
        if (!node.isLeaf()) {
            dot << fmt::format("  n{}_op [label=\"{}\"];\n", node.id(), node.opName());
            dot << fmt::format("  n{}_op -> n{};\n", node.id(), node.id());
        }
    }

    for (const auto& [parent, child] : graph_trace.edges) {
        dot << fmt::format("  n{} -> n{}_op;\n", parent.id(), child.id());
    }

    dot << "}\n";
    return dot.str();
}

}  // namespace viz
}  // namespace graft
