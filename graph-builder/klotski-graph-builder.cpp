#include <memory>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

#include "board.hpp"
#include "graph_node.hpp"
#include "klotski-graph-builder.hpp"

using namespace std;

size_t DecisionGraph::edge_count() const {
    size_t count = 0;
    for (const auto& node : node_list) count += node->get_children().size();
    return count;
}

const GraphNode* DecisionGraph::find(const string& hash) const {
    auto it = index.find(hash);
    return it == index.end() ? nullptr : it->second;
}

vector<const GraphNode*> DecisionGraph::nodes() const {
    vector<const GraphNode*> result;
    result.reserve(node_list.size());
    for (const auto& node : node_list) result.push_back(node.get());
    return result;
}

vector<const GraphNode*> DecisionGraph::winning_nodes() const {
    vector<const GraphNode*> result;
    for (const auto& node : node_list) {
        if (node->is_winning()) result.push_back(node.get());
    }
    return result;
}

DecisionGraph DecisionGraphBuilder::build_graph(const Board& initial_board) const {
    DecisionGraph graph;
    queue<GraphNode*> frontier;

    auto root = make_unique<GraphNode>(initial_board.clone());
    root->starting = true;
    graph.index.emplace(root->get_hash(), root.get());
    frontier.push(root.get());
    graph.node_list.push_back(std::move(root));

    while (!frontier.empty()) {
        GraphNode* current = frontier.front();
        frontier.pop();

        for (Board& next_board : current->board.get_next_states()) {
            string next_hash = next_board.get_hash();
            string move = describe_move(current->board, next_board);

            GraphNode* next_node;
            auto found = graph.index.find(next_hash);
            if (found == graph.index.end()) {
                auto created = make_unique<GraphNode>(std::move(next_board));
                next_node = created.get();
                graph.index.emplace(next_hash, next_node);
                frontier.push(next_node);
                graph.node_list.push_back(std::move(created));
            } else {
                next_node = found->second;
            }

            // Successors always move a block, so this only skips malformed input.
            if (next_hash != current->state_hash) {
                current->children.push_back({next_node, move});
            }
        }
    }

    return graph;
}

string describe_move(const Board& prev, const Board& next) {
    const vector<Block>& before = prev.get_blocks();
    const vector<Block>& after = next.get_blocks();
    for (size_t i = 0; i < before.size() && i < after.size(); ++i) {
        int dx = after[i].get_x() - before[i].get_x();
        int dy = after[i].get_y() - before[i].get_y();
        if (dx == 0 && dy == 0) continue;

        const char* direction = dx < 0 ? "left" : dx > 0 ? "right" : dy < 0 ? "up" : "down";
        return "Block " + to_string(before[i].get_id()) + " moved " + direction;
    }
    return "Unknown move";
}

vector<const GraphNode*> collect_reachable(const GraphNode* root) {
    vector<const GraphNode*> order;
    if (root == nullptr) return order;

    unordered_set<const GraphNode*> visited;
    queue<const GraphNode*> frontier;
    frontier.push(root);
    visited.insert(root);
    while (!frontier.empty()) {
        const GraphNode* node = frontier.front();
        frontier.pop();
        order.push_back(node);
        for (const GraphEdge& edge : node->get_children()) {
            if (visited.insert(edge.child).second) frontier.push(edge.child);
        }
    }
    return order;
}
