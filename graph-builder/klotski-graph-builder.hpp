#ifndef __KLOTSKI_GRAPH_BUILDER_HPP___
#define __KLOTSKI_GRAPH_BUILDER_HPP___

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "board.hpp"
#include "graph_node.hpp"

/**
 * @file klotski-graph-builder.hpp
 * @brief Breadth-first enumeration of every board state reachable from a start board.
 */

/**
 * @brief Owner of all nodes discovered by one DecisionGraphBuilder run.
 *
 * Nodes are kept in discovery order; the first one is the root. Edge targets
 * point into the same graph, so the graph must outlive any node reference
 * taken from it.
 */
class DecisionGraph {

private:
    std::vector<std::unique_ptr<GraphNode>> node_list;
    std::unordered_map<std::string, GraphNode*> index;

    friend class DecisionGraphBuilder;

public:
    DecisionGraph() = default;
    DecisionGraph(const DecisionGraph&) = delete;
    DecisionGraph& operator=(const DecisionGraph&) = delete;
    DecisionGraph(DecisionGraph&&) = default;
    DecisionGraph& operator=(DecisionGraph&&) = default;

    /**
     * @brief The starting node, or nullptr for a default-constructed graph.
     */
    const GraphNode* root() const { return node_list.empty() ? nullptr : node_list.front().get(); }

    /**
     * @brief Number of distinct states.
     */
    size_t size() const { return node_list.size(); }

    /**
     * @brief Total number of recorded transitions across all nodes.
     */
    size_t edge_count() const;

    /**
     * @brief Node with the given canonical signature, or nullptr.
     */
    const GraphNode* find(const std::string& hash) const;

    /**
     * @brief All nodes in discovery (breadth-first) order.
     */
    std::vector<const GraphNode*> nodes() const;

    std::vector<const GraphNode*> winning_nodes() const;
};

/**
 * @brief Builds the full reachable-state transition graph of a board.
 *
 * Every distinct signature gets exactly one GraphNode. Exploration does not
 * stop at winning states. There is no state cap: boards with a huge state
 * space will exhaust memory.
 */
class DecisionGraphBuilder {
public:
    /**
     * @brief Explore every state reachable from `initial_board`.
     *
     * @param initial_board Starting configuration; it becomes the root node.
     * @return Graph owning every discovered node, root first.
     */
    DecisionGraph build_graph(const Board& initial_board) const;
};

/**
 * @brief Label the single-block move that turns `prev` into `next`.
 *
 * Blocks are compared index by index, so `next` must keep `prev`'s block
 * order (as every successor from Board::get_next_states does).
 *
 * @return "Block {id} moved {left|right|up|down}", or "Unknown move" when no block moved.
 */
std::string describe_move(const Board& prev, const Board& next);

/**
 * @brief Breadth-first walk over edge lists starting at `root`, each node once.
 *
 * @return Reached nodes in visit order, `root` first; empty if root is nullptr.
 */
std::vector<const GraphNode*> collect_reachable(const GraphNode* root);

#endif // __KLOTSKI_GRAPH_BUILDER_HPP___
