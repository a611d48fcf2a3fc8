/**
 * @file graph_node.hpp
 * @brief One distinct board state in the reachable-state graph.
 */

#ifndef __GRAPH_NODE_HPP___
#define __GRAPH_NODE_HPP___

#include <string>
#include <utility>
#include <vector>

#include "board.hpp"

class GraphNode;

/**
 * @brief Outgoing transition: target node plus a label such as "Block 3 moved left".
 */
struct GraphEdge {
    const GraphNode* child;
    std::string move_description;
};

/**
 * @brief Wraps a board state, its signature, its win flag and its outgoing edges.
 *
 * Nodes are owned by a DecisionGraph and referenced by address from edges,
 * so they are neither copyable nor movable.
 */
class GraphNode {

private:
    std::string state_hash;
    Board board;
    std::vector<GraphEdge> children;
    bool winning;
    bool starting;

    friend class DecisionGraphBuilder;

public:
    explicit GraphNode(Board board)
        : state_hash(board.get_hash()), board(std::move(board)), winning(false), starting(false) {
        winning = this->board.is_winning();
    }

    GraphNode(const GraphNode&) = delete;
    GraphNode& operator=(const GraphNode&) = delete;

    const std::string& get_hash() const { return state_hash; }
    const Board& get_board() const { return board; }

    /**
     * @brief Outgoing edges in discovery order.
     */
    const std::vector<GraphEdge>& get_children() const { return children; }

    bool is_winning() const { return winning; }
    bool is_starting() const { return starting; }
};

#endif // __GRAPH_NODE_HPP___
