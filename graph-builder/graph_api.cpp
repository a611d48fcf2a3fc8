#include <chrono>
#include <stdexcept>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "board_validation.hpp"
#include "graph_api.hpp"
#include "klotski-graph-builder.hpp"

/**
 * @file graph_api.cpp
 * @brief C-friendly wrapper around the graph builder so it can be called from Python via ctypes.
 */

extern "C" {
    int klotski_graph_run_instance(
        const char* input_file,
        double* out_time_ms,
        long long* out_nodes,
        long long* out_edges,
        long long* out_winning_nodes
    ) {
        if (!input_file || !out_time_ms || !out_nodes || !out_edges || !out_winning_nodes) {
            return -1;
        }
        try {
            Board board = read_board_from_file(std::string(input_file));
            if (!validate_board(board).empty()) return -2;

            auto t0 = std::chrono::steady_clock::now();
            DecisionGraph graph = DecisionGraphBuilder().build_graph(board);
            auto t1 = std::chrono::steady_clock::now();

            *out_time_ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();
            *out_nodes = static_cast<long long>(graph.size());
            *out_edges = static_cast<long long>(graph.edge_count());
            *out_winning_nodes = static_cast<long long>(graph.winning_nodes().size());
            return *out_winning_nodes > 0 ? 1 : 0;
        } catch (const std::exception&) {
            return -3;
        }
    }
}
