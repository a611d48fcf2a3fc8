#include <chrono>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "board_validation.hpp"
#include "graph_cli.hpp"
#include "klotski-graph-builder.hpp"

using namespace std;

int run_graph_cli(int argc, char** argv, ostream& out, ostream& err) {
    string input_file;
    bool print_edges = false;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--print-edges") { print_edges = true; }
        else if (a == "--help") {
            out << "Usage: klotski-graph [--input-file FILE] [--print-edges]\n";
            return 0;
        }
        else {
            err << "Unknown argument: " << a << '\n';
            return 1;
        }
    }

    Board board = default_board();
    if (!input_file.empty()) {
        try {
            board = read_board_from_file(input_file);
        } catch (const std::exception& e) {
            err << "Error reading board: " << e.what() << '\n';
            return 1;
        }
    }

    vector<string> errors = validate_board(board);
    if (!errors.empty()) {
        err << format_validation_errors(errors) << '\n';
        return 2;
    }

    auto t0 = chrono::steady_clock::now();
    DecisionGraphBuilder builder;
    DecisionGraph graph = builder.build_graph(board);
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    if (print_edges) {
        for (const GraphNode* node : graph.nodes()) {
            for (const GraphEdge& edge : node->get_children()) {
                out << node->get_hash() << " -> " << edge.child->get_hash() << " : " << edge.move_description << '\n';
            }
        }
    }

    size_t winning = graph.winning_nodes().size();
    out << board.get_rows() << "x" << board.get_columns() << ", states: " << graph.size()
        << ", edges: " << graph.edge_count() << ", winning states: " << winning
        << ", solvable: " << (winning > 0 ? 1 : 0) << ", time: " << ms << "ms" << '\n';

    return 0;
}
