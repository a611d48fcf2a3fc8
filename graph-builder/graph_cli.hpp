#ifndef __GRAPH_CLI_HPP___
#define __GRAPH_CLI_HPP___

#include <ostream>

/**
 * @file graph_cli.hpp
 * @brief Body of the klotski-graph driver, callable with explicit streams.
 */

/**
 * @brief Parse arguments, load and validate the board, build the graph and print the summary.
 *
 * @return 0 on success, 1 on bad arguments or unreadable board, 2 if validation fails.
 */
int run_graph_cli(int argc, char** argv, std::ostream& out, std::ostream& err);

#endif // __GRAPH_CLI_HPP___
