#ifndef __GRAPH_API_HPP___
#define __GRAPH_API_HPP___

/**
 * @file graph_api.hpp
 * @brief C entry points of the klotski_graph_api shared library.
 */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Build the reachable-state graph for the board stored in `input_file`.
 *
 * Counts are 64-bit: exhaustive enumeration can exceed INT_MAX states.
 *
 * @return 1 if a winning state is reachable, 0 otherwise, -1 on null
 *         arguments, -2 if the board fails validation, -3 on read errors.
 */
int klotski_graph_run_instance(
    const char* input_file,
    double* out_time_ms,
    long long* out_nodes,
    long long* out_edges,
    long long* out_winning_nodes
);

#ifdef __cplusplus
}
#endif

#endif // __GRAPH_API_HPP___
