#include <iostream>

#include "graph_cli.hpp"

int main(int argc, char** argv) {
    return run_graph_cli(argc, argv, std::cout, std::cerr);
}
