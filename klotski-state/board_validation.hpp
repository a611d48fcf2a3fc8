#ifndef __BOARD_VALIDATION_HPP___
#define __BOARD_VALIDATION_HPP___

#include <string>
#include <vector>

#include "board.hpp"

/**
 * @file board_validation.hpp
 * @brief Puzzle-level sanity checks run before a board is handed to the graph builder.
 *
 * Board itself only rejects structurally impossible input. Overlapping or
 * out-of-bounds blocks and a dangling winning block id are reported here so
 * that callers can show every problem at once.
 */

/**
 * @brief Collect every configuration error on the board.
 *
 * @param board Board to check.
 * @return Human-readable error messages, empty if the board is valid.
 */
std::vector<std::string> validate_board(const Board& board);

/**
 * @brief Render validation errors as a single "Errors:" block, one per line.
 */
std::string format_validation_errors(const std::vector<std::string>& errors);

#endif // __BOARD_VALIDATION_HPP___
