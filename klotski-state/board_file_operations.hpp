#ifndef __BOARD_FILE_OPERATIONS_HPP___
#define __BOARD_FILE_OPERATIONS_HPP___

#include <istream>
#include <ostream>
#include <string>

#include "board.hpp"

/**
 * @file board_file_operations.hpp
 * @brief Read/write `Board` values as plain whitespace-separated text.
 *
 * Format:
 *   rows columns pins_enabled
 *   winning_block_id winning_x winning_y exit_width   (id < 0: no winning block)
 *   block_count
 *   id width height x y                               (one line per block)
 */

/**
 * @brief Parse a board from a stream.
 *
 * @throws std::invalid_argument on truncated or inconsistent input.
 */
Board read_board(std::istream& in);

/**
 * @brief Read a `Board` from a plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @return Constructed `Board` instance.
 */
Board read_board_from_file(const std::string& filename);

void write_board(const Board& board, std::ostream& out);

/**
 * @brief Write a `Board` to a plain-text file.
 *
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_board_to_file(const Board& board, const std::string& filename);

/**
 * @brief Built-in starting configuration: 4x4, pins on, a 2x1 winning block
 * at (0,0) that must reach (2,3) through a 2-wide exit.
 */
Board default_board();

#endif // __BOARD_FILE_OPERATIONS_HPP___
