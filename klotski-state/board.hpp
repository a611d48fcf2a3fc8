/**
 * @file board.hpp
 * @brief Klotski board configuration and successor generation.
 *
 * This header declares the Board class used by the graph builder, the
 * command-line driver and the file helpers.
 */

#ifndef __BOARD_HPP___
#define __BOARD_HPP___

#include <optional>
#include <string>
#include <vector>

#include "block.hpp"

/**
 * @brief A single unit-step move of one block.
 */
struct BlockMove {
    int block_id;
    int dx;
    int dy;
};

/**
 * @brief A complete puzzle configuration.
 *
 * The board stores its grid extent, the blocks in insertion order and the
 * optional winning metadata (block id, target position, exit width). Boards
 * are values: copying one deep-copies every block in the same order, and
 * successor states are always produced on a fresh copy.
 */
class Board {

private:
    int rows;
    int columns;
    bool pins_enabled;
    std::vector<Block> blocks;
    std::optional<int> winning_block_id;
    std::optional<int> winning_x;
    std::optional<int> winning_y;
    int exit_width;

    bool is_winning_block(const Block& block) const;
    bool is_exit_move(const Block& block, int new_x, int new_y) const;
    bool fits_inside(int x, int y, int width, int height) const;
    Block& find_block(int id);
public:
    /**
     * @brief Construct an empty board.
     *
     * @param rows Number of grid rows (must be positive).
     * @param columns Number of grid columns (must be positive).
     * @param pins_enabled Restrict non-square blocks to their long axis.
     * @throws std::invalid_argument if rows or columns is not positive.
     */
    Board(int rows, int columns, bool pins_enabled);
    ~Board() = default;

    Board(const Board& other) = default;
    Board& operator=(const Board& other) = default;
    Board(Board&& other) = default;
    Board& operator=(Board&& other) = default;

    /**
     * @brief Append a block; insertion order is kept for the lifetime of the board.
     *
     * @throws std::invalid_argument on a non-positive size or an id already on the board.
     */
    void add_block(const Block& block);

    void set_winning_block_id(int id) { winning_block_id = id; }
    void set_winning_position(int x, int y) {
        winning_x = x;
        winning_y = y;
    }

    /**
     * @brief Set how many columns wide the exit opening is (default 1).
     *
     * @throws std::invalid_argument if width is not positive.
     */
    void set_exit_width(int width);

    int get_rows() const { return rows; }
    int get_columns() const { return columns; }
    bool get_pins_enabled() const { return pins_enabled; }
    const std::vector<Block>& get_blocks() const { return blocks; }
    const std::optional<int>& get_winning_block_id() const { return winning_block_id; }
    const std::optional<int>& get_winning_x() const { return winning_x; }
    const std::optional<int>& get_winning_y() const { return winning_y; }
    int get_exit_width() const { return exit_width; }

    /**
     * @brief Look up a block by id.
     *
     * @return Pointer into this board's block list, or nullptr if absent.
     */
    const Block* get_block(int id) const;

    /**
     * @brief Deep copy of the board (blocks copied in the same order).
     */
    Board clone() const { return *this; }

    /**
     * @brief Canonical state signature.
     *
     * Blocks are sorted by id and rendered as "{id}:{x},{y};". Two boards
     * describe the same state iff their signatures are equal.
     */
    std::string get_hash() const;

    /**
     * @brief True iff the winning block sits exactly on the winning position.
     *
     * Returns false when any part of the winning metadata is missing or the
     * winning block is not on the board.
     */
    bool is_winning() const;

    /**
     * @brief Check whether `moving_block` could occupy a `width x height` area at (x, y).
     *
     * The winning block may protrude past the right edge when the area sits
     * exactly on the winning position, and past the bottom edge when it is on
     * the winning row. The moving block never collides with itself.
     */
    bool is_area_free(int x, int y, int width, int height, const Block& moving_block) const;

    /**
     * @brief Legal unit-step moves of one block.
     *
     * With pins enabled a wide block moves only horizontally and a tall block
     * only vertically; square blocks, or any block with pins disabled, try
     * left, right, up, down in that order.
     *
     * @return Accepted moves in direction order.
     */
    std::vector<BlockMove> get_possible_moves(const Block& block) const;

    /**
     * @brief Generate all successor boards, one per legal move of every block.
     *
     * Each successor is a fresh copy that differs from this board in exactly
     * one block moved by one cell. Order: blocks in insertion order, then
     * moves in direction order.
     *
     * @return Vector of successor `Board` instances.
     */
    std::vector<Board> get_next_states() const;
};

#endif // __BOARD_HPP___
