#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"

using namespace std;

namespace {

struct Direction {
    int dx, dy;
};

const Direction LEFT = {-1, 0};
const Direction RIGHT = {1, 0};
const Direction UP = {0, -1};
const Direction DOWN = {0, 1};

} // namespace

Board::Board(int rows, int columns, bool pins_enabled)
    : rows(rows), columns(columns), pins_enabled(pins_enabled), exit_width(1) {
    if (rows <= 0 || columns <= 0) {
        throw invalid_argument("Board dimensions must be positive");
    }
}

void Board::add_block(const Block& block) {
    if (block.get_width() <= 0 || block.get_height() <= 0) {
        throw invalid_argument("Block " + to_string(block.get_id()) + " must have a positive size");
    }
    if (get_block(block.get_id()) != nullptr) {
        throw invalid_argument("Duplicate block id " + to_string(block.get_id()));
    }
    blocks.push_back(block);
}

void Board::set_exit_width(int width) {
    if (width <= 0) {
        throw invalid_argument("Exit width must be positive");
    }
    exit_width = width;
}

const Block* Board::get_block(int id) const {
    for (const Block& block : blocks) {
        if (block.get_id() == id) return &block;
    }
    return nullptr;
}

Block& Board::find_block(int id) {
    for (Block& block : blocks) {
        if (block.get_id() == id) return block;
    }
    throw out_of_range("No block with id " + to_string(id));
}

string Board::get_hash() const {
    vector<const Block*> sorted;
    sorted.reserve(blocks.size());
    for (const Block& block : blocks) sorted.push_back(&block);
    stable_sort(sorted.begin(), sorted.end(), [](const Block* a, const Block* b) {
        return a->get_id() < b->get_id();
    });

    string hash;
    for (const Block* block : sorted) {
        hash += to_string(block->get_id()) + ":" + to_string(block->get_x()) + "," + to_string(block->get_y()) + ";";
    }
    return hash;
}

bool Board::is_winning() const {
    if (!winning_block_id || !winning_x || !winning_y) return false;
    const Block* winner = get_block(*winning_block_id);
    if (winner == nullptr) return false;
    return winner->get_x() == *winning_x && winner->get_y() == *winning_y;
}

bool Board::is_winning_block(const Block& block) const {
    return winning_block_id && block.get_id() == *winning_block_id;
}

bool Board::is_exit_move(const Block& block, int new_x, int new_y) const {
    return is_winning_block(block) && winning_x && winning_y &&
           new_x == *winning_x && new_y == *winning_y && exit_width >= block.get_width();
}

bool Board::fits_inside(int x, int y, int width, int height) const {
    return x >= 0 && y >= 0 && x + width <= columns && y + height <= rows;
}

bool Board::is_area_free(int x, int y, int width, int height, const Block& moving_block) const {
    if (x < 0 || y < 0) return false;

    // The winning block may hang over the right edge only on the exact exit
    // cell, and over the bottom edge anywhere on the exit row.
    bool at_exit = winning_x && winning_y && x == *winning_x && y == *winning_y;
    bool on_exit_row = winning_y && y == *winning_y;
    if (x + width > columns && !(at_exit && is_winning_block(moving_block))) return false;
    if (y + height > rows && !(on_exit_row && is_winning_block(moving_block))) return false;

    for (const Block& block : blocks) {
        if (block.get_id() == moving_block.get_id()) continue;
        if (block.overlaps(x, y, width, height)) return false;
    }
    return true;
}

vector<BlockMove> Board::get_possible_moves(const Block& block) const {
    vector<Direction> directions;
    if (pins_enabled && block.get_width() > block.get_height()) {
        directions = {LEFT, RIGHT};
    } else if (pins_enabled && block.get_height() > block.get_width()) {
        directions = {UP, DOWN};
    } else {
        directions = {LEFT, RIGHT, UP, DOWN};
    }

    vector<BlockMove> moves;
    for (const Direction& dir : directions) {
        int new_x = block.get_x() + dir.dx;
        int new_y = block.get_y() + dir.dy;
        if (!is_area_free(new_x, new_y, block.get_width(), block.get_height(), block)) continue;

        if (is_exit_move(block, new_x, new_y) ||
            fits_inside(new_x, new_y, block.get_width(), block.get_height())) {
            moves.push_back({block.get_id(), dir.dx, dir.dy});
        }
    }
    return moves;
}

vector<Board> Board::get_next_states() const {
    vector<Board> states;
    for (const Block& block : blocks) {
        for (const BlockMove& move : get_possible_moves(block)) {
            Board next = clone();
            next.find_block(move.block_id).move_by(move.dx, move.dy);
            states.push_back(std::move(next));
        }
    }
    return states;
}
