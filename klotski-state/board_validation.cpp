#include <string>
#include <vector>

#include "board.hpp"
#include "board_validation.hpp"

using namespace std;

vector<string> validate_board(const Board& board) {
    vector<string> errors;
    const vector<Block>& blocks = board.get_blocks();
    int rows = board.get_rows();
    int columns = board.get_columns();

    for (const Block& block : blocks) {
        string id = to_string(block.get_id());
        string size = to_string(block.get_width()) + "x" + to_string(block.get_height());
        if (block.get_x() < 0 || block.get_y() < 0) {
            errors.push_back("Block " + id + " has negative position (" + to_string(block.get_x()) + ", " +
                             to_string(block.get_y()) + ").");
        }
        if (block.get_x() + block.get_width() > columns || block.get_y() + block.get_height() > rows) {
            errors.push_back("Block " + id + " does not fit inside the board (pos " + to_string(block.get_x()) + "," +
                             to_string(block.get_y()) + ", size " + size + ").");
        }
    }

    for (size_t i = 0; i < blocks.size(); ++i) {
        for (size_t j = i + 1; j < blocks.size(); ++j) {
            const Block& a = blocks[i];
            const Block& b = blocks[j];
            if (b.overlaps(a.get_x(), a.get_y(), a.get_width(), a.get_height())) {
                errors.push_back("Blocks " + to_string(a.get_id()) + " and " + to_string(b.get_id()) + " overlap!");
            }
        }
    }

    if (board.get_winning_block_id()) {
        int winning_id = *board.get_winning_block_id();
        if (board.get_block(winning_id) == nullptr) {
            errors.push_back("Winning block ID " + to_string(winning_id) + " does not exist.");
        } else if (board.get_winning_x() && board.get_winning_y()) {
            int wx = *board.get_winning_x();
            int wy = *board.get_winning_y();
            if (wx < 0 || wy < 0 || wx + board.get_exit_width() > columns) {
                errors.push_back("Winning exit position is outside the board.");
            }
        }
    }

    return errors;
}

string format_validation_errors(const vector<string>& errors) {
    string message = "Errors:";
    for (const string& error : errors) {
        message += "\n" + error;
    }
    return message;
}
