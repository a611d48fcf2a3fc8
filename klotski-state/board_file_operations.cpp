#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"

using namespace std;

namespace {

int read_int(istream& in, const char* field) {
    int value;
    if (!(in >> value)) {
        throw invalid_argument(string("Missing or malformed field: ") + field);
    }
    return value;
}

} // namespace

Board read_board(istream& in) {
    int rows = read_int(in, "rows");
    int columns = read_int(in, "columns");
    int pins = read_int(in, "pins_enabled");
    Board board(rows, columns, pins != 0);

    int winning_id = read_int(in, "winning_block_id");
    int winning_x = read_int(in, "winning_x");
    int winning_y = read_int(in, "winning_y");
    board.set_exit_width(read_int(in, "exit_width"));
    if (winning_id >= 0) {
        board.set_winning_block_id(winning_id);
        board.set_winning_position(winning_x, winning_y);
    }

    int count = read_int(in, "block_count");
    if (count < 0) {
        throw invalid_argument("block_count cannot be negative");
    }
    for (int i = 0; i < count; ++i) {
        int id = read_int(in, "block id");
        int width = read_int(in, "block width");
        int height = read_int(in, "block height");
        int x = read_int(in, "block x");
        int y = read_int(in, "block y");
        board.add_block(Block(id, width, height, x, y));
    }
    return board;
}

Board read_board_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    return read_board(infile);
}

void write_board(const Board& board, ostream& out) {
    out << board.get_rows() << " " << board.get_columns() << " " << (board.get_pins_enabled() ? 1 : 0) << "\n";
    if (board.get_winning_block_id()) {
        out << *board.get_winning_block_id() << " " << board.get_winning_x().value_or(0) << " "
            << board.get_winning_y().value_or(0);
    } else {
        out << "-1 0 0";
    }
    out << " " << board.get_exit_width() << "\n";
    out << board.get_blocks().size() << "\n";
    for (const Block& block : board.get_blocks()) {
        out << block.get_id() << " " << block.get_width() << " " << block.get_height() << " "
            << block.get_x() << " " << block.get_y() << "\n";
    }
}

void write_board_to_file(const Board& board, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    write_board(board, outfile);
}

Board default_board() {
    Board board(4, 4, true);
    board.set_winning_block_id(1);
    board.set_winning_position(2, 3);
    board.set_exit_width(2);
    board.add_block(Block(1, 2, 1, 0, 0));
    return board;
}
