/**
 * @file block.hpp
 * @brief Rectangular Klotski piece: fixed shape, mutable top-left position.
 */

#ifndef __BLOCK_HPP___
#define __BLOCK_HPP___

/**
 * @brief A rectangular puzzle piece occupying `width x height` grid cells.
 *
 * Blocks are plain values. A Board copies its blocks whenever it is copied,
 * so two boards never share a Block.
 */
class Block {

private:
    int id;
    int width;
    int height;
    int x;
    int y;

public:
    Block(int id, int width, int height, int x, int y)
        : id(id), width(width), height(height), x(x), y(y) {}

    int get_id() const { return id; }
    int get_width() const { return width; }
    int get_height() const { return height; }
    int get_x() const { return x; }
    int get_y() const { return y; }

    /**
     * @brief Shift the block by (dx, dy) grid cells. No legality checks.
     */
    void move_by(int dx, int dy) {
        x += dx;
        y += dy;
    }

    /**
     * @brief Strict rectangle overlap test against a `w x h` area at (ax, ay).
     */
    bool overlaps(int ax, int ay, int w, int h) const {
        return ax < x + width && ax + w > x && ay < y + height && ay + h > y;
    }
};

#endif // __BLOCK_HPP___
