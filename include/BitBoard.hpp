#ifndef BITBOARD_HPP
#define BITBOARD_HPP

#include "Cell.hpp"
#include <cstdint>
#include <vector>

class BitBoard {
public:
    static constexpr int MAX_SIDE = 64;

private:
    static constexpr int BITS_PER_UINT64 = 64;
    static constexpr int NUM_SEGMENTS = (MAX_SIDE * MAX_SIDE + BITS_PER_UINT64 - 1) / BITS_PER_UINT64;

    uint64_t board[NUM_SEGMENTS];
    int height;
    int width;

    int toIndex(int row, int col) const {
        return row * width + col;
    }
    bool inBounds(int row, int col) const {
        return row >= 0 && row < height && col >= 0 && col < width;
    }

public:
    BitBoard(int height = 8, int width = 8);

    // Core operations. Out-of-range writes are ignored, reads return false.
    void setBit(int row, int col);
    bool getBit(int row, int col) const;

    int count() const;

    // Set cells in row-major order
    std::vector<Cell> getSetPositions() const;
};

#endif // BITBOARD_HPP
