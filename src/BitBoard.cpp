#include "BitBoard.hpp"
#include <cstring>  // for memset

BitBoard::BitBoard(int height, int width) : height(height), width(width) {
    std::memset(board, 0, sizeof(board));
}

void BitBoard::setBit(int row, int col) {
    if (!inBounds(row, col)) {
        return;
    }

    int index = toIndex(row, col);
    board[index / BITS_PER_UINT64] |= (1ULL << (index % BITS_PER_UINT64));
}

bool BitBoard::getBit(int row, int col) const {
    if (!inBounds(row, col)) {
        return false;
    }

    int index = toIndex(row, col);
    return (board[index / BITS_PER_UINT64] >> (index % BITS_PER_UINT64)) & 1;
}

int BitBoard::count() const {
    int total = 0;
    for (int i = 0; i < NUM_SEGMENTS; i++) {
        total += __builtin_popcountll(board[i]);
    }
    return total;
}

std::vector<Cell> BitBoard::getSetPositions() const {
    std::vector<Cell> positions;
    for (int i = 0; i < NUM_SEGMENTS; i++) {
        uint64_t bits = board[i];
        while (bits) {
            int index = i * BITS_PER_UINT64 + __builtin_ctzll(bits);
            positions.emplace_back(index / width, index % width);
            bits &= bits - 1;
        }
    }
    return positions;
}
