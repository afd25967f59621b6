#include "Minesweeper.hpp"
#include "GameUtils.hpp"
#include <random>
#include <stdexcept>
#include <string>

void Minesweeper::validate(int height, int width, int mineCount) {
    if (height <= 0 || width <= 0) {
        throw std::invalid_argument("board dimensions must be positive");
    }
    if (height > BitBoard::MAX_SIDE || width > BitBoard::MAX_SIDE) {
        throw std::invalid_argument("board side exceeds " + std::to_string(BitBoard::MAX_SIDE));
    }
    if (mineCount < 0 || mineCount > height * width) {
        throw std::invalid_argument("cannot place " + std::to_string(mineCount) + " mines on a " +
                                    std::to_string(height) + "x" + std::to_string(width) + " board");
    }
}

Minesweeper::Minesweeper(const Config& config)
    : height(config.height), width(config.width), layout(config.height, config.width) {
    validate(config.height, config.width, config.mines);

    std::mt19937 rng(config.useSeed ? config.seed : std::random_device{}());
    std::uniform_int_distribution<int> rowDist(0, height - 1);
    std::uniform_int_distribution<int> colDist(0, width - 1);

    // Rejection sampling; fine for any density a real game uses
    while (layout.count() != config.mines) {
        layout.setBit(rowDist(rng), colDist(rng));
    }

    std::vector<Cell> placed = layout.getSetPositions();
    mines.insert(placed.begin(), placed.end());
}

Minesweeper::Minesweeper(int height, int width, const std::vector<Cell>& mineCells)
    : height(height), width(width), layout(height, width) {
    validate(height, width, 0);

    for (const auto& cell : mineCells) {
        if (!inBounds(cell)) {
            throw std::invalid_argument("mine " + GameUtils::displayCell(cell) + " is off the board");
        }
        layout.setBit(cell.row, cell.col);
    }

    // Listing a cell twice places one mine
    std::vector<Cell> placed = layout.getSetPositions();
    mines.insert(placed.begin(), placed.end());
}

bool Minesweeper::inBounds(const Cell& cell) const {
    return cell.row >= 0 && cell.row < height && cell.col >= 0 && cell.col < width;
}

int Minesweeper::nearbyMines(const Cell& cell) const {
    int count = 0;
    for (int row = cell.row - 1; row <= cell.row + 1; row++) {
        for (int col = cell.col - 1; col <= cell.col + 1; col++) {
            if (row == cell.row && col == cell.col) continue;
            // getBit is false off the board
            if (layout.getBit(row, col)) {
                count++;
            }
        }
    }
    return count;
}

void Minesweeper::markFound(const Cell& cell) {
    if (inBounds(cell)) {
        minesFound.insert(cell);
    }
}
