#ifndef MINESWEEPER_HPP
#define MINESWEEPER_HPP

#include "BitBoard.hpp"
#include "Cell.hpp"
#include <cstdint>
#include <set>
#include <vector>

// The puzzle board: mine layout, neighbour counts and flags.
class Minesweeper {
public:
    struct Config {
        int height = 8;
        int width = 8;
        int mines = 8;
        uint32_t seed = 0;
        bool useSeed = false;  // Otherwise seeded from std::random_device

        Config() {}
        Config(int height, int width, int mines) : height(height), width(width), mines(mines) {}

        // Presets
        static Config beginner() { return Config(8, 8, 8); }
        static Config intermediate() { return Config(16, 16, 40); }
        static Config expert() { return Config(16, 30, 99); }
    };

    // Places config.mines mines uniformly at random.
    // Throws std::invalid_argument on an impossible configuration.
    explicit Minesweeper(const Config& config = Config());

    // Fixed layout. Throws std::invalid_argument for cells off the board.
    Minesweeper(int height, int width, const std::vector<Cell>& mines);

    bool isMine(const Cell& cell) const { return layout.getBit(cell.row, cell.col); }
    bool inBounds(const Cell& cell) const;

    // Mines among the up to 8 neighbours, not counting the cell itself
    int nearbyMines(const Cell& cell) const;

    // Player flags a cell as a mine
    void markFound(const Cell& cell);
    bool won() const { return minesFound == mines; }

    int getHeight() const { return height; }
    int getWidth() const { return width; }
    int getMineCount() const { return static_cast<int>(mines.size()); }
    const std::set<Cell>& getMines() const { return mines; }
    const std::set<Cell>& getMinesFound() const { return minesFound; }

private:
    static void validate(int height, int width, int mineCount);

    int height;
    int width;
    BitBoard layout;
    std::set<Cell> mines;
    std::set<Cell> minesFound;
};

#endif // MINESWEEPER_HPP
