#ifndef MINESWEEPERAI_HPP
#define MINESWEEPERAI_HPP

#include "Cell.hpp"
#include "KnowledgeBase.hpp"
#include "RandomSource.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <vector>

// Minesweeper player. Feeds each observation into its knowledge base and
// proposes the next cell to reveal.
class MinesweeperAI {
public:
    struct Config {
        int height = 8;
        int width = 8;
        uint32_t seed = 0;               // Used when random is null and useSeed is set
        bool useSeed = false;            // Otherwise seeded from std::random_device
        RandomSource* random = nullptr;  // Non-owning; overrides the internal source

        Config() {}
        Config(int height, int width) : height(height), width(width) {}
    };

    explicit MinesweeperAI(const Config& config = Config());
    MinesweeperAI(int height, int width);

    // Called once per revealed cell with the number of mines around it.
    // Throws std::out_of_range for cells off the board and std::invalid_argument
    // for a negative count. Propagates the knowledge base to a fixed point.
    void addKnowledge(const Cell& cell, int count);

    // A known-safe cell that has not been played yet, if any.
    std::optional<Cell> makeSafeMove() const;

    // Uniform choice among cells neither played nor known to be mines.
    std::optional<Cell> makeRandomMove();
    std::optional<Cell> makeRandomMove(int height, int width);

    // Safe move when one exists, otherwise a random move
    std::optional<Cell> makeMove();

    // Neighbours of a cell clipped to the board
    std::vector<Cell> neighbors(const Cell& cell) const;
    bool inBounds(const Cell& cell) const;

    void reset();

    // State access
    const std::set<Cell>& getMovesMade() const { return movesMade_; }
    const KnowledgeBase& getKnowledge() const { return knowledge_; }
    const std::set<Cell>& getKnownMines() const { return knowledge_.getKnownMines(); }
    const std::set<Cell>& getKnownSafes() const { return knowledge_.getKnownSafes(); }
    int getHeight() const { return config_.height; }
    int getWidth() const { return config_.width; }
    int getRandomMoveCount() const { return randomMoves_; }
    const Config& getConfig() const { return config_; }

private:
    RandomSource& random() { return config_.random ? *config_.random : ownRandom_; }

    Config config_;
    KnowledgeBase knowledge_;
    std::set<Cell> movesMade_;
    MersenneRandomSource ownRandom_;
    int randomMoves_ = 0;
};

#endif // MINESWEEPERAI_HPP
