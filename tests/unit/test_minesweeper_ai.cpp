#include <gtest/gtest.h>
#include "MinesweeperAI.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

// Replays a fixed list of indices so random moves are reproducible
class ScriptedRandomSource : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<int> script) : script_(std::move(script)) {}

    int nextIndex(int bound) override {
        lastBound = bound;
        int value = script_.empty() ? 0 : script_[next_++ % script_.size()];
        return std::min(value, bound - 1);
    }

    int lastBound = 0;

private:
    std::vector<int> script_;
    size_t next_ = 0;
};

TEST(MinesweeperAITest, DefaultConfig) {
    MinesweeperAI::Config config;
    EXPECT_EQ(config.height, 8);
    EXPECT_EQ(config.width, 8);
    EXPECT_FALSE(config.useSeed);
    EXPECT_EQ(config.random, nullptr);

    MinesweeperAI ai;
    EXPECT_EQ(ai.getHeight(), 8);
    EXPECT_EQ(ai.getWidth(), 8);
    EXPECT_TRUE(ai.getMovesMade().empty());
}

TEST(MinesweeperAITest, ObservedCellIsSafeAndPlayed) {
    MinesweeperAI ai(8, 8);
    ai.addKnowledge(Cell(3, 3), 2);

    EXPECT_TRUE(ai.getMovesMade().count(Cell(3, 3)));
    EXPECT_TRUE(ai.getKnownSafes().count(Cell(3, 3)));
    EXPECT_TRUE(ai.getKnowledge().contains(Sentence(
        {Cell(2, 2), Cell(2, 3), Cell(2, 4), Cell(3, 2), Cell(3, 4), Cell(4, 2), Cell(4, 3), Cell(4, 4)}, 2)));
}

TEST(MinesweeperAITest, NeighborsClippedAtCorner) {
    MinesweeperAI ai(3, 3);

    auto corner = ai.neighbors(Cell(0, 0));
    EXPECT_EQ(corner.size(), 3u);

    auto center = ai.neighbors(Cell(1, 1));
    EXPECT_EQ(center.size(), 8u);
    EXPECT_EQ(std::count(center.begin(), center.end(), Cell(1, 1)), 0);
}

TEST(MinesweeperAITest, OneByThreeRowResolvesMine) {
    // Single mine at (0,2): (0,0) sees none, (0,1) sees one
    MinesweeperAI ai(1, 3);
    ai.addKnowledge(Cell(0, 0), 0);

    EXPECT_TRUE(ai.getKnownSafes().count(Cell(0, 1)));
    ASSERT_TRUE(ai.makeSafeMove().has_value());
    EXPECT_EQ(*ai.makeSafeMove(), Cell(0, 1));

    ai.addKnowledge(Cell(0, 1), 1);
    EXPECT_TRUE(ai.getKnownMines().count(Cell(0, 2)));
    EXPECT_FALSE(ai.makeSafeMove().has_value());
}

TEST(MinesweeperAITest, CountOneNextToSingleNeighbourMarksMine) {
    MinesweeperAI ai(1, 3);
    ai.addKnowledge(Cell(0, 0), 1);

    EXPECT_TRUE(ai.getKnownMines().count(Cell(0, 1)));
    EXPECT_EQ(ai.getKnowledge().size(), 0u);
}

TEST(MinesweeperAITest, ZeroCountOpensAllNeighbours) {
    MinesweeperAI ai(4, 4);
    ai.addKnowledge(Cell(1, 1), 0);

    for (const auto& neighbor : ai.neighbors(Cell(1, 1))) {
        EXPECT_TRUE(ai.getKnownSafes().count(neighbor));
    }
    auto move = ai.makeSafeMove();
    ASSERT_TRUE(move.has_value());
    EXPECT_FALSE(ai.getMovesMade().count(*move));
}

TEST(MinesweeperAITest, KnownMinesNotDoubleCounted) {
    // Mine at (0,1) of a 1x4 row. After learning it, (0,2) reports 1 and
    // the only other neighbour (0,3) must be safe.
    MinesweeperAI ai(1, 4);
    ai.addKnowledge(Cell(0, 0), 1);
    ASSERT_TRUE(ai.getKnownMines().count(Cell(0, 1)));

    ai.addKnowledge(Cell(0, 2), 1);

    EXPECT_TRUE(ai.getKnownSafes().count(Cell(0, 3)));
    EXPECT_FALSE(ai.getKnownMines().count(Cell(0, 3)));
}

TEST(MinesweeperAITest, SafeMoveSkipsPlayedCells) {
    MinesweeperAI ai(1, 2);
    ai.addKnowledge(Cell(0, 0), 0);
    ai.addKnowledge(Cell(0, 1), 0);

    EXPECT_FALSE(ai.makeSafeMove().has_value());
}

TEST(MinesweeperAITest, RandomMoveAvoidsPlayedAndMines) {
    MinesweeperAI ai(1, 3);
    ai.addKnowledge(Cell(0, 0), 1);  // (0,1) is a mine

    for (int i = 0; i < 20; i++) {
        auto move = ai.makeRandomMove();
        ASSERT_TRUE(move.has_value());
        EXPECT_EQ(*move, Cell(0, 2));
    }
}

TEST(MinesweeperAITest, RandomMoveUsesInjectedSource) {
    ScriptedRandomSource source({3});
    MinesweeperAI::Config config(2, 3);
    config.random = &source;
    MinesweeperAI ai(config);

    auto move = ai.makeRandomMove();
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(source.lastBound, 6);
    EXPECT_EQ(*move, Cell(1, 0));  // Fourth cell in row-major order
    EXPECT_EQ(ai.getRandomMoveCount(), 1);
}

TEST(MinesweeperAITest, RandomMoveRejectsIndexPastEnd) {
    class PastEnd : public RandomSource {
    public:
        int nextIndex(int bound) override { return bound; }
    } pastEnd;

    MinesweeperAI::Config config(2, 2);
    config.random = &pastEnd;
    MinesweeperAI ai(config);

    EXPECT_THROW(ai.makeRandomMove(), std::out_of_range);
    EXPECT_EQ(ai.getRandomMoveCount(), 0);
}

TEST(MinesweeperAITest, RandomMoveCoversLastRowAndColumn) {
    ScriptedRandomSource source({8});
    MinesweeperAI::Config config(3, 3);
    config.random = &source;
    MinesweeperAI ai(config);

    auto move = ai.makeRandomMove(3, 3);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(*move, Cell(2, 2));
}

TEST(MinesweeperAITest, RandomMoveWithSmallerExtent) {
    ScriptedRandomSource source({100});
    MinesweeperAI::Config config(5, 5);
    config.random = &source;
    MinesweeperAI ai(config);

    auto move = ai.makeRandomMove(2, 2);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(source.lastBound, 4);
    EXPECT_EQ(*move, Cell(1, 1));
}

TEST(MinesweeperAITest, SeededAIsAreReproducible) {
    MinesweeperAI::Config config(8, 8);
    config.seed = 42;
    config.useSeed = true;
    MinesweeperAI first(config);
    MinesweeperAI second(config);

    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(first.makeRandomMove(), second.makeRandomMove());
    }
}

TEST(MinesweeperAITest, FallbackExhaustion) {
    MinesweeperAI ai(1, 3);
    ai.addKnowledge(Cell(0, 0), 1);  // (0,1) mine
    ai.addKnowledge(Cell(0, 2), 1);

    EXPECT_FALSE(ai.makeSafeMove().has_value());
    EXPECT_FALSE(ai.makeRandomMove().has_value());
    EXPECT_FALSE(ai.makeMove().has_value());
}

TEST(MinesweeperAITest, MakeMovePrefersSafe) {
    ScriptedRandomSource source({0});
    MinesweeperAI::Config config(1, 3);
    config.random = &source;
    MinesweeperAI ai(config);
    ai.addKnowledge(Cell(0, 2), 0);

    auto move = ai.makeMove();
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(*move, Cell(0, 1));
    EXPECT_EQ(ai.getRandomMoveCount(), 0);
}

TEST(MinesweeperAITest, OutOfRangeCellRejected) {
    MinesweeperAI ai(4, 4);

    EXPECT_THROW(ai.addKnowledge(Cell(4, 0), 0), std::out_of_range);
    EXPECT_THROW(ai.addKnowledge(Cell(0, -1), 0), std::out_of_range);
    EXPECT_TRUE(ai.getMovesMade().empty());
    EXPECT_EQ(ai.getKnowledge().size(), 0u);
}

TEST(MinesweeperAITest, NegativeCountRejected) {
    MinesweeperAI ai(4, 4);
    EXPECT_THROW(ai.addKnowledge(Cell(1, 1), -1), std::invalid_argument);
}

TEST(MinesweeperAITest, ImpossibleCountIsContradiction) {
    MinesweeperAI ai(1, 3);
    EXPECT_THROW(ai.addKnowledge(Cell(0, 0), 2), ContradictionError);
}

TEST(MinesweeperAITest, RevealingKnownMineIsContradiction) {
    MinesweeperAI ai(1, 3);
    ai.addKnowledge(Cell(0, 0), 1);
    EXPECT_THROW(ai.addKnowledge(Cell(0, 1), 1), ContradictionError);
    EXPECT_FALSE(ai.getMovesMade().count(Cell(0, 1)));
}

TEST(MinesweeperAITest, InvalidDimensionsRejected) {
    EXPECT_THROW(MinesweeperAI(0, 5), std::invalid_argument);
    EXPECT_THROW(MinesweeperAI(5, -1), std::invalid_argument);
}

TEST(MinesweeperAITest, ResetForgetsEverything) {
    MinesweeperAI ai(3, 3);
    ai.addKnowledge(Cell(1, 1), 0);
    ai.makeRandomMove();
    ai.reset();

    EXPECT_TRUE(ai.getMovesMade().empty());
    EXPECT_TRUE(ai.getKnownSafes().empty());
    EXPECT_EQ(ai.getRandomMoveCount(), 0);
}
