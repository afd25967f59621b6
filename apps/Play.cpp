#include "Minesweeper.hpp"
#include "MinesweeperAI.hpp"
#include "GameUtils.hpp"
#include "KnowledgeBase.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <chrono>

static bool presetFromName(const std::string& name, Minesweeper::Config& config) {
    if (name == "beginner") {
        config = Minesweeper::Config::beginner();
    } else if (name == "intermediate") {
        config = Minesweeper::Config::intermediate();
    } else if (name == "expert") {
        config = Minesweeper::Config::expert();
    } else {
        return false;
    }
    return true;
}

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [beginner|intermediate|expert] [seed] [row,col]" << std::endl;
}

int main(int argc, char* argv[]) {
    Minesweeper::Config boardConfig = Minesweeper::Config::beginner();

    if (argc > 1 && !presetFromName(argv[1], boardConfig)) {
        printUsage(argv[0]);
        return 1;
    }
    if (argc > 2) {
        try {
            boardConfig.seed = static_cast<uint32_t>(std::stoul(argv[2]));
            boardConfig.useSeed = true;
        } catch (const std::invalid_argument&) {
            std::cerr << "Invalid seed: " << argv[2] << std::endl;
            return 1;
        } catch (const std::out_of_range&) {
            std::cerr << "Seed out of range: " << argv[2] << std::endl;
            return 1;
        }
    }

    std::cout << "Playing Minesweeper " << boardConfig.height << "x" << boardConfig.width
              << " with " << boardConfig.mines << " mines..." << std::endl;

    Minesweeper board(boardConfig);

    // Optional opening move, played before the AI takes over
    std::optional<Cell> opening;
    if (argc > 3) {
        opening = GameUtils::parseCell(argv[3]);
        if (!opening || !board.inBounds(*opening)) {
            std::cerr << "Invalid opening cell: " << argv[3] << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    MinesweeperAI::Config aiConfig(boardConfig.height, boardConfig.width);
    aiConfig.seed = boardConfig.seed + 1;
    aiConfig.useSeed = boardConfig.useSeed;
    MinesweeperAI ai(aiConfig);

    auto t0 = std::chrono::steady_clock::now();
    GameUtils::GameResult result;
    try {
        result = GameUtils::playGame(board, ai, true, opening);
    } catch (const ContradictionError& e) {
        std::cerr << "Knowledge base became inconsistent: " << e.what() << std::endl;
        std::cerr << ai.getKnowledge().toString();
        return 2;
    }
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    std::cout << "\nMine layout:\n";
    GameUtils::printMines(board);

    if (result.hitMine) {
        std::cout << "Lost: stepped on " << GameUtils::displayCell(result.lastMove) << "\n";
    } else if (result.won) {
        std::cout << "Won: all " << board.getMineCount() << " mines flagged\n";
    }
    std::cout << "Total time: " << elapsed << "s\n";

    return result.won ? 0 : 3;
}
