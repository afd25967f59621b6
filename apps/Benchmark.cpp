#include "Minesweeper.hpp"
#include "MinesweeperAI.hpp"
#include "GameUtils.hpp"
#include "KnowledgeBase.hpp"
#include "Profiler.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <chrono>

int main(int argc, char* argv[]) {
    int games = 1000;
    std::string preset = "beginner";
    uint32_t seed = 1;

    try {
        if (argc > 1) games = std::stoi(argv[1]);
        if (argc > 2) preset = argv[2];
        if (argc > 3) seed = static_cast<uint32_t>(std::stoul(argv[3]));
    } catch (const std::invalid_argument&) {
        std::cerr << "Usage: " << argv[0] << " [games] [beginner|intermediate|expert] [seed]" << std::endl;
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Usage: " << argv[0] << " [games] [beginner|intermediate|expert] [seed]" << std::endl;
        return 1;
    }

    Minesweeper::Config boardConfig;
    if (preset == "beginner") {
        boardConfig = Minesweeper::Config::beginner();
    } else if (preset == "intermediate") {
        boardConfig = Minesweeper::Config::intermediate();
    } else if (preset == "expert") {
        boardConfig = Minesweeper::Config::expert();
    } else {
        std::cerr << "Unknown preset: " << preset << std::endl;
        return 1;
    }
    if (games <= 0) {
        std::cerr << "Number of games must be positive" << std::endl;
        return 1;
    }

    std::cout << "Benchmarking " << GameUtils::formatWithCommas(games) << " " << preset << " games ("
              << boardConfig.height << "x" << boardConfig.width << ", " << boardConfig.mines << " mines)..." << std::endl;

    int wins = 0;
    int losses = 0;
    int inconsistent = 0;
    long long totalMoves = 0;
    long long totalRandomMoves = 0;

    auto t0 = std::chrono::steady_clock::now();
    for (int i = 0; i < games; i++) {
        boardConfig.seed = seed + 2 * i;
        boardConfig.useSeed = true;
        Minesweeper board(boardConfig);

        MinesweeperAI::Config aiConfig(boardConfig.height, boardConfig.width);
        aiConfig.seed = seed + 2 * i + 1;
        aiConfig.useSeed = true;
        MinesweeperAI ai(aiConfig);

        try {
            GameUtils::GameResult result = GameUtils::playGame(board, ai);
            if (result.won) {
                wins++;
            } else {
                losses++;
            }
            totalMoves += result.moves;
            totalRandomMoves += result.randomMoves;
        } catch (const ContradictionError& e) {
            std::cerr << "Game " << i << ": " << e.what() << std::endl;
            inconsistent++;
        }
    }
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Wins:         " << GameUtils::formatWithCommas(wins)
              << " (" << (100.0 * wins / games) << "%)\n";
    std::cout << "Losses:       " << GameUtils::formatWithCommas(losses) << "\n";
    if (inconsistent > 0) {
        std::cout << "Inconsistent: " << inconsistent << "\n";
    }
    std::cout << "Avg moves:    " << (static_cast<double>(totalMoves) / games) << "\n";
    std::cout << "Avg random:   " << (static_cast<double>(totalRandomMoves) / games) << "\n";
    std::cout << "Total time:   " << elapsed << "s (" << (1000.0 * elapsed / games) << " ms/game)\n";

    Profiler::instance().printReport();
    return inconsistent > 0 ? 2 : 0;
}
