#include "GameUtils.hpp"
#include "Minesweeper.hpp"
#include "MinesweeperAI.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>

std::optional<Cell> GameUtils::parseCell(const char* text) {
    const char* comma = std::strchr(text, ',');
    if (comma == nullptr || comma == text || comma[1] == '\0') {
        return std::nullopt;
    }

    char* end = nullptr;
    long row = std::strtol(text, &end, 10);
    if (end != comma) {
        return std::nullopt;
    }
    long col = std::strtol(comma + 1, &end, 10);
    if (*end != '\0' || row < 0 || col < 0) {
        return std::nullopt;
    }

    return Cell(static_cast<int>(row), static_cast<int>(col));
}

std::string GameUtils::displayCell(const Cell& cell) {
    return "(" + std::to_string(cell.row) + "," + std::to_string(cell.col) + ")";
}

static void printColumnHeader(int width) {
    std::cout << "    ";
    for (int col = 0; col < width; col++) {
        std::cout << (col % 10) << " ";
    }
    std::cout << "\n";
}

void GameUtils::printMines(const Minesweeper& board) {
    printColumnHeader(board.getWidth());
    for (int row = 0; row < board.getHeight(); row++) {
        std::cout << (row < 10 ? "  " : " ") << row << " ";
        for (int col = 0; col < board.getWidth(); col++) {
            std::cout << (board.isMine(Cell(row, col)) ? "X " : "· ");
        }
        std::cout << "\n";
    }
}

void GameUtils::printBoard(const Minesweeper& board, const MinesweeperAI& ai) {
    // Revealed cells show their count, known mines a flag, known but
    // unplayed safes a circle, anything else a dot.
    printColumnHeader(board.getWidth());
    for (int row = 0; row < board.getHeight(); row++) {
        std::cout << (row < 10 ? "  " : " ") << row << " ";
        for (int col = 0; col < board.getWidth(); col++) {
            Cell cell(row, col);
            if (ai.getMovesMade().count(cell)) {
                if (board.isMine(cell)) {
                    std::cout << "* ";
                } else {
                    int count = board.nearbyMines(cell);
                    std::cout << (count == 0 ? std::string(" ") : std::to_string(count)) << " ";
                }
            } else if (ai.getKnownMines().count(cell)) {
                std::cout << "F ";
            } else if (ai.getKnownSafes().count(cell)) {
                std::cout << "○ ";
            } else {
                std::cout << "· ";
            }
        }
        std::cout << "\n";
    }
}

GameUtils::GameResult GameUtils::playGame(Minesweeper& board, MinesweeperAI& ai, bool verbose,
                                          std::optional<Cell> opening) {
    GameResult result;

    while (!board.won()) {
        bool safe = true;
        bool opened = false;
        std::optional<Cell> move;
        if (opening) {
            move = opening;
            opening.reset();
            opened = true;
        } else {
            move = ai.makeSafeMove();
            if (!move) {
                safe = false;
                move = ai.makeRandomMove();
            }
        }
        if (!move) {
            if (verbose) std::cout << "No moves left to make." << std::endl;
            break;
        }

        result.moves++;
        if (!safe) result.randomMoves++;
        result.lastMove = *move;

        if (verbose) {
            const char* kind = opened ? " (opening)" : (safe ? " (safe)" : " (random)");
            std::cout << "Move " << result.moves << ": " << displayCell(*move) << kind << std::endl;
        }

        if (board.isMine(*move)) {
            result.hitMine = true;
            break;
        }

        ai.addKnowledge(*move, board.nearbyMines(*move));
        for (const auto& mine : ai.getKnownMines()) {
            board.markFound(mine);
        }

        if (verbose) printBoard(board, ai);
    }

    result.won = board.won();
    if (verbose) {
        std::cout << (result.won ? "Won" : (result.hitMine ? "Hit a mine" : "Stopped"))
                  << " after " << result.moves << " moves (" << result.randomMoves << " random)." << std::endl;
    }
    return result;
}

std::string GameUtils::formatWithCommas(int value) {
    std::string num = std::to_string(value);
    std::string result;
    int count = 0;
    for (int i = num.length() - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0 && num[i] != '-') result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return result;
}
