#ifndef GAMEUTILS_HPP
#define GAMEUTILS_HPP

#include "Cell.hpp"
#include <optional>
#include <string>

// Forward declarations
class Minesweeper;
class MinesweeperAI;

class GameUtils {
public:
    struct GameResult {
        bool won = false;
        bool hitMine = false;
        int moves = 0;
        int randomMoves = 0;
        Cell lastMove;
    };

    // Cell parsing/display, "row,col"
    static std::optional<Cell> parseCell(const char* text);
    static std::string displayCell(const Cell& cell);

    // Board printing
    static void printMines(const Minesweeper& board);
    static void printBoard(const Minesweeper& board, const MinesweeperAI& ai);

    // Plays until the board is won, a mine is hit or no move is left.
    // Known mines are flagged on the board after every observation.
    // An opening cell, if given, is played before the AI picks anything.
    static GameResult playGame(Minesweeper& board, MinesweeperAI& ai, bool verbose = false,
                               std::optional<Cell> opening = std::nullopt);

    // Number formatting
    static std::string formatWithCommas(int value);
};

#endif // GAMEUTILS_HPP
