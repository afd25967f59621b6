#include "MinesweeperAI.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

MinesweeperAI::MinesweeperAI(const Config& config) : config_(config) {
    if (config_.height <= 0 || config_.width <= 0) {
        throw std::invalid_argument("board dimensions must be positive");
    }
    if (config_.useSeed) {
        ownRandom_.seed(config_.seed);
    }
}

MinesweeperAI::MinesweeperAI(int height, int width) : MinesweeperAI(Config(height, width)) {}

bool MinesweeperAI::inBounds(const Cell& cell) const {
    return cell.row >= 0 && cell.row < config_.height && cell.col >= 0 && cell.col < config_.width;
}

std::vector<Cell> MinesweeperAI::neighbors(const Cell& cell) const {
    std::vector<Cell> result;
    result.reserve(8);
    for (int dr = -1; dr <= 1; dr++) {
        for (int dc = -1; dc <= 1; dc++) {
            if (dr == 0 && dc == 0) continue;
            Cell neighbor(cell.row + dr, cell.col + dc);
            if (inBounds(neighbor)) {
                result.push_back(neighbor);
            }
        }
    }
    return result;
}

void MinesweeperAI::addKnowledge(const Cell& cell, int count) {
    PROFILE_SCOPE("MinesweeperAI::addKnowledge");
    if (!inBounds(cell)) {
        throw std::out_of_range("cell " + GameUtils::displayCell(cell) + " is off the board");
    }
    if (count < 0) {
        throw std::invalid_argument("negative mine count for " + GameUtils::displayCell(cell));
    }

    // 1. The cell was just revealed, so it is safe
    knowledge_.markSafe(cell);
    movesMade_.insert(cell);

    // 2. Build the sentence over the neighbours whose status is still open.
    //    Known mines are already accounted for, so each one lowers the count.
    std::set<Cell> unknown;
    for (const auto& neighbor : neighbors(cell)) {
        if (knowledge_.isKnownSafe(neighbor)) continue;
        if (knowledge_.isKnownMine(neighbor)) {
            count--;
            continue;
        }
        unknown.insert(neighbor);
    }

    // 3. Add it and run inference to a fixed point
    knowledge_.addSentence(Sentence(std::move(unknown), count));
    knowledge_.propagate();
}

std::optional<Cell> MinesweeperAI::makeSafeMove() const {
    for (const auto& cell : knowledge_.getKnownSafes()) {
        if (!movesMade_.count(cell)) {
            return cell;
        }
    }
    return std::nullopt;
}

std::optional<Cell> MinesweeperAI::makeRandomMove() {
    return makeRandomMove(config_.height, config_.width);
}

std::optional<Cell> MinesweeperAI::makeRandomMove(int height, int width) {
    // Cells outside the configured board can never be observed
    height = std::min(height, config_.height);
    width = std::min(width, config_.width);

    std::vector<Cell> candidates;
    for (int row = 0; row < height; row++) {
        for (int col = 0; col < width; col++) {
            Cell cell(row, col);
            if (!movesMade_.count(cell) && !knowledge_.isKnownMine(cell)) {
                candidates.push_back(cell);
            }
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }
    // at() rejects an index outside [0, size) from a faulty source
    Cell chosen = candidates.at(random().nextIndex(static_cast<int>(candidates.size())));
    randomMoves_++;
    return chosen;
}

std::optional<Cell> MinesweeperAI::makeMove() {
    std::optional<Cell> move = makeSafeMove();
    if (move) {
        return move;
    }
    return makeRandomMove();
}

void MinesweeperAI::reset() {
    knowledge_.clear();
    movesMade_.clear();
    randomMoves_ = 0;
}
