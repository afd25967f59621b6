#include "Sentence.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

Sentence::Sentence(std::set<Cell> cells, int count) : cells(std::move(cells)), count(count) {}

void Sentence::markMine(const Cell& cell) {
    if (cells.erase(cell) > 0) {
        count--;
    }
}

void Sentence::markSafe(const Cell& cell) {
    cells.erase(cell);
}

std::set<Cell> Sentence::knownMines() const {
    if (!cells.empty() && count == static_cast<int>(cells.size())) {
        return cells;
    }
    return {};
}

std::set<Cell> Sentence::knownSafes() const {
    if (count == 0) {
        return cells;
    }
    return {};
}

bool Sentence::isSubsetOf(const Sentence& other) const {
    if (cells.size() > other.cells.size()) {
        return false;
    }
    // Both sets are sorted, so std::includes is a single linear merge
    return std::includes(other.cells.begin(), other.cells.end(), cells.begin(), cells.end());
}

std::string Sentence::toString() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& cell : cells) {
        if (!first) oss << ", ";
        oss << "(" << cell.row << "," << cell.col << ")";
        first = false;
    }
    oss << "} = " << count;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Sentence& sentence) {
    return os << sentence.toString();
}
