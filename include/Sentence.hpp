#ifndef SENTENCE_HPP
#define SENTENCE_HPP

#include "Cell.hpp"
#include <set>
#include <string>
#include <ostream>

// A set of cells together with the exact number of mines among them.
class Sentence {
public:
    Sentence() : count(0) {}
    Sentence(std::set<Cell> cells, int count);

    // Updates for a cell whose status became known elsewhere. No-op if the
    // cell is not part of this sentence.
    void markMine(const Cell& cell);
    void markSafe(const Cell& cell);

    // All cells when the count pins them down, otherwise empty.
    std::set<Cell> knownMines() const;
    std::set<Cell> knownSafes() const;

    bool contains(const Cell& cell) const { return cells.count(cell) > 0; }
    bool isSubsetOf(const Sentence& other) const;

    const std::set<Cell>& getCells() const { return cells; }
    int getCount() const { return count; }
    size_t size() const { return cells.size(); }
    bool empty() const { return cells.empty(); }

    bool operator==(const Sentence& other) const {
        return count == other.count && cells == other.cells;
    }
    bool operator!=(const Sentence& other) const { return !(*this == other); }

    std::string toString() const;

private:
    std::set<Cell> cells;
    int count;
};

std::ostream& operator<<(std::ostream& os, const Sentence& sentence);

#endif // SENTENCE_HPP
