#ifndef KNOWLEDGEBASE_HPP
#define KNOWLEDGEBASE_HPP

#include "Cell.hpp"
#include "Sentence.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown when the knowledge base is asked to hold facts that cannot all be
// true (a cell both safe and mine, a sentence with an impossible count).
class ContradictionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class KnowledgeBase {
public:
    KnowledgeBase() = default;

    // Record a cell's status and remove it from every live sentence.
    // Throws ContradictionError if the cell already has the opposite status.
    void markMine(const Cell& cell);
    void markSafe(const Cell& cell);

    // Appends a sentence after stripping cells whose status is already known.
    // Returns false if nothing was added (empty or duplicate).
    bool addSentence(const Sentence& sentence);

    // Runs trivial resolution and subset inference until neither changes
    // anything. Returns the number of rounds, including the final quiet one.
    int propagate();

    bool isKnownMine(const Cell& cell) const { return mines_.count(cell) > 0; }
    bool isKnownSafe(const Cell& cell) const { return safes_.count(cell) > 0; }

    const std::vector<Sentence>& getSentences() const { return sentences_; }
    const std::set<Cell>& getKnownMines() const { return mines_; }
    const std::set<Cell>& getKnownSafes() const { return safes_; }
    size_t size() const { return sentences_.size(); }
    bool contains(const Sentence& sentence) const;

    void clear();

    // Debug
    std::string toString() const;

private:
    bool resolveTrivial();
    bool inferSubsets();
    bool append(Sentence sentence);
    void discardRedundant();
    void checkCount(const Sentence& sentence) const;

    std::vector<Sentence> sentences_;
    std::set<Cell> safes_;
    std::set<Cell> mines_;
};

#endif // KNOWLEDGEBASE_HPP
