#include "KnowledgeBase.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

// ============================================================================
// Marking
// ============================================================================

void KnowledgeBase::markMine(const Cell& cell) {
    if (safes_.count(cell)) {
        throw ContradictionError("cell " + GameUtils::displayCell(cell) + " is already known to be safe");
    }
    mines_.insert(cell);
    for (auto& sentence : sentences_) {
        sentence.markMine(cell);
        checkCount(sentence);
    }
}

void KnowledgeBase::markSafe(const Cell& cell) {
    if (mines_.count(cell)) {
        throw ContradictionError("cell " + GameUtils::displayCell(cell) + " is already known to be a mine");
    }
    safes_.insert(cell);
    for (auto& sentence : sentences_) {
        sentence.markSafe(cell);
        checkCount(sentence);
    }
}

// ============================================================================
// Sentence management
// ============================================================================

bool KnowledgeBase::addSentence(const Sentence& sentence) {
    std::set<Cell> cells;
    int count = sentence.getCount();
    for (const auto& cell : sentence.getCells()) {
        if (mines_.count(cell)) {
            count--;
        } else if (!safes_.count(cell)) {
            cells.insert(cell);
        }
    }

    Sentence reduced(std::move(cells), count);
    checkCount(reduced);
    if (reduced.empty()) {
        return false;
    }
    return append(std::move(reduced));
}

bool KnowledgeBase::contains(const Sentence& sentence) const {
    return std::find(sentences_.begin(), sentences_.end(), sentence) != sentences_.end();
}

void KnowledgeBase::clear() {
    sentences_.clear();
    safes_.clear();
    mines_.clear();
}

bool KnowledgeBase::append(Sentence sentence) {
    for (const auto& existing : sentences_) {
        if (existing.getCells() != sentence.getCells()) {
            continue;
        }
        if (existing.getCount() != sentence.getCount()) {
            throw ContradictionError("conflicting counts: " + existing.toString() + " vs " + sentence.toString());
        }
        return false;
    }
    sentences_.push_back(std::move(sentence));
    return true;
}

void KnowledgeBase::checkCount(const Sentence& sentence) const {
    if (sentence.getCount() < 0 || sentence.getCount() > static_cast<int>(sentence.size())) {
        throw ContradictionError("impossible sentence " + sentence.toString());
    }
}

// Drops emptied sentences and collapses sentences that marking has made equal.
void KnowledgeBase::discardRedundant() {
    std::vector<Sentence> kept;
    kept.reserve(sentences_.size());
    for (auto& sentence : sentences_) {
        if (sentence.empty()) {
            continue;
        }
        bool duplicate = false;
        for (const auto& other : kept) {
            if (other.getCells() != sentence.getCells()) {
                continue;
            }
            if (other.getCount() != sentence.getCount()) {
                throw ContradictionError("conflicting counts: " + other.toString() + " vs " + sentence.toString());
            }
            duplicate = true;
            break;
        }
        if (!duplicate) {
            kept.push_back(std::move(sentence));
        }
    }
    sentences_ = std::move(kept);
}

// ============================================================================
// Propagation
// ============================================================================

int KnowledgeBase::propagate() {
    PROFILE_SCOPE("KnowledgeBase::propagate");
    int rounds = 0;
    while (true) {
        rounds++;
        bool resolved = resolveTrivial();
        bool inferred = inferSubsets();
        if (!resolved && !inferred) {
            break;
        }
    }
    return rounds;
}

bool KnowledgeBase::resolveTrivial() {
    PROFILE_SCOPE("KnowledgeBase::resolveTrivial");
    discardRedundant();

    bool changed = false;
    // Index loop: marking edits sentences in place but never resizes the vector
    for (size_t i = 0; i < sentences_.size(); i++) {
        std::set<Cell> newMines = sentences_[i].knownMines();
        std::set<Cell> newSafes = sentences_[i].knownSafes();

        for (const auto& cell : newMines) {
            if (!mines_.count(cell)) {
                markMine(cell);
                changed = true;
            }
        }
        for (const auto& cell : newSafes) {
            if (!safes_.count(cell)) {
                markSafe(cell);
                changed = true;
            }
        }
    }

    discardRedundant();
    return changed;
}

bool KnowledgeBase::inferSubsets() {
    PROFILE_SCOPE("KnowledgeBase::inferSubsets");
    const std::vector<Sentence> snapshot = sentences_;

    bool changed = false;
    for (size_t a = 0; a < snapshot.size(); a++) {
        const Sentence& superset = snapshot[a];
        if (superset.empty()) continue;

        for (size_t b = 0; b < snapshot.size(); b++) {
            const Sentence& subset = snapshot[b];
            if (a == b || subset.empty()) continue;
            if (subset.size() >= superset.size() || !subset.isSubsetOf(superset)) continue;

            std::set<Cell> remaining;
            std::set_difference(superset.getCells().begin(), superset.getCells().end(),
                                subset.getCells().begin(), subset.getCells().end(),
                                std::inserter(remaining, remaining.end()));

            Sentence derived(std::move(remaining), superset.getCount() - subset.getCount());
            checkCount(derived);
            if (append(std::move(derived))) {
                changed = true;
            }
        }
    }
    return changed;
}

// ============================================================================
// Debug
// ============================================================================

std::string KnowledgeBase::toString() const {
    std::ostringstream oss;
    oss << "Sentences (" << sentences_.size() << "):\n";
    for (const auto& sentence : sentences_) {
        oss << "  " << sentence << "\n";
    }
    oss << "Known mines:";
    for (const auto& cell : mines_) {
        oss << " " << GameUtils::displayCell(cell);
    }
    oss << "\nKnown safes:";
    for (const auto& cell : safes_) {
        oss << " " << GameUtils::displayCell(cell);
    }
    oss << "\n";
    return oss.str();
}
