#pragma once

#include "strata/hash.hpp"
#include "strata/transaction.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace strata {

using Timestamp = std::chrono::system_clock::time_point;

// One undoable step. The transaction pair is immutable once recorded and is
// shared between every copy of the history that holds the revision.
struct Revision {
    size_t parent {0};
    std::optional<size_t> last_child; // most recently created child
    std::shared_ptr<const Transaction> transaction;
    std::shared_ptr<const Transaction> inversion;
    Timestamp timestamp {};

    // Parent, transactions and timestamp; last_child is derived state.
    bool sameContent(const Revision& other) const;
    bool isCanonicalRoot() const;

    static Revision root();
};

// Chain node a history was last committed to or replayed from.
struct ChainCheckpoint {
    size_t index {0};
    Digest hash {};
    size_t revision_count {0}; // leading revisions of the history the node rebuilds
};

// The undo tree for one document. Revisions are stored flat; index 0 is the
// canonical root and every other revision's parent precedes it.
class History {
public:
    History();

    // Rebuilds last_child pointers in one pass. Throws StateError(InvalidData)
    // when a parent reference points forward or the list does not start at
    // the canonical root, and StateError(InvalidOffset) when current is out of
    // range.
    static History fromRevisions(std::vector<Revision> revisions, size_t current);

    // Appends a child of the current revision and makes it current.
    void record(Transaction transaction,
                Transaction inversion,
                std::optional<Selection> selection_after,
                Timestamp at);

    // Moves to the parent and returns the inversion to apply, or nullptr at
    // the root.
    const Transaction* undo();
    // Moves to the most recent child and returns its transaction, or nullptr
    // when there is nothing to redo.
    const Transaction* redo();

    // Grafts the revisions of this history that diverge from `other` onto
    // `other` and adopts the result. Throws StateError(InvalidOffset) and
    // leaves *this untouched if a rewritten parent falls outside the merged
    // tree. A chain checkpoint covering grafted revisions is replaced by
    // `other`'s.
    void merge(History other);

    size_t currentRevision() const { return current_; }
    const std::vector<Revision>& revisions() const { return revisions_; }
    size_t size() const { return revisions_.size(); }
    bool atRoot() const { return current_ == 0; }

    const std::optional<ChainCheckpoint>& chainParent() const { return chain_parent_; }
    void setChainParent(std::optional<ChainCheckpoint> parent) { chain_parent_ = std::move(parent); }

private:
    std::vector<Revision> revisions_;
    size_t current_ {0};
    std::optional<ChainCheckpoint> chain_parent_;
};

} // namespace strata
