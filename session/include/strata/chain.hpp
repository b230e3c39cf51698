#pragma once

#include "strata/hash.hpp"
#include "strata/history.hpp"
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace strata {

// Revisions added to a history since the parent checkpoint, plus the
// history's current revision when it was committed.
struct ChainDiff {
    std::vector<Revision> revisions;
    size_t current {0};
};

struct ChainNode {
    Digest hash {};                 // file contents at this checkpoint
    std::optional<size_t> parent;   // none for a chain root
    ChainDiff diff;
};

// Append-only log of incremental history snapshots keyed by file digest.
//
//   A[h1] -> B[h2] -> C[h3]
//             \
//              B1[h4] -> B2[h5]
//
// Concatenating the diffs along a node's parent walk, root first, yields the
// full history as it was when that node was committed.
class UndoChain {
public:
    UndoChain() = default;
    explicit UndoChain(std::vector<ChainNode> nodes) : nodes_(std::move(nodes)) {}

    // Appends the part of `history` that is not yet represented by its
    // checkpoint and returns the new node's index. The new node's parent is
    // the checkpoint, which is also the last node for sequential commits.
    // Throws StateError(Outdated) when the checkpoint no longer matches this
    // chain or the history's leading revisions differ from the ones it holds,
    // and StateError(InvalidOffset) when the history is shorter than the
    // checkpoint.
    size_t commit(const History& history, const Digest& file_hash);

    // Number of revisions represented by the node and all its ancestors.
    size_t offsetOf(size_t index) const;

    const std::vector<ChainNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    void checkPrefix(size_t index, const std::vector<Revision>& revisions) const;

    std::vector<ChainNode> nodes_;
};

// Chain structure without revision payloads.
struct UndoMapNode {
    Digest hash {};
    std::optional<size_t> parent;
    size_t revision_count {0};
    size_t current {0};
};

class UndoMap {
public:
    UndoMap() = default;
    explicit UndoMap(std::vector<UndoMapNode> nodes) : nodes_(std::move(nodes)) {}

    static UndoMap fromChain(const UndoChain& chain);

    size_t offsetOf(size_t index) const;

    // Indices of `index` and its ancestors, nearest first.
    std::vector<size_t> ancestry(size_t index) const;

    // Deepest pair of nodes (one from each map, on the parent walks of `mine`
    // and `theirs`) that record the same file digest.
    std::optional<std::pair<size_t, size_t>> commonAncestor(const UndoMap& other, size_t mine, size_t theirs) const;

    const std::vector<UndoMapNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }

private:
    std::vector<UndoMapNode> nodes_;
};

} // namespace strata
