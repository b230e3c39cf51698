#include "strata/chain.hpp"
#include "strata/state_error.hpp"
#include <string>

namespace strata {

namespace {

// Parents are always appended before their children, which also rules out
// cycles in the walk.
template <typename Node>
void check_parent(const std::vector<Node>& nodes, size_t index) {
    if (index >= nodes.size()) {
        throw StateError(StateErrorKind::InvalidOffset, "chain node " + std::to_string(index) + " does not exist");
    }
    const auto& parent = nodes[index].parent;
    if (parent && *parent >= index) {
        throw StateError(StateErrorKind::InvalidData,
                         "chain node " + std::to_string(index) + " refers forward to " + std::to_string(*parent));
    }
}

} // namespace

size_t UndoChain::commit(const History& history, const Digest& file_hash) {
    ChainNode node;
    node.hash = file_hash;
    node.diff.current = history.currentRevision();
    const auto& revisions = history.revisions();

    if (const auto& checkpoint = history.chainParent()) {
        if (checkpoint->index >= nodes_.size() || nodes_[checkpoint->index].hash != checkpoint->hash) {
            throw StateError(StateErrorKind::Outdated,
                             "chain node " + std::to_string(checkpoint->index) + " no longer matches this history");
        }
        const size_t offset = offsetOf(checkpoint->index);
        if (offset > revisions.size()) {
            throw StateError(StateErrorKind::InvalidOffset,
                             "history has " + std::to_string(revisions.size()) + " revisions, chain already holds " +
                                 std::to_string(offset));
        }
        checkPrefix(checkpoint->index, revisions);
        node.parent = checkpoint->index;
        node.diff.revisions.assign(revisions.begin() + static_cast<std::ptrdiff_t>(offset), revisions.end());
    } else {
        node.diff.revisions = revisions;
    }

    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

void UndoChain::checkPrefix(size_t index, const std::vector<Revision>& revisions) const {
    std::vector<size_t> walk;
    std::optional<size_t> at = index;
    while (at) {
        check_parent(nodes_, *at);
        walk.push_back(*at);
        at = nodes_[*at].parent;
    }
    size_t pos = 0;
    for (auto it = walk.rbegin(); it != walk.rend(); ++it) {
        for (const auto& rev : nodes_[*it].diff.revisions) {
            if (!rev.sameContent(revisions[pos])) {
                throw StateError(StateErrorKind::Outdated,
                                 "revision " + std::to_string(pos) + " differs from chain node " + std::to_string(*it));
            }
            ++pos;
        }
    }
}

size_t UndoChain::offsetOf(size_t index) const {
    size_t offset = 0;
    std::optional<size_t> at = index;
    while (at) {
        check_parent(nodes_, *at);
        offset += nodes_[*at].diff.revisions.size();
        at = nodes_[*at].parent;
    }
    return offset;
}

UndoMap UndoMap::fromChain(const UndoChain& chain) {
    std::vector<UndoMapNode> nodes;
    nodes.reserve(chain.size());
    for (const auto& n : chain.nodes()) {
        nodes.push_back(UndoMapNode{n.hash, n.parent, n.diff.revisions.size(), n.diff.current});
    }
    return UndoMap(std::move(nodes));
}

size_t UndoMap::offsetOf(size_t index) const {
    size_t offset = 0;
    for (size_t i : ancestry(index)) offset += nodes_[i].revision_count;
    return offset;
}

std::vector<size_t> UndoMap::ancestry(size_t index) const {
    std::vector<size_t> out;
    std::optional<size_t> at = index;
    while (at) {
        check_parent(nodes_, *at);
        out.push_back(*at);
        at = nodes_[*at].parent;
    }
    return out;
}

std::optional<std::pair<size_t, size_t>> UndoMap::commonAncestor(const UndoMap& other, size_t mine, size_t theirs) const {
    const std::vector<size_t> ours = ancestry(mine);
    const std::vector<size_t> their_walk = other.ancestry(theirs);
    for (size_t a : ours) {
        for (size_t b : their_walk) {
            if (nodes_[a].hash == other.nodes_[b].hash) return std::make_pair(a, b);
        }
    }
    return std::nullopt;
}

} // namespace strata
