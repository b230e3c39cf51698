#include "strata/replay.hpp"
#include <vector>

namespace strata {

History replay_chain(const UndoChain& chain, size_t index) {
    const UndoMap map = UndoMap::fromChain(chain);
    std::vector<size_t> walk = map.ancestry(index);

    std::vector<Revision> revisions;
    revisions.reserve(map.offsetOf(index));
    for (auto it = walk.rbegin(); it != walk.rend(); ++it) {
        const auto& diff = chain.nodes()[*it].diff;
        revisions.insert(revisions.end(), diff.revisions.begin(), diff.revisions.end());
    }

    const ChainNode& node = chain.nodes()[index];
    History history = History::fromRevisions(std::move(revisions), node.diff.current);
    history.setChainParent(ChainCheckpoint{index, node.hash, history.size()});
    return history;
}

} // namespace strata
