#pragma once

#include "strata/chain.hpp"
#include "strata/history.hpp"

namespace strata {

// Rebuild the history committed at chain node `index` by concatenating the
// diffs along its ancestry, root first. The result's chain parent is set to
// that node so the next commit only records new revisions.
History replay_chain(const UndoChain& chain, size_t index);

} // namespace strata
