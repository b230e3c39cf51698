#pragma once

#include "strata/chain.hpp"
#include <cstddef>

namespace strata {

// Abstract persistence for undo chains (SQLite-backed implementation in db.hpp)
class IChainStore {
public:
    virtual ~IChainStore() = default;
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    // Persist chain node `index`; nodes are appended in index order.
    virtual void appendNode(size_t index, const ChainNode& node) = 0;
};

class NullChainStore : public IChainStore {
public:
    void begin() override {}
    void commit() override {}
    void rollback() override {}
    void appendNode(size_t, const ChainNode&) override {}
};

} // namespace strata
