#pragma once

#include "strata/chain.hpp"
#include "strata/store.hpp"
#include <sqlite3.h>
#include <string>

namespace strata {

// Undo chain kept in a SQLite database. Node rows carry the digest of their
// encoded revisions so a damaged payload is detected on load.
class SqliteChainStore : public IChainStore {
public:
    explicit SqliteChainStore(const std::string& db_path);
    ~SqliteChainStore() override;

    SqliteChainStore(const SqliteChainStore&) = delete;
    SqliteChainStore& operator=(const SqliteChainStore&) = delete;

    void begin() override;
    void commit() override;
    void rollback() override;
    void appendNode(size_t index, const ChainNode& node) override;

    // Loads every node with its revisions. Throws StateError(InvalidHash) if a
    // payload no longer matches its digest.
    UndoChain readChain() const;
    // Loads the node rows only.
    UndoMap readMap() const;
    size_t nodeCount() const;

    const std::string& dbPath() const { return db_path_; }

private:
    std::string db_path_;
    sqlite3* db_ {nullptr};
};

} // namespace strata
