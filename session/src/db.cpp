#include "strata/db.hpp"
#include "strata/state_error.hpp"
#include "strata/undofile.hpp"
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

namespace {

void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

// Finalizes the statement on every exit path.
struct Statement {
    sqlite3_stmt* stmt {nullptr};

    Statement(sqlite3* db, const char* sql, const char* what) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("prepare failed for ") + what + ": " + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
};

std::string encode_revision(const Revision& rev) {
    std::ostringstream out;
    write_revision(out, rev);
    return out.str();
}

Digest read_digest(sqlite3_stmt* stmt, int col, const char* what) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int len = sqlite3_column_bytes(stmt, col);
    if (!blob || len != static_cast<int>(kDigestLength)) {
        throw StateError(StateErrorKind::InvalidData, std::string("chain node has a malformed ") + what);
    }
    Digest d{};
    std::memcpy(d.data(), blob, kDigestLength);
    return d;
}

std::vector<UndoMapNode> read_node_rows(sqlite3* db, std::vector<Digest>* payload_hashes) {
    Statement st(db,
                 "SELECT id, hash, parent, current, revision_count, payload_hash FROM chain_nodes ORDER BY id ASC",
                 "select chain nodes");
    std::vector<UndoMapNode> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW) {
        if (sqlite3_column_int64(st.stmt, 0) != static_cast<sqlite3_int64>(out.size())) {
            throw StateError(StateErrorKind::InvalidData, "chain node ids are not contiguous");
        }
        UndoMapNode node;
        node.hash = read_digest(st.stmt, 1, "file digest");
        if (sqlite3_column_type(st.stmt, 2) != SQLITE_NULL) {
            node.parent = static_cast<size_t>(sqlite3_column_int64(st.stmt, 2));
        }
        node.current = static_cast<size_t>(sqlite3_column_int64(st.stmt, 3));
        node.revision_count = static_cast<size_t>(sqlite3_column_int64(st.stmt, 4));
        if (payload_hashes) payload_hashes->push_back(read_digest(st.stmt, 5, "payload digest"));
        out.push_back(node);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("select chain nodes failed: ") + sqlite3_errmsg(db));
    }
    return out;
}

} // namespace

SqliteChainStore::SqliteChainStore(const std::string& db_path) : db_path_(db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("failed to open sqlite database " + db_path + ": " + msg);
    }
    try {
        exec_or_throw(db_, "PRAGMA foreign_keys=ON;");
        exec_or_throw(db_, "PRAGMA journal_mode=WAL;");
        exec_or_throw(db_, "PRAGMA synchronous=NORMAL;");
        exec_or_throw(db_, "CREATE TABLE IF NOT EXISTS chain_nodes("
                           "id INTEGER PRIMARY KEY, hash BLOB NOT NULL, parent INTEGER REFERENCES chain_nodes(id),"
                           " current INTEGER NOT NULL, revision_count INTEGER NOT NULL,"
                           " payload_hash BLOB NOT NULL, created_at INTEGER);");
        exec_or_throw(db_, "CREATE TABLE IF NOT EXISTS chain_revisions("
                           "node_id INTEGER NOT NULL REFERENCES chain_nodes(id), seq INTEGER NOT NULL,"
                           " data BLOB NOT NULL, PRIMARY KEY(node_id, seq));");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteChainStore::~SqliteChainStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteChainStore::begin() { exec_or_throw(db_, "BEGIN"); }
void SqliteChainStore::commit() { exec_or_throw(db_, "COMMIT"); }
void SqliteChainStore::rollback() { exec_or_throw(db_, "ROLLBACK"); }

void SqliteChainStore::appendNode(size_t index, const ChainNode& node) {
    std::vector<std::string> blobs;
    std::string payload;
    blobs.reserve(node.diff.revisions.size());
    for (const auto& rev : node.diff.revisions) {
        blobs.push_back(encode_revision(rev));
        payload += blobs.back();
    }
    const Digest payload_hash = hash_bytes(payload);

    {
        Statement st(db_,
                     "INSERT INTO chain_nodes(id, hash, parent, current, revision_count, payload_hash, created_at)"
                     " VALUES(?, ?, ?, ?, ?, ?, CAST(strftime('%s','now') AS INTEGER))",
                     "insert chain node");
        sqlite3_bind_int64(st.stmt, 1, static_cast<sqlite3_int64>(index));
        sqlite3_bind_blob(st.stmt, 2, node.hash.data(), static_cast<int>(kDigestLength), SQLITE_TRANSIENT);
        if (node.parent) {
            sqlite3_bind_int64(st.stmt, 3, static_cast<sqlite3_int64>(*node.parent));
        } else {
            sqlite3_bind_null(st.stmt, 3);
        }
        sqlite3_bind_int64(st.stmt, 4, static_cast<sqlite3_int64>(node.diff.current));
        sqlite3_bind_int64(st.stmt, 5, static_cast<sqlite3_int64>(node.diff.revisions.size()));
        sqlite3_bind_blob(st.stmt, 6, payload_hash.data(), static_cast<int>(kDigestLength), SQLITE_TRANSIENT);
        if (sqlite3_step(st.stmt) != SQLITE_DONE) {
            throw std::runtime_error(std::string("insert chain node failed: ") + sqlite3_errmsg(db_));
        }
    }

    Statement st(db_, "INSERT INTO chain_revisions(node_id, seq, data) VALUES(?, ?, ?)", "insert chain revision");
    for (size_t seq = 0; seq < blobs.size(); ++seq) {
        sqlite3_reset(st.stmt);
        sqlite3_bind_int64(st.stmt, 1, static_cast<sqlite3_int64>(index));
        sqlite3_bind_int64(st.stmt, 2, static_cast<sqlite3_int64>(seq));
        sqlite3_bind_blob(st.stmt, 3, blobs[seq].data(), static_cast<int>(blobs[seq].size()), SQLITE_STATIC);
        if (sqlite3_step(st.stmt) != SQLITE_DONE) {
            throw std::runtime_error(std::string("insert chain revision failed: ") + sqlite3_errmsg(db_));
        }
    }
}

UndoChain SqliteChainStore::readChain() const {
    std::vector<Digest> payload_hashes;
    const std::vector<UndoMapNode> rows = read_node_rows(db_, &payload_hashes);

    std::vector<ChainNode> nodes;
    nodes.reserve(rows.size());
    Statement st(db_, "SELECT data FROM chain_revisions WHERE node_id = ? ORDER BY seq ASC", "select chain revisions");
    for (size_t i = 0; i < rows.size(); ++i) {
        ChainNode node;
        node.hash = rows[i].hash;
        node.parent = rows[i].parent;
        node.diff.current = rows[i].current;

        std::vector<std::string> blobs;
        std::string payload;
        sqlite3_reset(st.stmt);
        sqlite3_bind_int64(st.stmt, 1, static_cast<sqlite3_int64>(i));
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW) {
            const char* data = static_cast<const char*>(sqlite3_column_blob(st.stmt, 0));
            int len = sqlite3_column_bytes(st.stmt, 0);
            blobs.push_back(data ? std::string(data, static_cast<size_t>(len)) : std::string());
            payload += blobs.back();
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("select chain revisions failed: ") + sqlite3_errmsg(db_));
        }
        if (hash_bytes(payload) != payload_hashes[i]) {
            throw StateError(StateErrorKind::InvalidHash, "chain node " + std::to_string(i));
        }
        for (const auto& blob : blobs) {
            std::istringstream in(blob);
            node.diff.revisions.push_back(read_revision(in));
        }
        if (node.diff.revisions.size() != rows[i].revision_count) {
            throw StateError(StateErrorKind::InvalidData,
                             "chain node " + std::to_string(i) + " is missing revisions");
        }
        nodes.push_back(std::move(node));
    }
    return UndoChain(std::move(nodes));
}

UndoMap SqliteChainStore::readMap() const { return UndoMap(read_node_rows(db_, nullptr)); }

size_t SqliteChainStore::nodeCount() const {
    Statement st(db_, "SELECT COUNT(*) FROM chain_nodes", "count chain nodes");
    if (sqlite3_step(st.stmt) != SQLITE_ROW) {
        throw std::runtime_error(std::string("count chain nodes failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<size_t>(sqlite3_column_int64(st.stmt, 0));
}

} // namespace strata
