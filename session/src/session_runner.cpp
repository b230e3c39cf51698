#include "commands/delete_range.hpp"
#include "commands/insert_text.hpp"
#include "commands/replace_all.hpp"
#include "strata/config.hpp"
#include "strata/db.hpp"
#include "strata/session.hpp"
#include "strata/state_error.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace strata;

static void usage() {
    std::cerr << "usage: strata_runner --file F [--undo-dir D] [--db chain.db] [--no-undo]\n"
                 "                     [--insert POS TEXT]... [--delete FROM TO]... [--replace TEXT]\n"
                 "                     [--undo N] [--redo N] [--reconcile] [--discard] [--history]\n";
}

// Reads argv[i] as a count; a malformed value is a usage error.
static bool count_arg(char** argv, int i, size_t& out) {
    auto value = parse_count(argv[i]);
    if (!value) {
        std::cerr << "not a non-negative number: " << argv[i] << "\n";
        return false;
    }
    out = *value;
    return true;
}

static const char* status_name(OpenStatus status) {
    switch (status) {
    case OpenStatus::Fresh: return "fresh";
    case OpenStatus::Loaded: return "loaded";
    case OpenStatus::Outdated: return "outdated";
    case OpenStatus::Invalid: return "invalid";
    }
    return "?";
}

static void print_history(const DocumentSession& session) {
    const History& h = session.history();
    for (size_t i = 0; i < h.size(); ++i) {
        const Revision& r = h.revisions()[i];
        std::cout << (i == h.currentRevision() ? "* " : "  ") << i << " parent=" << r.parent;
        if (r.last_child) std::cout << " last_child=" << *r.last_child;
        std::cout << " ops=" << r.transaction->changes.operations().size() << "\n";
    }
}

// Applies the editing actions in command-line order.
static bool run_actions(DocumentSession& session, int argc, char** argv) {
    bool show_history = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const int left = argc - i - 1;
        if ((arg == "--file" || arg == "--undo-dir" || arg == "--db") && left >= 1) {
            ++i;
        } else if (arg == "--no-undo") {
        } else if (arg == "--insert" && left >= 2) {
            size_t pos = 0;
            if (!count_arg(argv, i + 1, pos)) {
                usage();
                return false;
            }
            session.execute(InsertTextCommand(pos, argv[i + 2]));
            i += 2;
        } else if (arg == "--delete" && left >= 2) {
            size_t from = 0;
            size_t to = 0;
            if (!count_arg(argv, i + 1, from) || !count_arg(argv, i + 2, to)) {
                usage();
                return false;
            }
            session.execute(DeleteRangeCommand(from, to));
            i += 2;
        } else if (arg == "--replace" && left >= 1) {
            session.execute(ReplaceAllCommand(argv[i + 1]));
            ++i;
        } else if ((arg == "--undo" || arg == "--redo") && left >= 1) {
            size_t n = 0;
            if (!count_arg(argv, ++i, n)) {
                usage();
                return false;
            }
            size_t moved = 0;
            while (moved < n && (arg == "--undo" ? session.undo() : session.redo())) ++moved;
            std::cout << (arg == "--undo" ? "Undo " : "Redo ") << moved << "\n";
        } else if (arg == "--reconcile") {
            session.reconcile();
            std::cout << "Reconciled with undo file\n";
        } else if (arg == "--discard") {
            session.discardUndoFile();
            std::cout << "Discarded undo file\n";
        } else if (arg == "--history") {
            show_history = true;
        } else {
            std::cerr << "unknown or incomplete argument: " << arg << "\n";
            usage();
            return false;
        }
    }
    if (show_history) print_history(session);
    return true;
}

int main(int argc, char** argv) {
    Config config;
    try {
        config = config_from_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        usage();
        return 2;
    }

    std::optional<std::filesystem::path> undo_path;
    if (config.persist_undo) undo_path = undo_path_for(config.undo_dir, config.file);

    try {
        DocumentSession session(config.file, undo_path);
        OpenResult opened = session.open();
        std::cout << "Opened " << config.file.string() << " (" << status_name(opened.status) << ")\n";
        if (!opened.message.empty()) std::cerr << opened.message << "\n";

        // Chain persistence with SQLite when --db is provided
        std::unique_ptr<IChainStore> store;
        UndoChain chain;
        if (config.chain_db) {
            auto sql = std::make_unique<SqliteChainStore>(config.chain_db->string());
            chain = sql->readChain();
            if (auto node = session.resumeChain(chain)) {
                std::cout << "Resuming chain at node " << *node << "\n";
            }
            store = std::move(sql);
        } else {
            store = std::make_unique<NullChainStore>();
        }

        if (!run_actions(session, argc, argv)) return 2;

        if (session.save()) {
            std::cout << "Saved " << session.persistedRevisions() << " revisions\n";
        } else if (session.undoFileBlocked()) {
            std::cerr << "Undo file left untouched; use --discard or --reconcile\n";
        }
        if (config.chain_db) {
            size_t node = session.checkpoint(chain, *store);
            std::cout << "Checkpoint node " << node << " of " << chain.size() << "\n";
        }
    } catch (const StateError& e) {
        std::cerr << "undo state error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
