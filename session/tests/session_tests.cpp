// Editing sessions: save/reopen, staleness, reconciliation, batches, chains.
#undef NDEBUG
#include "commands/delete_range.hpp"
#include "commands/insert_text.hpp"
#include "commands/replace_all.hpp"
#include "strata/config.hpp"
#include "strata/session.hpp"
#include "strata/state_error.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

using namespace strata;
namespace fs = std::filesystem;

static std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void write_file(const fs::path& p, const std::string& data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << data;
}

static void reset(const fs::path& doc, const fs::path& undo) {
    fs::remove(doc);
    fs::remove(undo);
}

int main() {
    fs::create_directories("test_tmp");
    const fs::path doc = "test_tmp/session_doc.txt";
    const fs::path undo = "test_tmp/undo/session_doc.undo";
    reset(doc, undo);

    // Edit, undo, branch and save
    {
        DocumentSession s(doc, undo);
        assert(s.open().status == OpenStatus::Fresh);
        assert(s.text().empty() && !s.canUndo() && !s.canRedo());
        s.execute(InsertTextCommand(0, "hello"));
        s.execute(InsertTextCommand(5, " world"));
        assert(s.text() == "hello world");
        assert(s.history().revisions()[2].transaction->selection == Selection::point(11));
        assert(s.undo() && s.text() == "hello");
        assert(s.redo() && s.text() == "hello world");
        assert(s.undo());
        s.execute(InsertTextCommand(5, "!"));
        assert(s.text() == "hello!");
        assert(s.history().size() == 4 && s.history().currentRevision() == 3);
        assert(s.isModified());
        assert(s.save());
        assert(!s.isModified());
        assert(s.persistedRevisions() == 4);
        assert(read_file(doc) == "hello!");

        bool threw = false;
        try {
            s.execute(DeleteRangeCommand(3, 99));
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw && s.history().size() == 4);
    }

    // Reopen: the tree and the redo targets survive the restart
    {
        DocumentSession s(doc, undo);
        OpenResult r = s.open();
        assert(r.status == OpenStatus::Loaded);
        assert(s.text() == "hello!");
        assert(s.history().size() == 4 && s.history().currentRevision() == 3);
        assert(s.lastSavedRevision() == 3 && !s.isModified());
        assert(s.undo() && s.text() == "hello");
        assert(s.undo() && s.text().empty());
        assert(!s.undo());
        assert(s.redo() && s.text() == "hello");
        assert(s.redo() && s.text() == "hello!");
        assert(!s.redo());

        // Only the new revision is appended
        s.execute(DeleteRangeCommand(0, 1));
        assert(s.text() == "ello!");
        assert(s.save());
        assert(s.persistedRevisions() == 5);
    }
    {
        DocumentSession s(doc, undo);
        assert(s.open().status == OpenStatus::Loaded);
        assert(s.text() == "ello!" && s.history().size() == 5);
        assert(s.undo() && s.text() == "hello!");
    }

    // Editing the document behind the session's back makes the history stale
    write_file(doc, "ello!?");
    {
        const std::string undo_bytes = read_file(undo);
        DocumentSession s(doc, undo);
        OpenResult r = s.open();
        assert(r.status == OpenStatus::Outdated);
        assert(!r.message.empty());
        assert(s.undoFileBlocked());
        assert(s.history().size() == 1);
        s.execute(ReplaceAllCommand("fresh"));
        assert(!s.save());
        assert(read_file(doc) == "fresh");
        assert(read_file(undo) == undo_bytes);

        s.discardUndoFile();
        assert(!fs::exists(undo));
        assert(s.save());
        DocumentSession again(doc, undo);
        assert(again.open().status == OpenStatus::Loaded);
        assert(again.history().size() == 2 && again.text() == "fresh");
    }

    // A file that is not an undo history is reported, not overwritten
    write_file(undo, "garbage");
    {
        DocumentSession s(doc, undo);
        OpenResult r = s.open();
        assert(r.status == OpenStatus::Invalid);
        assert(!s.save());
        assert(read_file(undo) == "garbage");
    }

    // Two sessions diverge from the same saved state and reconcile
    reset(doc, undo);
    {
        DocumentSession base(doc, undo);
        base.open();
        base.execute(InsertTextCommand(0, "base"));
        assert(base.save());
    }
    {
        DocumentSession first(doc, undo);
        DocumentSession second(doc, undo);
        assert(first.open().status == OpenStatus::Loaded);
        assert(second.open().status == OpenStatus::Loaded);

        first.execute(InsertTextCommand(4, " one"));
        assert(first.save());

        second.execute(InsertTextCommand(0, "two "));
        second.execute(InsertTextCommand(8, "!"));
        assert(second.text() == "two base!");
        second.reconcile();
        // disk = [root, base, one]; our two revisions are grafted after it
        const History& h = second.history();
        assert(h.size() == 5);
        assert(h.revisions()[3].parent == 1);
        assert(h.revisions()[4].parent == 3);
        assert(h.currentRevision() == 4);
        assert(h.revisions()[1].last_child == size_t(3));
        assert(second.persistedRevisions() == 3);
        assert(second.text() == "two base!");
        assert(second.save());
    }
    {
        DocumentSession s(doc, undo);
        assert(s.open().status == OpenStatus::Loaded);
        assert(s.text() == "two base!");
        assert(s.history().size() == 5 && s.history().currentRevision() == 4);
        assert(s.undo() && s.undo() && s.text() == "base");
        // the other session's branch is still in the tree
        assert(s.history().revisions()[2].parent == 1);
    }

    // Reconciling when the session has nothing the disk lacks adopts the disk tree
    {
        DocumentSession behind(doc, undo);
        behind.open();
        DocumentSession ahead(doc, undo);
        ahead.open();
        ahead.execute(InsertTextCommand(0, ">"));
        assert(ahead.save());
        write_file(doc, read_file(doc)); // same contents
        behind.reconcile();
        assert(behind.history().size() == 6);
        assert(behind.history().currentRevision() == 4);
    }

    // Two sessions saving in turn: the later save is refused until it reconciles
    reset(doc, undo);
    {
        DocumentSession base(doc, undo);
        base.open();
        base.execute(InsertTextCommand(0, "base"));
        assert(base.save());
    }
    {
        DocumentSession a(doc, undo);
        DocumentSession b(doc, undo);
        assert(a.open().status == OpenStatus::Loaded);
        assert(b.open().status == OpenStatus::Loaded);
        a.execute(InsertTextCommand(4, "-A"));
        assert(a.save());
        b.execute(InsertTextCommand(4, "-B"));

        bool outdated = false;
        try {
            b.save();
        } catch (const StateError& e) {
            outdated = e.kind() == StateErrorKind::Outdated;
        }
        assert(outdated);
        assert(read_file(doc) == "base-A");
        assert(b.persistedRevisions() == 2);

        b.reconcile();
        assert(b.history().size() == 4 && b.history().currentRevision() == 3);
        assert(b.save());
        assert(read_file(doc) == "base-B");
    }
    {
        DocumentSession s(doc, undo);
        assert(s.open().status == OpenStatus::Loaded);
        assert(s.text() == "base-B");
        assert(s.history().size() == 4);
        assert(s.history().revisions()[2].parent == 1);
        assert(s.undo() && s.text() == "base");
        assert(s.redo() && s.text() == "base-B");
    }

    // An undo file created after a fresh open belongs to someone else
    reset(doc, undo);
    {
        DocumentSession c(doc, undo);
        DocumentSession d(doc, undo);
        assert(c.open().status == OpenStatus::Fresh);
        assert(d.open().status == OpenStatus::Fresh);
        d.execute(InsertTextCommand(0, "d"));
        assert(d.save());
        c.execute(InsertTextCommand(0, "c"));
        bool outdated = false;
        try {
            c.save();
        } catch (const StateError& e) {
            outdated = e.kind() == StateErrorKind::Outdated;
        }
        assert(outdated);
        assert(read_file(doc) == "d");
        c.reconcile();
        assert(c.history().size() == 3);
        assert(c.save());
        assert(read_file(doc) == "c");
    }

    // Batches collapse into one revision
    reset(doc, undo);
    {
        DocumentSession s(doc, std::nullopt);
        assert(s.open().status == OpenStatus::Fresh);
        s.execute(InsertTextCommand(0, "xy"));
        s.beginBatch("typing");
        s.execute(InsertTextCommand(1, "a"));
        s.execute(InsertTextCommand(2, "b"));
        s.execute(DeleteRangeCommand(0, 1));
        assert(s.text() == "aby");
        bool threw = false;
        try {
            s.undo();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        s.endBatch();
        assert(s.history().size() == 3);
        assert(s.undo() && s.text() == "xy");
        assert(s.redo() && s.text() == "aby");

        s.beginBatch("nothing");
        s.endBatch();
        assert(s.history().size() == 3);
        // without an undo file only the document is written
        assert(!s.save());
        assert(read_file(doc) == "aby");
    }

    // Chain checkpoints record only what is new since the last one
    reset(doc, undo);
    {
        UndoChain chain;
        NullChainStore store;
        DocumentSession s(doc, undo);
        s.open();
        s.execute(InsertTextCommand(0, "v1"));
        s.save();
        size_t n0 = s.checkpoint(chain, store);
        assert(n0 == 0 && chain.nodes()[0].diff.revisions.size() == 2);
        assert(s.history().chainParent()->index == 0);

        s.execute(InsertTextCommand(2, " v2"));
        s.execute(InsertTextCommand(5, " v3"));
        s.save();
        size_t n1 = s.checkpoint(chain, store);
        assert(n1 == 1);
        assert(chain.nodes()[1].parent == size_t(0));
        assert(chain.nodes()[1].diff.revisions.size() == 2);
        assert(chain.nodes()[1].hash == hash_file(doc));

        // A new session resumes from the node matching the saved document
        DocumentSession next(doc, undo);
        assert(next.open().status == OpenStatus::Loaded);
        auto resumed = next.resumeChain(chain);
        assert(resumed && *resumed == 1);
        next.execute(DeleteRangeCommand(0, 1));
        next.save();
        size_t n2 = next.checkpoint(chain, store);
        assert(chain.nodes()[n2].parent == size_t(1));
        assert(chain.nodes()[n2].diff.revisions.size() == 1);
    }

    // Configuration
    {
        const fs::path dir = "/var/undo";
        fs::path p = undo_path_for(dir, "/home/me/100%/notes.txt");
        assert(p == fs::path("/var/undo/%home%me%100%%%notes.txt.undo"));

        const char* argv1[] = {"strata_runner", "--file", "notes.txt", "--undo-dir", "u", "--db", "c.db", "--no-undo"};
        Config c = config_from_args(8, const_cast<char**>(argv1));
        assert(c.file == fs::path("notes.txt"));
        assert(c.undo_dir == fs::path("u"));
        assert(c.chain_db && *c.chain_db == fs::path("c.db"));
        assert(!c.persist_undo);

        setenv("STRATA_UNDO_DIR", "/tmp/strata-undo", 1);
        const char* argv2[] = {"strata_runner", "--file", "notes.txt"};
        Config d = config_from_args(3, const_cast<char**>(argv2));
        assert(d.undo_dir == fs::path("/tmp/strata-undo"));
        assert(!d.chain_db && d.persist_undo);
        unsetenv("STRATA_UNDO_DIR");
        assert(default_undo_dir("/srv/doc.txt") == fs::path("/srv/.strata"));

        // Counts given on the command line
        assert(parse_count("0") == size_t(0));
        assert(parse_count("42") == size_t(42));
        assert(!parse_count(""));
        assert(!parse_count("-1"));
        assert(!parse_count("+3"));
        assert(!parse_count("12ab"));
        assert(!parse_count("99999999999999999999999"));

        const char* argv3[] = {"strata_runner", "--undo-dir", "u"};
        bool threw = false;
        try {
            config_from_args(3, const_cast<char**>(argv3));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    return 0;
}
