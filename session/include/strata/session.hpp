#pragma once

#include "strata/chain.hpp"
#include "strata/command.hpp"
#include "strata/history.hpp"
#include "strata/store.hpp"
#include "strata/undofile.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace strata {

enum class OpenStatus {
    Fresh,    // no undo file; the history starts at the root
    Loaded,   // the undo file matched the document and was restored
    Outdated, // the document changed since the undo file was written
    Invalid,  // the undo file is not readable as an undo history
};

struct OpenResult {
    OpenStatus status {OpenStatus::Fresh};
    std::string message;
};

// One editing session: a document's text and its undo tree, saved together.
class DocumentSession {
public:
    // Without an undo path the history lives only in memory.
    DocumentSession(std::filesystem::path file, std::optional<std::filesystem::path> undo_path);

    // Reads the undo file if there is one. An Outdated or Invalid file is
    // left on disk and not written to until discardUndoFile() or reconcile().
    OpenResult open();

    void beginBatch(std::string label);
    void endBatch();
    bool inBatch() const { return batch_.has_value(); }

    void execute(const ICommand& cmd);
    bool canUndo() const { return !history_.atRoot(); }
    bool canRedo() const;
    bool undo();
    bool redo();

    // Writes the document, then appends the new revisions to the undo file.
    // Returns false when the undo file was left alone (persistence disabled
    // or the existing file awaits a decision). Throws StateError(Outdated),
    // with the document untouched, when another session saved since this one
    // last loaded or saved; reconcile() and save again.
    bool save();

    // Merges this session's history into the one on disk. The undo file must
    // describe the current document contents.
    void reconcile();
    void discardUndoFile();

    // Commits the history to `chain` under the digest of the saved document
    // and persists the new node. Returns its index.
    size_t checkpoint(UndoChain& chain, IChainStore& store);

    // Finds the most recent chain node that records the saved document and
    // whose history is a prefix of this session's, and makes it the
    // checkpoint for the next commit.
    std::optional<size_t> resumeChain(const UndoChain& chain);

    bool isModified() const { return history_.currentRevision() != last_saved_; }
    const std::string& text() const { return text_; }
    const History& history() const { return history_; }
    const std::filesystem::path& file() const { return file_; }
    size_t persistedRevisions() const { return persisted_; }
    size_t lastSavedRevision() const { return last_saved_; }
    bool undoFileBlocked() const { return blocked_; }

private:
    struct PendingBatch {
        std::string label;
        std::string before;
        std::optional<Transaction> combined;
    };

    void writeDocument() const;
    void checkUndoFileUnchanged() const;

    std::filesystem::path file_;
    std::optional<UndoFile> undo_file_;
    std::string text_;
    std::optional<Digest> disk_digest_; // document bytes as last read or written here
    History history_;
    std::optional<PendingBatch> batch_;
    size_t persisted_ {0};  // revisions already in the undo file
    size_t last_saved_ {0};
    bool blocked_ {false};
};

} // namespace strata
