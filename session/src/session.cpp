#include "strata/session.hpp"
#include "strata/replay.hpp"
#include "strata/state_error.hpp"
#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {

namespace {

std::string read_document(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return {};
    std::ifstream in(path, std::ios::binary);
    if (!in) throw StateError(StateErrorKind::Io, "cannot open " + path.string());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw StateError(StateErrorKind::Io, "read failed for " + path.string());
    return text;
}

void require_no_batch(bool in_batch, const char* what) {
    if (in_batch) throw std::runtime_error(std::string("Batch in progress; cannot ") + what);
}

} // namespace

DocumentSession::DocumentSession(fs::path file, std::optional<fs::path> undo_path)
    : file_(std::move(file)), text_(read_document(file_)) {
    std::error_code ec;
    if (fs::exists(file_, ec)) disk_digest_ = hash_bytes(text_);
    if (undo_path) undo_file_.emplace(std::move(*undo_path));
}

OpenResult DocumentSession::open() {
    if (!undo_file_ || !undo_file_->exists()) return {OpenStatus::Fresh, {}};
    try {
        LoadedHistory loaded = undo_file_->load(file_);
        const size_t size = loaded.history.size();
        if (loaded.last_saved_revision >= size) {
            throw StateError(StateErrorKind::InvalidOffset,
                             "last saved revision " + std::to_string(loaded.last_saved_revision) + " is out of range");
        }
        // The document on disk is the state of the last saved revision.
        if (loaded.history.currentRevision() != loaded.last_saved_revision) {
            history_ = History::fromRevisions(loaded.history.revisions(), loaded.last_saved_revision);
        } else {
            history_ = std::move(loaded.history);
        }
        persisted_ = size;
        last_saved_ = loaded.last_saved_revision;
        blocked_ = false;
        return {OpenStatus::Loaded, {}};
    } catch (const StateError& e) {
        if (e.kind() == StateErrorKind::Io) throw;
        blocked_ = true;
        return {e.kind() == StateErrorKind::Outdated ? OpenStatus::Outdated : OpenStatus::Invalid, e.what()};
    }
}

void DocumentSession::beginBatch(std::string label) {
    if (batch_.has_value()) {
        throw std::runtime_error("Batch already in progress");
    }
    batch_ = PendingBatch{std::move(label), text_, std::nullopt};
}

void DocumentSession::endBatch() {
    if (!batch_.has_value()) return;
    PendingBatch batch = std::move(*batch_);
    batch_.reset();
    if (!batch.combined) return; // nothing happened
    Transaction inversion = batch.combined->invert(batch.before);
    history_.record(std::move(*batch.combined), std::move(inversion), std::nullopt, std::chrono::system_clock::now());
}

void DocumentSession::execute(const ICommand& cmd) {
    Transaction tx = cmd.build(text_);
    if (batch_.has_value()) {
        std::string next = text_;
        if (!tx.apply(next)) throw std::runtime_error(cmd.label() + " does not fit the document");
        batch_->combined = batch_->combined ? batch_->combined->compose(tx) : tx;
        text_ = std::move(next);
        return;
    }
    Transaction inversion = tx.invert(text_);
    if (!tx.apply(text_)) throw std::runtime_error(cmd.label() + " does not fit the document");
    history_.record(std::move(tx), std::move(inversion), std::nullopt, std::chrono::system_clock::now());
}

bool DocumentSession::canRedo() const {
    return history_.revisions()[history_.currentRevision()].last_child.has_value();
}

bool DocumentSession::undo() {
    require_no_batch(batch_.has_value(), "undo");
    if (!canUndo()) return false;
    const Revision& rev = history_.revisions()[history_.currentRevision()];
    if (rev.inversion->changes.len() != text_.size()) {
        throw StateError(StateErrorKind::InvalidData, "undo does not fit the document");
    }
    if (!history_.undo()->apply(text_)) {
        throw StateError(StateErrorKind::InvalidData, "undo does not fit the document");
    }
    return true;
}

bool DocumentSession::redo() {
    require_no_batch(batch_.has_value(), "redo");
    if (!canRedo()) return false;
    const size_t child = *history_.revisions()[history_.currentRevision()].last_child;
    if (history_.revisions()[child].transaction->changes.len() != text_.size()) {
        throw StateError(StateErrorKind::InvalidData, "redo does not fit the document");
    }
    if (!history_.redo()->apply(text_)) {
        throw StateError(StateErrorKind::InvalidData, "redo does not fit the document");
    }
    return true;
}

void DocumentSession::writeDocument() const {
    fs::path tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw StateError(StateErrorKind::Io, "cannot open " + tmp.string());
        out.write(text_.data(), static_cast<std::streamsize>(text_.size()));
        out.flush();
        if (!out) throw StateError(StateErrorKind::Io, "write failed for " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, file_, ec);
    if (ec) throw StateError(StateErrorKind::Io, "cannot replace " + file_.string() + ": " + ec.message());
}

void DocumentSession::checkUndoFileUnchanged() const {
    if (!undo_file_->exists()) {
        if (persisted_ > 0) throw StateError(StateErrorKind::Outdated, "undo file was removed by another session");
        return;
    }
    if (persisted_ == 0) throw StateError(StateErrorKind::Outdated, "undo file was created by another session");
    const UndoFileStatus status = undo_file_->status();
    if (status.revision_count != persisted_) {
        throw StateError(StateErrorKind::Outdated,
                         "undo file holds " + std::to_string(status.revision_count) + " revisions, this session wrote " +
                             std::to_string(persisted_));
    }
    if (!disk_digest_ || status.header.digest != *disk_digest_) {
        throw StateError(StateErrorKind::Outdated, "undo file describes a document this session has not seen");
    }
}

bool DocumentSession::save() {
    require_no_batch(batch_.has_value(), "save");
    if (undo_file_ && !blocked_) checkUndoFileUnchanged();
    writeDocument();
    disk_digest_ = hash_bytes(text_);
    last_saved_ = history_.currentRevision();
    if (!undo_file_ || blocked_) return false;
    undo_file_->save(history_, file_, last_saved_, persisted_);
    persisted_ = history_.size();
    return true;
}

void DocumentSession::reconcile() {
    require_no_batch(batch_.has_value(), "reconcile");
    if (!undo_file_) throw std::runtime_error("undo persistence is disabled for " + file_.string());

    LoadedHistory disk = undo_file_->load(file_);
    const size_t disk_size = disk.history.size();
    History merged = history_;
    merged.merge(disk.history);
    if (merged.size() < disk_size) {
        // our history is a prefix of the one on disk
        merged = History::fromRevisions(disk.history.revisions(), history_.currentRevision());
        merged.setChainParent(history_.chainParent());
    }
    history_ = std::move(merged);
    persisted_ = disk_size;
    last_saved_ = disk.last_saved_revision;
    disk_digest_ = hash_file(file_);
    blocked_ = false;
}

void DocumentSession::discardUndoFile() {
    if (undo_file_) undo_file_->discard();
    persisted_ = 0;
    blocked_ = false;
}

size_t DocumentSession::checkpoint(UndoChain& chain, IChainStore& store) {
    require_no_batch(batch_.has_value(), "checkpoint");
    const Digest digest = hash_file(file_);
    UndoChain next = chain;
    size_t index = next.commit(history_, digest);
    store.begin();
    try {
        store.appendNode(index, next.nodes()[index]);
        store.commit();
    } catch (...) {
        store.rollback();
        throw;
    }
    chain = std::move(next);
    history_.setChainParent(ChainCheckpoint{index, digest, history_.size()});
    return index;
}

std::optional<size_t> DocumentSession::resumeChain(const UndoChain& chain) {
    std::error_code ec;
    if (chain.empty() || !fs::exists(file_, ec)) return std::nullopt;
    const Digest digest = hash_file(file_);
    const auto& ours = history_.revisions();
    for (size_t i = chain.size(); i-- > 0;) {
        if (chain.nodes()[i].hash != digest) continue;
        const History committed = replay_chain(chain, i);
        if (committed.size() > ours.size()) continue;
        bool prefix = true;
        for (size_t r = 0; r < committed.size() && prefix; ++r) {
            prefix = committed.revisions()[r].sameContent(ours[r]);
        }
        if (!prefix) continue;
        history_.setChainParent(ChainCheckpoint{i, digest, committed.size()});
        return i;
    }
    return std::nullopt;
}

} // namespace strata
