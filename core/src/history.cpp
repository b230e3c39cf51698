#include "strata/history.hpp"
#include "strata/state_error.hpp"
#include <algorithm>
#include <string>

namespace strata {

namespace {

bool same_transaction(const std::shared_ptr<const Transaction>& a, const std::shared_ptr<const Transaction>& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return *a == *b;
}

const std::shared_ptr<const Transaction>& empty_transaction() {
    static const std::shared_ptr<const Transaction> empty = std::make_shared<const Transaction>();
    return empty;
}

} // namespace

bool Revision::sameContent(const Revision& other) const {
    return parent == other.parent && timestamp == other.timestamp &&
           same_transaction(transaction, other.transaction) && same_transaction(inversion, other.inversion);
}

bool Revision::isCanonicalRoot() const {
    return parent == 0 && timestamp == Timestamp{} && transaction && inversion &&
           *transaction == Transaction{} && *inversion == Transaction{};
}

Revision Revision::root() {
    Revision r;
    r.transaction = empty_transaction();
    r.inversion = empty_transaction();
    return r;
}

History::History() { revisions_.push_back(Revision::root()); }

History History::fromRevisions(std::vector<Revision> revisions, size_t current) {
    History h;
    h.revisions_.clear();
    h.revisions_.reserve(revisions.size());
    for (auto& rev : revisions) {
        if (h.revisions_.empty()) {
            if (!rev.isCanonicalRoot()) {
                throw StateError(StateErrorKind::InvalidData, "Revision 0 is not the canonical root");
            }
        } else if (rev.parent >= h.revisions_.size()) {
            throw StateError(StateErrorKind::InvalidData,
                             "non-contiguous history: revision " + std::to_string(h.revisions_.size()) +
                                 " refers to parent " + std::to_string(rev.parent));
        }
        rev.last_child.reset();
        if (!h.revisions_.empty()) {
            h.revisions_[rev.parent].last_child = h.revisions_.size();
        }
        h.revisions_.push_back(std::move(rev));
    }
    if (h.revisions_.empty()) {
        throw StateError(StateErrorKind::InvalidData, "history has no root revision");
    }
    if (current >= h.revisions_.size()) {
        throw StateError(StateErrorKind::InvalidOffset,
                         "current revision " + std::to_string(current) + " is out of range");
    }
    h.current_ = current;
    return h;
}

void History::record(Transaction transaction,
                     Transaction inversion,
                     std::optional<Selection> selection_after,
                     Timestamp at) {
    if (selection_after) transaction.selection = std::move(selection_after);
    const size_t index = revisions_.size();
    Revision rev;
    rev.parent = current_;
    rev.transaction = std::make_shared<const Transaction>(std::move(transaction));
    rev.inversion = std::make_shared<const Transaction>(std::move(inversion));
    rev.timestamp = at;
    revisions_[current_].last_child = index;
    revisions_.push_back(std::move(rev));
    current_ = index;
}

const Transaction* History::undo() {
    if (atRoot()) return nullptr;
    const Revision& rev = revisions_[current_];
    current_ = rev.parent;
    return rev.inversion.get();
}

const Transaction* History::redo() {
    const auto& child = revisions_[current_].last_child;
    if (!child) return nullptr;
    current_ = *child;
    return revisions_[current_].transaction.get();
}

void History::merge(History other) {
    size_t n = 0;
    const size_t shared_len = std::min(revisions_.size(), other.revisions_.size());
    while (n < shared_len) {
        const Revision& a = revisions_[n];
        const Revision& b = other.revisions_[n];
        if (a.parent != b.parent || !same_transaction(a.transaction, b.transaction) ||
            !same_transaction(a.inversion, b.inversion)) {
            break;
        }
        ++n;
    }
    if (n == revisions_.size()) return;

    // Revision i >= n lands at other.size() + (i - n).
    const size_t offset = other.revisions_.size() - n;
    for (size_t i = n; i < revisions_.size(); ++i) {
        Revision rev = revisions_[i];
        if (rev.parent >= n) rev.parent += offset;
        const size_t index = other.revisions_.size();
        if (rev.parent >= index) {
            throw StateError(StateErrorKind::InvalidOffset,
                             "revision " + std::to_string(i) + " maps to parent " + std::to_string(rev.parent) +
                                 " past merged size " + std::to_string(index));
        }
        rev.last_child.reset();
        other.revisions_[rev.parent].last_child = index;
        other.revisions_.push_back(std::move(rev));
    }

    if (current_ >= n) current_ += offset;
    // the merged prefix is `other`, so only its checkpoint still holds
    if (chain_parent_ && chain_parent_->revision_count > n) chain_parent_ = std::move(other.chain_parent_);
    revisions_ = std::move(other.revisions_);
}

} // namespace strata
