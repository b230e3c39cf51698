#include "strata/transaction.hpp"
#include <algorithm>
#include <stdexcept>

namespace strata {

bool Operation::operator==(const Operation& other) const {
    if (kind != other.kind) return false;
    if (kind == Kind::Insert) return text == other.text;
    return count == other.count;
}

void ChangeSet::retain(size_t n) {
    if (n == 0) return;
    len_ += n;
    len_after_ += n;
    if (!ops_.empty() && ops_.back().kind == Operation::Kind::Retain) {
        ops_.back().count += n;
    } else {
        ops_.push_back(Operation::retain(n));
    }
}

void ChangeSet::remove(size_t n) {
    if (n == 0) return;
    len_ += n;
    if (!ops_.empty() && ops_.back().kind == Operation::Kind::Delete) {
        ops_.back().count += n;
    } else {
        ops_.push_back(Operation::remove(n));
    }
}

void ChangeSet::insert(std::string text) {
    if (text.empty()) return;
    len_after_ += text.size();
    if (!ops_.empty() && ops_.back().kind == Operation::Kind::Insert) {
        ops_.back().text += text;
    } else {
        ops_.push_back(Operation::insert(std::move(text)));
    }
}

ChangeSet ChangeSet::fromParts(std::vector<Operation> ops, size_t len, size_t len_after) {
    ChangeSet cs;
    cs.ops_ = std::move(ops);
    cs.len_ = len;
    cs.len_after_ = len_after;
    return cs;
}

bool ChangeSet::isIdentity() const {
    if (len_ != len_after_) return false;
    return std::all_of(ops_.begin(), ops_.end(),
                       [](const Operation& op) { return op.kind == Operation::Kind::Retain; });
}

bool ChangeSet::isConsistent() const {
    size_t in = 0;
    size_t out = 0;
    for (const auto& op : ops_) {
        switch (op.kind) {
        case Operation::Kind::Retain: in += op.count; out += op.count; break;
        case Operation::Kind::Delete: in += op.count; break;
        case Operation::Kind::Insert: out += op.text.size(); break;
        }
    }
    return in == len_ && out == len_after_;
}

bool ChangeSet::apply(std::string& doc) const {
    if (doc.size() != len_) return false;
    std::string out;
    out.reserve(len_after_);
    size_t pos = 0;
    for (const auto& op : ops_) {
        switch (op.kind) {
        case Operation::Kind::Retain:
            if (pos + op.count > doc.size()) return false;
            out.append(doc, pos, op.count);
            pos += op.count;
            break;
        case Operation::Kind::Delete:
            if (pos + op.count > doc.size()) return false;
            pos += op.count;
            break;
        case Operation::Kind::Insert:
            out += op.text;
            break;
        }
    }
    if (pos != doc.size()) return false;
    doc = std::move(out);
    return true;
}

ChangeSet ChangeSet::invert(const std::string& original) const {
    ChangeSet inv;
    size_t pos = 0;
    for (const auto& op : ops_) {
        switch (op.kind) {
        case Operation::Kind::Retain:
            inv.retain(op.count);
            pos += op.count;
            break;
        case Operation::Kind::Delete:
            inv.insert(original.substr(pos, op.count));
            pos += op.count;
            break;
        case Operation::Kind::Insert:
            inv.remove(op.text.size());
            break;
        }
    }
    return inv;
}

ChangeSet ChangeSet::compose(const ChangeSet& next) const {
    if (len_after_ != next.len_) {
        throw std::invalid_argument("composed change sets must chain in length");
    }
    ChangeSet out;
    size_t ai = 0;
    size_t bi = 0;
    std::optional<Operation> a;
    std::optional<Operation> b;
    if (ai < ops_.size()) a = ops_[ai++];
    if (bi < next.ops_.size()) b = next.ops_[bi++];
    auto advance_a = [&] { a = ai < ops_.size() ? std::optional<Operation>(ops_[ai++]) : std::nullopt; };
    auto advance_b = [&] { b = bi < next.ops_.size() ? std::optional<Operation>(next.ops_[bi++]) : std::nullopt; };

    using Kind = Operation::Kind;
    while (a || b) {
        // deletions from the first set and insertions of the second pass through
        if (a && a->kind == Kind::Delete) {
            out.remove(a->count);
            advance_a();
            continue;
        }
        if (b && b->kind == Kind::Insert) {
            out.insert(b->text);
            advance_b();
            continue;
        }
        if (!a || !b) {
            throw std::invalid_argument("composed change sets must chain in length");
        }

        if (a->kind == Kind::Retain && b->kind == Kind::Retain) {
            size_t m = std::min(a->count, b->count);
            out.retain(m);
            a->count -= m;
            b->count -= m;
            if (a->count == 0) advance_a();
            if (b->count == 0) advance_b();
        } else if (a->kind == Kind::Retain && b->kind == Kind::Delete) {
            size_t m = std::min(a->count, b->count);
            out.remove(m);
            a->count -= m;
            b->count -= m;
            if (a->count == 0) advance_a();
            if (b->count == 0) advance_b();
        } else if (a->kind == Kind::Insert && b->kind == Kind::Delete) {
            size_t len = a->text.size();
            if (len <= b->count) {
                b->count -= len;
                advance_a();
                if (b->count == 0) advance_b();
            } else {
                a->text.erase(0, b->count);
                advance_b();
            }
        } else { // Insert, Retain
            size_t len = a->text.size();
            if (len <= b->count) {
                out.insert(a->text);
                b->count -= len;
                advance_a();
                if (b->count == 0) advance_b();
            } else {
                out.insert(a->text.substr(0, b->count));
                a->text.erase(0, b->count);
                advance_b();
            }
        }
    }
    return out;
}

bool ChangeSet::operator==(const ChangeSet& other) const {
    return len_ == other.len_ && len_after_ == other.len_after_ && ops_ == other.ops_;
}

bool Range::operator==(const Range& o) const {
    return anchor == o.anchor && head == o.head && old_visual_position == o.old_visual_position;
}

Selection Selection::point(size_t pos) {
    Selection sel;
    sel.ranges.push_back(Range{pos, pos, std::nullopt});
    return sel;
}

bool Selection::operator==(const Selection& o) const {
    return primary_index == o.primary_index && ranges == o.ranges;
}

Transaction Transaction::invert(const std::string& original) const {
    return Transaction{changes.invert(original), std::nullopt};
}

Transaction Transaction::compose(const Transaction& next) const {
    return Transaction{changes.compose(next.changes), next.selection};
}

bool Transaction::operator==(const Transaction& o) const {
    return changes == o.changes && selection == o.selection;
}

} // namespace strata
