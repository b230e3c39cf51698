#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// A single step of a change set. Counts and text lengths are in bytes of the
// UTF-8 document.
struct Operation {
    enum class Kind : uint8_t {
        Retain = 0,
        Delete = 1,
        Insert = 2,
    };

    Kind kind {Kind::Retain};
    size_t count {0};  // Retain, Delete
    std::string text;  // Insert

    static Operation retain(size_t n) { return Operation{Kind::Retain, n, {}}; }
    static Operation remove(size_t n) { return Operation{Kind::Delete, n, {}}; }
    static Operation insert(std::string s) { return Operation{Kind::Insert, 0, std::move(s)}; }

    bool operator==(const Operation& other) const;
    bool operator!=(const Operation& other) const { return !(*this == other); }
};

class ChangeSet {
public:
    ChangeSet() = default;

    // Builder calls. Adjacent operations of the same kind are merged and
    // zero-length operations are dropped.
    void retain(size_t n);
    void remove(size_t n);
    void insert(std::string text);

    // Rebuilds a change set from decoded parts. Use isConsistent() to check
    // that the counters agree with the operations.
    static ChangeSet fromParts(std::vector<Operation> ops, size_t len, size_t len_after);

    size_t len() const { return len_; }
    size_t lenAfter() const { return len_after_; }
    const std::vector<Operation>& operations() const { return ops_; }
    bool isEmpty() const { return ops_.empty() && len_ == 0 && len_after_ == 0; }
    bool isIdentity() const;
    bool isConsistent() const;

    // Applies the changes in place. Returns false and leaves the document
    // untouched when its length does not match len().
    bool apply(std::string& doc) const;

    // Change set that undoes this one when applied to the result.
    ChangeSet invert(const std::string& original) const;

    // Applying the result equals applying *this followed by `next`.
    // Throws std::invalid_argument if lenAfter() != next.len().
    ChangeSet compose(const ChangeSet& next) const;

    bool operator==(const ChangeSet& other) const;
    bool operator!=(const ChangeSet& other) const { return !(*this == other); }

private:
    std::vector<Operation> ops_;
    size_t len_ {0};
    size_t len_after_ {0};
};

struct VisualPosition {
    uint32_t row {0};
    uint32_t col {0};

    bool operator==(const VisualPosition& o) const { return row == o.row && col == o.col; }
    bool operator!=(const VisualPosition& o) const { return !(*this == o); }
};

struct Range {
    size_t anchor {0};
    size_t head {0};
    std::optional<VisualPosition> old_visual_position;

    bool operator==(const Range& o) const;
    bool operator!=(const Range& o) const { return !(*this == o); }
};

struct Selection {
    std::vector<Range> ranges;
    size_t primary_index {0};

    static Selection point(size_t pos);

    bool operator==(const Selection& o) const;
    bool operator!=(const Selection& o) const { return !(*this == o); }
};

// A change set plus the selection to restore once it has been applied.
struct Transaction {
    ChangeSet changes;
    std::optional<Selection> selection;

    bool apply(std::string& doc) const { return changes.apply(doc); }
    Transaction invert(const std::string& original) const;
    Transaction compose(const Transaction& next) const;

    bool operator==(const Transaction& o) const;
    bool operator!=(const Transaction& o) const { return !(*this == o); }
};

} // namespace strata
