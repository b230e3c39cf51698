// Change set algebra: apply, invert and compose.
#undef NDEBUG
#include "strata/transaction.hpp"
#include <cassert>
#include <stdexcept>
#include <string>

using namespace strata;

static ChangeSet replace(size_t doc_len, size_t from, size_t to, const std::string& text) {
    ChangeSet cs;
    cs.retain(from);
    cs.remove(to - from);
    cs.insert(text);
    cs.retain(doc_len - to);
    return cs;
}

int main() {
    // Builder merges adjacent operations and drops empty ones
    ChangeSet cs;
    cs.retain(2);
    cs.retain(3);
    cs.insert("");
    cs.insert("ab");
    cs.insert("c");
    cs.remove(0);
    assert(cs.operations().size() == 2);
    assert(cs.operations()[0] == Operation::retain(5));
    assert(cs.operations()[1] == Operation::insert("abc"));
    assert(cs.len() == 5 && cs.lenAfter() == 8);
    assert(cs.isConsistent());

    // Apply and invert
    std::string doc = "hello world";
    const std::string original = doc;
    ChangeSet edit = replace(doc.size(), 6, 11, "there");
    assert(edit.apply(doc));
    assert(doc == "hello there");
    ChangeSet inv = edit.invert(original);
    assert(inv.len() == edit.lenAfter() && inv.lenAfter() == edit.len());
    assert(inv.apply(doc));
    assert(doc == original);

    // Length mismatch leaves the document alone
    std::string short_doc = "hi";
    assert(!edit.apply(short_doc));
    assert(short_doc == "hi");

    // Compose equals sequential application
    std::string a = "abcdef";
    ChangeSet first = replace(a.size(), 1, 3, "XYZ");   // aXYZdef
    ChangeSet second = replace(7, 2, 5, "");            // aXef
    ChangeSet both = first.compose(second);
    std::string seq = a;
    assert(first.apply(seq) && second.apply(seq));
    std::string once = a;
    assert(both.apply(once));
    assert(once == seq && once == "aXef");
    assert(both.len() == 6 && both.lenAfter() == 4);

    // Composing an edit with its inverse is an identity
    ChangeSet round = first.compose(first.invert(a));
    std::string r = a;
    assert(round.apply(r) && r == a);

    bool threw = false;
    try {
        first.compose(first);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Inconsistent decoded parts are detectable
    ChangeSet bad = ChangeSet::fromParts({Operation::retain(3)}, 4, 3);
    assert(!bad.isConsistent());

    // Transactions carry a selection; the inverse does not
    Transaction tx{edit, Selection::point(11)};
    Transaction tx_inv = tx.invert(original);
    assert(!tx_inv.selection);
    assert(tx != Transaction{});
    Range ranged{1, 4, VisualPosition{2, 3}};
    Range plain{1, 4, std::nullopt};
    assert(ranged != plain);
    return 0;
}
