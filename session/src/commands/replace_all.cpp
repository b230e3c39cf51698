#include "commands/replace_all.hpp"

namespace strata {

Transaction ReplaceAllCommand::build(const std::string& doc) const {
    Transaction tx;
    tx.changes.remove(doc.size());
    tx.changes.insert(text_);
    // select the new contents
    Selection sel;
    sel.ranges.push_back(Range{0, text_.size(), std::nullopt});
    tx.selection = sel;
    return tx;
}

} // namespace strata
