#include "commands/insert_text.hpp"
#include <stdexcept>

namespace strata {

InsertTextCommand::InsertTextCommand(size_t pos, std::string text) : pos_(pos), text_(std::move(text)) {}

Transaction InsertTextCommand::build(const std::string& doc) const {
    if (pos_ > doc.size()) {
        throw std::out_of_range("insert position " + std::to_string(pos_) + " is past the end of the document");
    }
    Transaction tx;
    tx.changes.retain(pos_);
    tx.changes.insert(text_);
    tx.changes.retain(doc.size() - pos_);
    // cursor ends up after the inserted text
    tx.selection = Selection::point(pos_ + text_.size());
    return tx;
}

} // namespace strata
