#include "commands/delete_range.hpp"
#include <stdexcept>

namespace strata {

DeleteRangeCommand::DeleteRangeCommand(size_t from, size_t to) : from_(from), to_(to) {}

Transaction DeleteRangeCommand::build(const std::string& doc) const {
    if (from_ > to_ || to_ > doc.size()) {
        throw std::out_of_range("delete range [" + std::to_string(from_) + ", " + std::to_string(to_) +
                                ") is outside the document");
    }
    Transaction tx;
    tx.changes.retain(from_);
    tx.changes.remove(to_ - from_);
    tx.changes.retain(doc.size() - to_);
    tx.selection = Selection::point(from_);
    return tx;
}

} // namespace strata
