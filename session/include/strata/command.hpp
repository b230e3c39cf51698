#pragma once

#include "strata/transaction.hpp"
#include <string>

namespace strata {

// An editing intent. build() turns it into a transaction against the
// current document text.
class ICommand {
public:
    virtual ~ICommand() = default;
    virtual std::string label() const = 0;
    virtual Transaction build(const std::string& doc) const = 0;
};

} // namespace strata
