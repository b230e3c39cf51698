#pragma once

#include "strata/command.hpp"
#include <cstddef>
#include <string>

namespace strata {

class DeleteRangeCommand : public ICommand {
public:
    DeleteRangeCommand(size_t from, size_t to);
    std::string label() const override { return "DeleteRange"; }
    Transaction build(const std::string& doc) const override;

private:
    size_t from_;
    size_t to_;
};

} // namespace strata
