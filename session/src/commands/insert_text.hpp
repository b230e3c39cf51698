#pragma once

#include "strata/command.hpp"
#include <cstddef>
#include <string>

namespace strata {

class InsertTextCommand : public ICommand {
public:
    InsertTextCommand(size_t pos, std::string text);
    std::string label() const override { return "InsertText"; }
    Transaction build(const std::string& doc) const override;

private:
    size_t pos_;
    std::string text_;
};

} // namespace strata
