#pragma once

#include "strata/command.hpp"
#include <string>

namespace strata {

class ReplaceAllCommand : public ICommand {
public:
    explicit ReplaceAllCommand(std::string text) : text_(std::move(text)) {}
    std::string label() const override { return "ReplaceAll"; }
    Transaction build(const std::string& doc) const override;

private:
    std::string text_;
};

} // namespace strata
