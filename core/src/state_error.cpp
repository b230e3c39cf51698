#include "strata/state_error.hpp"

namespace strata {

const char* to_string(StateErrorKind kind) {
    switch (kind) {
    case StateErrorKind::Outdated: return "Outdated file";
    case StateErrorKind::InvalidHeader: return "Invalid undofile header";
    case StateErrorKind::InvalidOffset: return "Invalid merge offset";
    case StateErrorKind::InvalidData: return "Invalid undofile data";
    case StateErrorKind::InvalidHash: return "invalid hash for undofile itself";
    case StateErrorKind::Io: return "I/O error";
    }
    return "unknown undo state error";
}

StateError::StateError(StateErrorKind kind) : std::runtime_error(to_string(kind)), kind_(kind) {}

StateError::StateError(StateErrorKind kind, const std::string& detail)
    : std::runtime_error(kind == StateErrorKind::InvalidData ? detail
                                                             : std::string(to_string(kind)) + ": " + detail),
      kind_(kind) {}

} // namespace strata
