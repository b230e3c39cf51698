#pragma once

#include <stdexcept>
#include <string>

namespace strata {

enum class StateErrorKind {
    Outdated,      // undo file digest does not match the live file
    InvalidHeader, // bad magic or unsupported format version
    InvalidOffset, // merge/commit computed an out-of-range revision index
    InvalidData,   // structural violation while reconstructing a history
    InvalidHash,   // a persisted record does not match its own digest
    Io,
};

// Errors raised by the undo persistence layer.
class StateError : public std::runtime_error {
public:
    explicit StateError(StateErrorKind kind);
    StateError(StateErrorKind kind, const std::string& detail);

    StateErrorKind kind() const { return kind_; }

private:
    StateErrorKind kind_;
};

const char* to_string(StateErrorKind kind);

} // namespace strata
