#pragma once

#include "strata/hash.hpp"
#include "strata/history.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>

namespace strata {

// On-disk layout, in order:
//   magic (5 bytes) | version (1 byte) | current | last saved revision |
//   last saved timestamp | digest (kDigestLength bytes) | revision count |
//   revision records...
// Integers are unsigned LEB128, timestamps are nanoseconds since the Unix
// epoch. Revision records are only ever appended; the header is rewritten on
// every save.
constexpr char kUndoFileMagic[] = {'S', 'T', 'R', 'A', 'T'};
constexpr size_t kUndoFileMagicLength = sizeof(kUndoFileMagic);
constexpr uint8_t kUndoFileVersion = 1;

struct UndoFileHeader {
    size_t current {0};
    size_t last_saved_revision {0};
    Timestamp last_saved_at {};
    Digest digest {};
};

// What an undo file records, read without consulting the live file.
struct UndoFileStatus {
    UndoFileHeader header;
    size_t revision_count {0};
};

struct LoadedHistory {
    History history;
    size_t last_saved_revision {0};
    Timestamp last_saved_at {};
};

void write_header(std::ostream& out, const UndoFileHeader& header);

// Parses the header and checks magic and version (StateError InvalidHeader)
// without looking at the live file.
UndoFileHeader read_header_unchecked(std::istream& in);

// As read_header_unchecked, and additionally requires the stored digest to
// match the current contents of `live` (StateError Outdated otherwise).
UndoFileHeader read_header(std::istream& in, const std::filesystem::path& live);

bool is_valid(std::istream& in, const std::filesystem::path& live);

void write_transaction(std::ostream& out, const Transaction& tx);
Transaction read_transaction(std::istream& in);

void write_revision(std::ostream& out, const Revision& rev);
Revision read_revision(std::istream& in);

// Writes a complete undo file: header, count and every revision.
void serialize_history(std::ostream& out,
                       const History& history,
                       const std::filesystem::path& live,
                       size_t last_saved_revision);

LoadedHistory deserialize_history(std::istream& in, const std::filesystem::path& live);

// The undo file belonging to one document.
class UndoFile {
public:
    explicit UndoFile(std::filesystem::path path) : path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }
    bool exists() const;

    // Appends revisions [offset, history.size()) to the file and rewrites the
    // header with the digest of `live`. The previously written records are
    // carried over byte for byte; the new file replaces the old one through a
    // rename so the header is never left half written.
    void save(const History& history,
              const std::filesystem::path& live,
              size_t last_saved_revision,
              size_t offset) const;

    LoadedHistory load(const std::filesystem::path& live) const;
    UndoFileStatus status() const;
    bool isValid(const std::filesystem::path& live) const;

    void discard() const;

private:
    std::filesystem::path path_;
};

} // namespace strata
