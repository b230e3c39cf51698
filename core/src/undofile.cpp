#include "strata/undofile.hpp"
#include "strata/state_error.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace strata {

namespace {

constexpr size_t kMaxVarintBytes = 10;
constexpr size_t kStringChunk = 64 * 1024;

[[noreturn]] void truncated() {
    throw StateError(StateErrorKind::InvalidData, "unexpected end of undofile");
}

void check_read(std::istream& in) {
    if (in.bad()) throw StateError(StateErrorKind::Io, "read failed");
    if (!in) truncated();
}

void write_u8(std::ostream& out, uint8_t v) { out.put(static_cast<char>(v)); }

uint8_t read_u8(std::istream& in) {
    char c = 0;
    in.get(c);
    check_read(in);
    return static_cast<uint8_t>(c);
}

void write_varint(std::ostream& out, uint64_t v) {
    while (v >= 0x80) {
        write_u8(out, static_cast<uint8_t>(v | 0x80));
        v >>= 7;
    }
    write_u8(out, static_cast<uint8_t>(v));
}

uint64_t read_varint(std::istream& in) {
    uint64_t v = 0;
    for (size_t i = 0; i < kMaxVarintBytes; ++i) {
        uint8_t b = read_u8(in);
        v |= static_cast<uint64_t>(b & 0x7f) << (7 * i);
        if ((b & 0x80) == 0) return v;
    }
    throw StateError(StateErrorKind::InvalidData, "varint is too long");
}

size_t read_size(std::istream& in) { return static_cast<size_t>(read_varint(in)); }

void write_u32(std::ostream& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) write_u8(out, static_cast<uint8_t>(v >> (8 * i)));
}

uint32_t read_u32(std::istream& in) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(read_u8(in)) << (8 * i);
    return v;
}

void write_string(std::ostream& out, const std::string& s) {
    write_varint(out, s.size());
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

std::string read_string(std::istream& in) {
    size_t len = read_size(in);
    std::string s;
    // grow as the bytes arrive so a corrupt length cannot allocate up front
    while (s.size() < len) {
        size_t n = std::min(kStringChunk, len - s.size());
        size_t at = s.size();
        s.resize(at + n);
        in.read(&s[at], static_cast<std::streamsize>(n));
        check_read(in);
    }
    return s;
}

void write_timestamp(std::ostream& out, Timestamp t) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    write_varint(out, static_cast<uint64_t>(ns));
}

Timestamp read_timestamp(std::istream& in) {
    auto ns = static_cast<int64_t>(read_varint(in));
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(ns)));
}

void write_flag(std::ostream& out, bool present) { write_u8(out, present ? 1 : 0); }

bool read_flag(std::istream& in) {
    uint8_t b = read_u8(in);
    if (b > 1) throw StateError(StateErrorKind::InvalidData, "invalid presence flag " + std::to_string(b));
    return b == 1;
}

void write_selection(std::ostream& out, const Selection& sel) {
    write_varint(out, sel.primary_index);
    write_varint(out, sel.ranges.size());
    for (const auto& r : sel.ranges) {
        write_varint(out, r.anchor);
        write_varint(out, r.head);
        write_flag(out, r.old_visual_position.has_value());
        if (r.old_visual_position) {
            write_u32(out, r.old_visual_position->row);
            write_u32(out, r.old_visual_position->col);
        }
    }
}

Selection read_selection(std::istream& in) {
    Selection sel;
    sel.primary_index = read_size(in);
    size_t count = read_size(in);
    for (size_t i = 0; i < count; ++i) {
        Range r;
        r.anchor = read_size(in);
        r.head = read_size(in);
        if (read_flag(in)) {
            VisualPosition pos;
            pos.row = read_u32(in);
            pos.col = read_u32(in);
            r.old_visual_position = pos;
        }
        sel.ranges.push_back(r);
    }
    if (!sel.ranges.empty() && sel.primary_index >= sel.ranges.size()) {
        throw StateError(StateErrorKind::InvalidData, "selection primary index out of range");
    }
    return sel;
}

void copy_rest(std::istream& in, std::ostream& out) {
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0) out.write(buf, n);
    }
    if (in.bad()) throw StateError(StateErrorKind::Io, "failed to copy revision records");
}

void write_file_body(std::ostream& out, const History& history, const Digest& digest, size_t last_saved_revision) {
    UndoFileHeader header;
    header.current = history.currentRevision();
    header.last_saved_revision = last_saved_revision;
    header.last_saved_at = std::chrono::system_clock::now();
    header.digest = digest;
    write_header(out, header);
    write_varint(out, history.size());
}

} // namespace

void write_header(std::ostream& out, const UndoFileHeader& header) {
    out.write(kUndoFileMagic, kUndoFileMagicLength);
    write_u8(out, kUndoFileVersion);
    write_varint(out, header.current);
    write_varint(out, header.last_saved_revision);
    write_timestamp(out, header.last_saved_at);
    out.write(reinterpret_cast<const char*>(header.digest.data()), kDigestLength);
}

UndoFileHeader read_header_unchecked(std::istream& in) {
    char magic[kUndoFileMagicLength];
    in.read(magic, kUndoFileMagicLength);
    if (in.bad()) throw StateError(StateErrorKind::Io, "read failed");
    if (!in || std::memcmp(magic, kUndoFileMagic, kUndoFileMagicLength) != 0) {
        throw StateError(StateErrorKind::InvalidHeader, "bad magic");
    }
    char version = 0;
    in.get(version);
    if (!in || static_cast<uint8_t>(version) != kUndoFileVersion) {
        throw StateError(StateErrorKind::InvalidHeader, "unsupported version");
    }

    UndoFileHeader header;
    header.current = read_size(in);
    header.last_saved_revision = read_size(in);
    header.last_saved_at = read_timestamp(in);
    in.read(reinterpret_cast<char*>(header.digest.data()), kDigestLength);
    check_read(in);
    return header;
}

UndoFileHeader read_header(std::istream& in, const fs::path& live) {
    UndoFileHeader header = read_header_unchecked(in);
    if (hash_file(live) != header.digest) {
        throw StateError(StateErrorKind::Outdated);
    }
    return header;
}

bool is_valid(std::istream& in, const fs::path& live) {
    try {
        read_header(in, live);
        return true;
    } catch (const StateError&) {
        return false;
    }
}

void write_transaction(std::ostream& out, const Transaction& tx) {
    write_flag(out, tx.selection.has_value());
    if (tx.selection) write_selection(out, *tx.selection);

    const ChangeSet& cs = tx.changes;
    write_varint(out, cs.len());
    write_varint(out, cs.lenAfter());
    write_varint(out, cs.operations().size());
    for (const auto& op : cs.operations()) {
        write_u8(out, static_cast<uint8_t>(op.kind));
        switch (op.kind) {
        case Operation::Kind::Retain:
        case Operation::Kind::Delete:
            write_varint(out, op.count);
            break;
        case Operation::Kind::Insert:
            write_string(out, op.text);
            break;
        }
    }
}

Transaction read_transaction(std::istream& in) {
    Transaction tx;
    if (read_flag(in)) tx.selection = read_selection(in);

    size_t len = read_size(in);
    size_t len_after = read_size(in);
    size_t count = read_size(in);
    std::vector<Operation> ops;
    for (size_t i = 0; i < count; ++i) {
        uint8_t tag = read_u8(in);
        switch (tag) {
        case 0: ops.push_back(Operation::retain(read_size(in))); break;
        case 1: ops.push_back(Operation::remove(read_size(in))); break;
        case 2: ops.push_back(Operation::insert(read_string(in))); break;
        default:
            throw StateError(StateErrorKind::InvalidData, "unknown operation tag " + std::to_string(tag));
        }
    }
    tx.changes = ChangeSet::fromParts(std::move(ops), len, len_after);
    if (!tx.changes.isConsistent()) {
        throw StateError(StateErrorKind::InvalidData, "change set lengths do not match its operations");
    }
    return tx;
}

void write_revision(std::ostream& out, const Revision& rev) {
    write_varint(out, rev.parent);
    write_transaction(out, rev.transaction ? *rev.transaction : Transaction{});
    write_transaction(out, rev.inversion ? *rev.inversion : Transaction{});
    write_timestamp(out, rev.timestamp);
}

Revision read_revision(std::istream& in) {
    Revision rev;
    rev.parent = read_size(in);
    rev.transaction = std::make_shared<const Transaction>(read_transaction(in));
    rev.inversion = std::make_shared<const Transaction>(read_transaction(in));
    rev.timestamp = read_timestamp(in);
    return rev;
}

void serialize_history(std::ostream& out, const History& history, const fs::path& live, size_t last_saved_revision) {
    write_file_body(out, history, hash_file(live), last_saved_revision);
    for (const auto& rev : history.revisions()) write_revision(out, rev);
    if (!out) throw StateError(StateErrorKind::Io, "write failed");
}

LoadedHistory deserialize_history(std::istream& in, const fs::path& live) {
    UndoFileHeader header = read_header(in, live);
    size_t count = read_size(in);
    std::vector<Revision> revisions;
    revisions.reserve(std::min<size_t>(count, 4096));
    for (size_t i = 0; i < count; ++i) revisions.push_back(read_revision(in));
    // fromRevisions rejects non-contiguous parents and a missing root
    LoadedHistory loaded{History::fromRevisions(std::move(revisions), header.current),
                         header.last_saved_revision, header.last_saved_at};
    return loaded;
}

bool UndoFile::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

void UndoFile::save(const History& history, const fs::path& live, size_t last_saved_revision, size_t offset) const {
    if (offset > history.size()) {
        throw StateError(StateErrorKind::InvalidOffset,
                         "offset " + std::to_string(offset) + " exceeds " + std::to_string(history.size()) +
                             " revisions");
    }
    const Digest digest = hash_file(live);

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) throw StateError(StateErrorKind::Io, ec.message());
    }

    fs::path tmp = path_;
    tmp += ".tmp";
    try {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw StateError(StateErrorKind::Io, "cannot open " + tmp.string());
        write_file_body(out, history, digest, last_saved_revision);

        if (offset > 0) {
            std::ifstream in(path_, std::ios::binary);
            if (!in) {
                throw StateError(StateErrorKind::InvalidOffset,
                                 "no undo file to append to at offset " + std::to_string(offset));
            }
            read_header_unchecked(in);
            size_t existing = read_size(in);
            if (existing != offset) {
                throw StateError(StateErrorKind::InvalidOffset,
                                 "undo file holds " + std::to_string(existing) + " revisions, expected " +
                                     std::to_string(offset));
            }
            copy_rest(in, out);
        }
        const auto& revs = history.revisions();
        for (size_t i = offset; i < revs.size(); ++i) write_revision(out, revs[i]);
        out.flush();
        if (!out) throw StateError(StateErrorKind::Io, "write failed for " + tmp.string());
    } catch (const StateError&) {
        fs::remove(tmp, ec);
        throw;
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StateError(StateErrorKind::Io, "cannot replace " + path_.string());
    }
}

LoadedHistory UndoFile::load(const fs::path& live) const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw StateError(StateErrorKind::Io, "cannot open " + path_.string());
    return deserialize_history(in, live);
}

UndoFileStatus UndoFile::status() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw StateError(StateErrorKind::Io, "cannot open " + path_.string());
    UndoFileStatus status;
    status.header = read_header_unchecked(in);
    status.revision_count = read_size(in);
    return status;
}

bool UndoFile::isValid(const fs::path& live) const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) return false;
    return is_valid(in, live);
}

void UndoFile::discard() const {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) throw StateError(StateErrorKind::Io, "cannot remove " + path_.string());
}

} // namespace strata
