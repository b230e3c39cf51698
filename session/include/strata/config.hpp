#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace strata {

struct Config {
    std::filesystem::path file;
    std::filesystem::path undo_dir;
    std::optional<std::filesystem::path> chain_db;
    bool persist_undo {true};
};

// Reads --file, --undo-dir, --db and --no-undo. The undo directory falls back
// to $STRATA_UNDO_DIR, then to ".strata" next to the document. Throws
// std::invalid_argument when --file is missing.
Config config_from_args(int argc, char** argv);

// Decimal digits only; nullopt for anything else, including signs and values
// that do not fit in size_t.
std::optional<size_t> parse_count(const std::string& text);

std::filesystem::path default_undo_dir(const std::filesystem::path& file);

// Undo file for `file` inside `undo_dir`: the absolute path with '%' doubled
// and separators replaced by '%', plus ".undo".
std::filesystem::path undo_path_for(const std::filesystem::path& undo_dir, const std::filesystem::path& file);

} // namespace strata
