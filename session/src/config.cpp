#include "strata/config.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace fs = std::filesystem;

namespace strata {

static std::optional<std::string> get_arg(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

static bool has_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

Config config_from_args(int argc, char** argv) {
    Config config;
    auto file = get_arg(argc, argv, "--file");
    if (!file) throw std::invalid_argument("--file is required");
    config.file = *file;
    if (auto dir = get_arg(argc, argv, "--undo-dir")) {
        config.undo_dir = *dir;
    } else {
        config.undo_dir = default_undo_dir(config.file);
    }
    if (auto db = get_arg(argc, argv, "--db")) config.chain_db = fs::path(*db);
    config.persist_undo = !has_flag(argc, argv, "--no-undo");
    return config;
}

std::optional<size_t> parse_count(const std::string& text) {
    if (text.empty()) return std::nullopt;
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        const size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

fs::path default_undo_dir(const fs::path& file) {
    if (const char* env = std::getenv("STRATA_UNDO_DIR")) {
        if (*env) return fs::path(env);
    }
    return fs::absolute(file).lexically_normal().parent_path() / ".strata";
}

fs::path undo_path_for(const fs::path& undo_dir, const fs::path& file) {
    const std::string full = fs::absolute(file).lexically_normal().string();
    std::string name;
    name.reserve(full.size() + 8);
    for (char c : full) {
        if (c == '%') {
            name += "%%";
        } else if (c == '/' || c == fs::path::preferred_separator) {
            name += '%';
        } else {
            name += c;
        }
    }
    return undo_dir / (name + ".undo");
}

} // namespace strata
