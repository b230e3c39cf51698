#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace strata {

// SHA-256. The width is part of the undo file format (version 1) and is not
// recorded in the header.
constexpr size_t kDigestLength = 32;

using Digest = std::array<uint8_t, kDigestLength>;

// Hashes everything left in the stream, reading it in bounded chunks.
Digest hash_stream(std::istream& in);

Digest hash_file(const std::filesystem::path& path);

Digest hash_bytes(std::string_view bytes);

std::string to_hex(const Digest& digest);

} // namespace strata
