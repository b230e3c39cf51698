#include "strata/hash.hpp"
#include "strata/state_error.hpp"
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>

namespace strata {

namespace {

constexpr size_t kChunkSize = 8192;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx new_sha256() {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw StateError(StateErrorKind::Io, "failed to initialise sha256");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, size_t len) {
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw StateError(StateErrorKind::Io, "sha256 update failed");
    }
}

Digest finish(EVP_MD_CTX* ctx) {
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1 || len != kDigestLength) {
        throw StateError(StateErrorKind::Io, "sha256 finalisation failed");
    }
    return out;
}

} // namespace

Digest hash_stream(std::istream& in) {
    MdCtx ctx = new_sha256();
    char buf[kChunkSize];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0) update(ctx.get(), buf, static_cast<size_t>(n));
    }
    // eof sets failbit on the final short read; only badbit is an error
    if (in.bad()) {
        throw StateError(StateErrorKind::Io, "read failed while hashing");
    }
    return finish(ctx.get());
}

Digest hash_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StateError(StateErrorKind::Io, "cannot open " + path.string());
    }
    return hash_stream(in);
}

Digest hash_bytes(std::string_view bytes) {
    MdCtx ctx = new_sha256();
    update(ctx.get(), bytes.data(), bytes.size());
    return finish(ctx.get());
}

std::string to_hex(const Digest& digest) {
    std::stringstream ss;
    for (uint8_t b : digest) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

} // namespace strata
