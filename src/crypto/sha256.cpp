#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <vector>

namespace cursorup {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const std::uint8_t b : bytes) {
        out.push_back(kHex[(b >> 4) & 0xF]);
        out.push_back(kHex[b & 0xF]);
    }
    return out;
}

} // namespace

struct Sha256Hasher::Impl {
    EvpCtxPtr ctx{EVP_MD_CTX_new()};
    bool failed = false;
    bool finalized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        impl_->failed = true;
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || impl_->failed || impl_->finalized || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->failed = true;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || impl_->failed || impl_->finalized) return {};
    impl_->finalized = true;

    std::array<std::uint8_t, 32> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
        return {};
    }
    return HexEncode(digest);
}

std::string Sha256Hex(std::string_view data) {
    Sha256Hasher hasher;
    hasher.Update(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
    return hasher.FinalHex();
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.FinalHex();
}

Outcome<std::string> Sha256HexFile(const std::string& path) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return Unexpected(r);

    std::string hex = Sha256Hex(reader);
    if (hex.empty()) return Unexpected(ErrorKind::IoError, "sha256 failed for " + path);
    return hex;
}

} // namespace cursorup
