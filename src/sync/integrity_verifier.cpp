/*
 * mediasync/src/sync/integrity_verifier.cpp
 *
 * IntegrityVerifier (MD5 / SHA-256 via OpenSSL EVP)
 *
 * Implements mediasync::sync::IIntegrityVerifier using OpenSSL's EVP interface.
 * - MD5 is the default because catalog digests are MD5.
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns a Checksum { algo, hex } and re-arms the context.
 *
 * fileChecksum() streams a file through a verifier in 4 KiB blocks.
 *
 * Dependencies:
 * - OpenSSL::Crypto (linked by CMake in the mediasync_core target)
 */

#include <mediasync/sync/sync.hpp>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>

namespace mediasync::sync {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
            return EVP_sha256();
    }
    return EVP_md5();
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { reset(algo); }

    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(_algo);
        _ctx = EvpMdCtx{};
        _finalized = false;
        if (!_ctx || !_md) {
            // Leave ctx null; finalize() reports an empty digest.
            return;
        }
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            _ctx = EvpMdCtx{};
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || _finalized || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            // A failed update poisons the digest; finalize() reports it as empty.
            _ctx = EvpMdCtx{};
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;

        if (!_ctx || _finalized) {
            out.hex.clear();
            reset(_algo);
            return out;
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;

        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            out.hex.clear();
            _finalized = true;
            return out;
        }

        out.hex = to_hex_lower(md_buf.data(), md_len);
        _finalized = true;

        // Prepare for potential reuse: re-init with same algo
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Md5};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
    bool _finalized{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

Result<std::string> fileChecksum(const std::filesystem::path& path, HashAlgo algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for checksum: " + path.string()};
    }

    auto verifier = makeIntegrityVerifier(algo);
    std::array<char, CHECKSUM_BLOCK_SIZE> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) {
            verifier->update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(got)));
        }
    }
    if (!in.eof()) {
        return Error{ErrorCode::IoError, "Read failed during checksum: " + path.string()};
    }

    auto digest = verifier->finalize();
    if (digest.hex.empty()) {
        return Error{ErrorCode::InternalError, "Failed to finalize checksum: " + path.string()};
    }
    return digest.hex;
}

bool checksumEquals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace mediasync::sync
