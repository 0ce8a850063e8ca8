/*
 * prebuilt/src/digest/digest_sink.cpp
 *
 * SHA-256 digest sink via OpenSSL EVP.
 * - update() feeds byte spans to the active digest context.
 * - finalize() is terminal; the sink cannot be reused afterwards.
 */

#include <prebuilt/digest/digest.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <fstream>
#include <system_error>

namespace prebuilt::digest {

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
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

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

class OpenSslSha256Sink final : public IDigestSink {
public:
    OpenSslSha256Sink() {
        if (!_ctx || EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) != 1) {
            _initError = true;
        }
    }

    Result<void> update(ByteSpan data) override {
        if (_finalized) {
            return Error{ErrorCode::DigestState, "write to a finalized digest sink"};
        }
        if (_initError) {
            return Error{ErrorCode::Unknown, "SHA-256 context initialization failed"};
        }
        if (data.empty())
            return {};
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            return Error{ErrorCode::Unknown, "EVP_DigestUpdate failed"};
        }
        return {};
    }

    Result<std::string> finalize() override {
        if (_finalized) {
            return Error{ErrorCode::DigestState, "digest sink finalized twice"};
        }
        _finalized = true;
        if (_initError) {
            return Error{ErrorCode::Unknown, "SHA-256 context initialization failed"};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            return Error{ErrorCode::Unknown, "EVP_DigestFinal_ex failed"};
        }
        return to_hex_lower(md_buf.data(), md_len);
    }

    bool finalized() const noexcept override { return _finalized; }

private:
    EvpMdCtx _ctx{};
    bool _initError{false};
    bool _finalized{false};
};

} // namespace

std::unique_ptr<IDigestSink> newDigestStream() {
    return std::make_unique<OpenSslSha256Sink>();
}

bool verifyDigest(std::string_view actualHex, std::string_view expectedHex) noexcept {
    if (actualHex.empty() || actualHex.size() != expectedHex.size())
        return false;
    for (std::size_t i = 0; i < actualHex.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(actualHex[i])) !=
            std::tolower(static_cast<unsigned char>(expectedHex[i]))) {
            return false;
        }
    }
    return true;
}

bool isSha256Hex(std::string_view s) noexcept {
    if (s.size() != HASH_STRING_SIZE)
        return false;
    for (unsigned char c : s) {
        if (!std::isxdigit(c))
            return false;
    }
    return true;
}

Result<std::string> digestFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::FilesystemError, "not a readable file: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FilesystemError, "failed to open: " + path.string()};
    }

    auto sink = newDigestStream();
    std::array<char, DEFAULT_BUFFER_SIZE> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) {
            auto r = sink->update(ByteSpan(reinterpret_cast<const std::byte*>(buffer.data()),
                                           static_cast<std::size_t>(got)));
            if (!r)
                return r.error();
        }
    }
    if (!in.eof()) {
        return Error{ErrorCode::FilesystemError, "read failed for: " + path.string()};
    }
    spdlog::debug("digested {}", path.string());
    return sink->finalize();
}

} // namespace prebuilt::digest
