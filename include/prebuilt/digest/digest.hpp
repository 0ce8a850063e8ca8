#pragma once

/*
 * prebuilt-fetch Digest Verifier
 *
 * Streaming SHA-256 over an ordered byte stream. A sink is fed sequential chunks
 * (any size, no gaps or overlaps) and finalized exactly once into a lower-case hex
 * digest. The same sink type serves both the cached-file check and the in-flight
 * download check, where it runs alongside the staging-file writer.
 */

#include <prebuilt/core/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace prebuilt::digest {

/**
 * Write-only accumulator for a streaming digest.
 */
class IDigestSink {
public:
    virtual ~IDigestSink() = default;

    /**
     * Feed the next chunk. Empty chunks are accepted and change nothing.
     * Fails with ErrorCode::DigestState once the sink has been finalized.
     */
    virtual Result<void> update(ByteSpan data) = 0;

    /**
     * Close the sink and return the lower-case hex digest. Terminal: a second call
     * fails with ErrorCode::DigestState.
     */
    virtual Result<std::string> finalize() = 0;

    [[nodiscard]] virtual bool finalized() const noexcept = 0;
};

/**
 * Create a fresh SHA-256 sink (OpenSSL EVP).
 */
std::unique_ptr<IDigestSink> newDigestStream();

/**
 * Exact comparison of two hex digests, ignoring ASCII case. Lengths must match;
 * there is no prefix or truncated matching. Two empty strings never match.
 */
[[nodiscard]] bool verifyDigest(std::string_view actualHex, std::string_view expectedHex) noexcept;

/**
 * True when s is exactly 64 hexadecimal characters (either case).
 */
[[nodiscard]] bool isSha256Hex(std::string_view s) noexcept;

/**
 * Stream an existing file through a new digest sink.
 * Missing or unreadable files yield ErrorCode::FilesystemError.
 */
Result<std::string> digestFile(const std::filesystem::path& path);

} // namespace prebuilt::digest
