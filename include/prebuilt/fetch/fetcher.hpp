#pragma once

/*
 * prebuilt-fetch - Fetch/verify/cache public types and interfaces
 *
 * One invocation handles exactly one (url, expected digest) pair:
 * - Verification gate: no expected digest means "trust the local build", no network.
 * - Cache check: an existing final file whose SHA-256 matches short-circuits the fetch.
 * - Fetch: HTTP GET with an explicit, bounded redirect loop and optional proxy; the body
 *   streams to the staging file and the digest sink in a single pass.
 * - Publish: the staging file is renamed over the final path only after the digest matches.
 *
 * Callers running several installs against one cache directory must serialize them;
 * no lock is taken here.
 */

#include <prebuilt/core/types.h>
#include <prebuilt/version.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace prebuilt::fetch {

// ===================
// Small data objects
// ===================

/**
 * What to fetch and what it must hash to. An empty expectedDigestHex disables
 * verification (and therefore fetching) entirely.
 */
struct ArtifactSpec {
    std::string sourceUrl;
    std::string expectedDigestHex;
};

/**
 * finalPath only ever holds verified bytes; stagingPath holds an in-flight or
 * abandoned download and is never trusted.
 */
struct CachePaths {
    std::filesystem::path finalPath;
    std::filesystem::path stagingPath;
};

/**
 * Result of one successful body transfer.
 */
struct DownloadOutcome {
    std::string digestHex;
    std::uint64_t bytesWritten{0};
};

enum class EnsureStatus { SkippedNoChecksum, CacheHit, Downloaded };

struct EnsureResult {
    EnsureStatus status{EnsureStatus::SkippedNoChecksum};
    std::optional<DownloadOutcome> download{};
    std::string servedFrom; // URL that answered 200 (after redirects)
    int redirectsFollowed{0};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Transport and redirect policy for one pipeline.
 *
 * The transfer is aborted when it stays below lowSpeedLimitBytes per second for
 * lowSpeedTime; totalTimeout of zero means no overall cap.
 */
struct FetchOptions {
    std::optional<std::string> proxy;
    int maxRedirects{10};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds totalTimeout{0};
    long lowSpeedLimitBytes{1};
    std::chrono::seconds lowSpeedTime{60};
    TlsConfig tls{};
    std::string userAgent{"prebuilt-fetch/" PREBUILT_VERSION_STRING};
};

/**
 * Status line and redirect target of a single, non-following HTTP exchange.
 */
struct HttpResponse {
    long status{0};
    std::string reason;
    std::optional<std::string> location;
    std::uint64_t bodyBytes{0}; // bytes handed to the sink (200 only)
};

using BodySink = std::function<Result<void>(ByteSpan)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation in http_adapter_curl.cpp).
 * Implementations must not follow redirects themselves.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Issue one GET. The sink is called, in order, with the body chunks of a 200
     * response only; bodies of any other status are discarded. A sink error aborts
     * the transfer and is returned as-is.
     */
    virtual Result<HttpResponse> get(std::string_view url, const FetchOptions& options,
                                     const BodySink& sink) = 0;
};

/**
 * Staging file writer with atomic publish.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Create (or truncate) the staging file, creating parent directories as needed.
     */
    virtual Result<void> openStaging(const std::filesystem::path& stagingPath) = 0;

    virtual Result<void> append(ByteSpan data) = 0;

    /**
     * Flush and fsync the staging file. Returns the number of bytes written since
     * openStaging().
     */
    virtual Result<std::uint64_t> close() = 0;

    /**
     * Single rename of the staging file onto the final path.
     */
    virtual Result<void> publish(const std::filesystem::path& stagingPath,
                                 const std::filesystem::path& finalPath) = 0;

    /**
     * Best-effort removal of the staging file.
     */
    virtual void cleanup(const std::filesystem::path& stagingPath) noexcept = 0;
};

/**
 * Fetch-verify-cache orchestrator.
 */
class IArtifactFetcher {
public:
    virtual ~IArtifactFetcher() = default;

    /**
     * Make finalPath hold bytes matching spec.expectedDigestHex, fetching only when
     * the cached copy is missing, unreadable or stale. proxyEndpoint, when given,
     * overrides FetchOptions::proxy.
     */
    virtual Result<EnsureResult>
    ensureArtifact(const ArtifactSpec& spec, const CachePaths& paths,
                   const std::optional<std::string>& proxyEndpoint = std::nullopt) = 0;
};

// ==========
// Factories
// ==========

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();

std::unique_ptr<IArtifactFetcher> makeArtifactFetcher(const FetchOptions& options);

/**
 * Null dependencies fall back to the libcurl adapter and the default disk writer.
 */
std::unique_ptr<IArtifactFetcher>
makeArtifactFetcherWithDependencies(const FetchOptions& options, std::unique_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IDiskWriter> disk);

// ======================
// Utility helpers
// ======================

/**
 * Resolve a Location header value against the URL that produced it. Absolute
 * locations are returned normalized; relative ones are merged with base.
 */
Result<std::string> resolveRedirectLocation(std::string_view baseUrl, std::string_view location);

[[nodiscard]] inline bool isRedirectStatus(long status) noexcept {
    return status >= 300 && status < 400;
}

} // namespace prebuilt::fetch
