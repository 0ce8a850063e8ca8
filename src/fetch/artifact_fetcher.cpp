/*
 * prebuilt/src/fetch/artifact_fetcher.cpp
 *
 * ArtifactFetcher (single artifact, single stream):
 * - Skip everything when no expected digest is configured
 * - Reuse the final file when its SHA-256 already matches
 * - Otherwise GET the source URL, following at most maxRedirects redirects explicitly
 * - Each 200 body chunk goes to the staging file, then to the digest sink
 * - Rename staging over the final path only after the digest matches
 *
 * NOTE:
 * - No retries; a failed run is retried by running the pipeline again.
 */

#include <prebuilt/digest/digest.hpp>
#include <prebuilt/fetch/fetcher.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <system_error>
#include <utility>

namespace prebuilt::fetch {

namespace fs = std::filesystem;

namespace {

// Absolute, symlink-resolved form for comparison; falls back to a lexical form
fs::path comparablePath(const fs::path& p) {
    std::error_code ec;
    auto canon = fs::weakly_canonical(p, ec);
    if (!ec)
        return canon;
    auto abs = fs::absolute(p, ec);
    return ec ? p.lexically_normal() : abs.lexically_normal();
}

bool sameFile(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    if (fs::equivalent(a, b, ec))
        return true; // hard links, bind mounts
    return comparablePath(a) == comparablePath(b);
}

} // namespace

class ArtifactFetcher final : public IArtifactFetcher {
public:
    ArtifactFetcher(FetchOptions options, std::unique_ptr<IHttpAdapter> http,
                    std::unique_ptr<IDiskWriter> disk)
        : options_(std::move(options)), http_(std::move(http)), disk_(std::move(disk)) {
        if (!http_)
            http_ = makeCurlHttpAdapter();
        if (!disk_)
            disk_ = makeDiskWriter();
    }

    Result<EnsureResult> ensureArtifact(const ArtifactSpec& spec, const CachePaths& paths,
                                        const std::optional<std::string>& proxyEndpoint) override {
        try {
            // Verification gate
            if (spec.expectedDigestHex.empty()) {
                spdlog::info("(no checksum provided; assuming local build)");
                return EnsureResult{EnsureStatus::SkippedNoChecksum};
            }

            // Pre-checks
            if (!digest::isSha256Hex(spec.expectedDigestHex)) {
                return Error{ErrorCode::InvalidArgument,
                             "expected checksum is not a SHA-256 hex digest: " +
                                 spec.expectedDigestHex};
            }
            if (paths.finalPath.empty() || paths.stagingPath.empty()) {
                return Error{ErrorCode::InvalidArgument, "cache paths must not be empty"};
            }
            if (sameFile(paths.finalPath, paths.stagingPath)) {
                return Error{ErrorCode::InvalidArgument,
                             "staging and final paths must differ: " + paths.finalPath.string()};
            }
            if (options_.maxRedirects < 0) {
                return Error{ErrorCode::InvalidArgument, "maxRedirects must not be negative"};
            }

            // Cache check
            if (cachedCopyMatches(spec, paths)) {
                spdlog::info("local build artifact is up-to-date");
                return EnsureResult{EnsureStatus::CacheHit};
            }

            if (spec.sourceUrl.empty()) {
                return Error{ErrorCode::InvalidArgument, "no source URL to download from"};
            }

            FetchOptions effective = options_;
            if (proxyEndpoint) {
                if (proxyEndpoint->empty())
                    effective.proxy.reset();
                else
                    effective.proxy = *proxyEndpoint;
            }
            return fetchAndPublish(spec, paths, effective);
        } catch (const std::exception& ex) {
            return Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
        }
    }

private:
    // Any read problem means "not cached"; it never fails the run by itself
    bool cachedCopyMatches(const ArtifactSpec& spec, const CachePaths& paths) const {
        std::error_code ec;
        if (!fs::exists(paths.finalPath, ec))
            return false;

        auto cached = digest::digestFile(paths.finalPath);
        if (!cached) {
            spdlog::warn("cannot read cached artifact ({}); downloading again",
                         cached.error().message);
            return false;
        }
        if (digest::verifyDigest(cached.value(), spec.expectedDigestHex))
            return true;

        spdlog::info("local build artifact is outdated");
        spdlog::debug("cached digest {} != expected {}", cached.value(), spec.expectedDigestHex);
        return false;
    }

    Result<EnsureResult> fetchAndPublish(const ArtifactSpec& spec, const CachePaths& paths,
                                         const FetchOptions& effective) {
        std::string url = spec.sourceUrl;
        int redirects = 0;

        for (;;) {
            spdlog::info("downloading {}", url);

            auto sink = digest::newDigestStream();
            bool stagingOpen = false;

            // Fan-out: staging file first, then the digest; either failure aborts
            BodySink body = [&](ByteSpan data) -> Result<void> {
                if (!stagingOpen) {
                    auto opened = disk_->openStaging(paths.stagingPath);
                    if (!opened)
                        return opened;
                    stagingOpen = true;
                }
                auto wr = disk_->append(data);
                if (!wr)
                    return wr;
                return sink->update(data);
            };

            auto resp = http_->get(url, effective, body);
            if (!resp) {
                if (stagingOpen)
                    disk_->cleanup(paths.stagingPath);
                return resp.error();
            }
            const HttpResponse& r = resp.value();

            if (isRedirectStatus(r.status) && r.location) {
                if (redirects >= effective.maxRedirects) {
                    return Error{ErrorCode::RedirectLoop,
                                 fmt::format("more than {} redirects while fetching {}",
                                             effective.maxRedirects, spec.sourceUrl)};
                }
                auto next = resolveRedirectLocation(url, *r.location);
                if (!next)
                    return next.error();
                ++redirects;
                url = next.value();
                spdlog::info("following redirect to {}", url);
                continue;
            }

            if (r.status != 200) {
                return Error{ErrorCode::HttpStatus,
                             fmt::format("HTTP error: {} {} ({})", r.status, r.reason, url)};
            }

            // A 200 with an empty body still produces an (empty) staging file
            if (!stagingOpen) {
                auto opened = disk_->openStaging(paths.stagingPath);
                if (!opened)
                    return opened.error();
            }

            auto closed = disk_->close();
            if (!closed) {
                disk_->cleanup(paths.stagingPath);
                return closed.error();
            }

            auto actual = sink->finalize();
            if (!actual) {
                disk_->cleanup(paths.stagingPath);
                return actual.error();
            }

            if (!digest::verifyDigest(actual.value(), spec.expectedDigestHex)) {
                disk_->cleanup(paths.stagingPath);
                return Error{ErrorCode::DigestMismatch,
                             fmt::format("Digest mismatch. Expected {} got {}",
                                         spec.expectedDigestHex, actual.value())};
            }

            auto published = disk_->publish(paths.stagingPath, paths.finalPath);
            if (!published) {
                disk_->cleanup(paths.stagingPath);
                return published.error();
            }

            spdlog::debug("published {} ({} bytes, sha256 {})", paths.finalPath.string(),
                          closed.value(), actual.value());

            EnsureResult out;
            out.status = EnsureStatus::Downloaded;
            out.download = DownloadOutcome{actual.value(), closed.value()};
            out.servedFrom = url;
            out.redirectsFollowed = redirects;
            return out;
        }
    }

private:
    FetchOptions options_;
    std::unique_ptr<IHttpAdapter> http_;
    std::unique_ptr<IDiskWriter> disk_;
};

std::unique_ptr<IArtifactFetcher>
makeArtifactFetcherWithDependencies(const FetchOptions& options, std::unique_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IDiskWriter> disk) {
    return std::make_unique<ArtifactFetcher>(options, std::move(http), std::move(disk));
}

std::unique_ptr<IArtifactFetcher> makeArtifactFetcher(const FetchOptions& options) {
    return makeArtifactFetcherWithDependencies(options, nullptr, nullptr);
}

} // namespace prebuilt::fetch
