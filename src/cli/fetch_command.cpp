/*
 * prebuilt/src/cli/fetch_command.cpp
 *
 * Command line for `prebuilt-fetch`.
 * - Package config comes from npm's environment (or --package-json) and may be overridden.
 * - No checksum configured: success without network access or extraction.
 * - Any failure is logged at error level and mapped to exit code 1.
 */

#include <prebuilt/cli/fetch_command.h>
#include <prebuilt/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace prebuilt::cli {

void registerFetchOptions(CLI::App& app, FetchCommandOptions& opts) {
    // Layout
    app.add_option("--root", opts.root,
                   "Cache directory holding prebuild.tar.gz and the staging file.")
        ->capture_default_str();
    app.add_option("--dest", opts.dest, "Directory the verified archive is extracted into.")
        ->capture_default_str();

    // Package config
    app.add_option("--package-json", opts.packageJson,
                   "Read version and config.prebuild* from this package.json.")
        ->check(CLI::ExistingFile);
    app.add_option("--url", opts.url,
                   "Prebuild URL template; ${npm_package_version} is substituted.");
    app.add_option("--checksum", opts.checksum,
                   "Expected SHA-256 (hex). Empty disables verification and download.");
    app.add_option("--package-version", opts.packageVersion,
                   "Package version used for URL substitution.");
    app.add_option("--proxy", opts.proxy, "HTTP(S) proxy URL (default: $HTTPS_PROXY).");

    // Transport
    app.add_option("--max-redirects", opts.maxRedirects, "Maximum redirects to follow.")
        ->check(CLI::Range(1, 50))
        ->capture_default_str();
    app.add_option("--connect-timeout", opts.connectTimeoutSec, "Connect timeout in seconds.")
        ->check(CLI::Range(1, 600))
        ->capture_default_str();
    app.add_option("--timeout", opts.timeoutSec, "Overall transfer timeout in seconds (0 = none).")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_flag("--insecure", opts.insecure, "Disable TLS peer and host verification.");
    app.add_option("--cacert", opts.caPath, "CA bundle used for TLS verification.")
        ->check(CLI::ExistingFile);

    // Behavior / output
    app.add_flag("--no-extract", opts.noExtract, "Stop after the archive is cached and verified.");
    auto* verbose = app.add_flag("-v,--verbose", opts.verbose, "Enable debug logging.");
    app.add_flag("-q,--quiet", opts.quiet, "Only log errors.")->excludes(verbose);
}

Result<config::PackageConfig> resolvePackageConfig(const FetchCommandOptions& opts,
                                                   const config::EnvLookup& env) {
    config::PackageConfig cfg;
    if (opts.packageJson) {
        auto loaded = config::loadPackageJson(*opts.packageJson);
        if (!loaded)
            return loaded.error();
        cfg = std::move(loaded).value();
        // only the proxy is taken from the environment here
        auto fromEnv = config::loadPackageConfig(
            [&env](std::string_view name) -> std::optional<std::string> {
                if (name == "npm_package_json")
                    return std::nullopt;
                return env(name);
            });
        if (fromEnv)
            cfg.proxy = fromEnv.value().proxy;
    } else {
        auto loaded = config::loadPackageConfig(env);
        if (!loaded)
            return loaded.error();
        cfg = std::move(loaded).value();
    }

    if (opts.url)
        cfg.prebuildUrlTemplate = *opts.url;
    if (opts.checksum)
        cfg.prebuildChecksum = *opts.checksum;
    if (opts.packageVersion)
        cfg.version = *opts.packageVersion;
    if (opts.proxy) {
        if (opts.proxy->empty())
            cfg.proxy.reset();
        else
            cfg.proxy = *opts.proxy;
    }
    return cfg;
}

fetch::FetchOptions toFetchOptions(const FetchCommandOptions& opts) {
    fetch::FetchOptions out;
    out.maxRedirects = opts.maxRedirects;
    out.connectTimeout = std::chrono::seconds(opts.connectTimeoutSec);
    out.totalTimeout = std::chrono::seconds(opts.timeoutSec);
    out.tls.insecure = opts.insecure;
    if (opts.caPath)
        out.tls.caPath = *opts.caPath;
    return out;
}

Result<void> runFetch(const FetchCommandOptions& opts, const config::PackageConfig& cfg,
                      fetch::IArtifactFetcher& fetcher, extraction::IArchiveExtractor& extractor) {
    auto spec = config::toArtifactSpec(cfg);
    if (!spec)
        return spec.error();

    const auto paths = config::defaultCachePaths(opts.root);
    auto ensured = fetcher.ensureArtifact(spec.value(), paths, cfg.proxy);
    if (!ensured)
        return ensured.error();

    if (ensured.value().status == fetch::EnsureStatus::SkippedNoChecksum)
        return {};

    if (opts.noExtract) {
        spdlog::info("verified archive cached at {}", paths.finalPath.string());
        return {};
    }

    spdlog::info("extracting...");
    auto report = extractor.extract(paths.finalPath, opts.dest);
    if (!report)
        return report.error();
    if (!report.value().warnings.empty()) {
        spdlog::warn("extraction finished with {} warning(s)", report.value().warnings.size());
    }
    spdlog::debug("extracted {} entries", report.value().entries);
    return {};
}

int run(int argc, char* argv[], const config::EnvLookup& env) {
    CLI::App app{"Download, verify, cache and extract a prebuilt binary archive.",
                 "prebuilt-fetch"};
    app.set_version_flag("--version", PREBUILT_VERSION_STRING);

    FetchCommandOptions opts;
    registerFetchOptions(app, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (opts.verbose)
        spdlog::set_level(spdlog::level::debug);
    else if (opts.quiet)
        spdlog::set_level(spdlog::level::err);

    auto cfg = resolvePackageConfig(opts, env);
    if (!cfg) {
        spdlog::error("{}: {}", cfg.error().code, cfg.error().message);
        return 1;
    }

    auto fetcher = fetch::makeArtifactFetcher(toFetchOptions(opts));
    auto extractor = extraction::makeTarGzExtractor();
    auto result = runFetch(opts, cfg.value(), *fetcher, *extractor);
    if (!result) {
        spdlog::error("{}: {}", result.error().code, result.error().message);
        return 1;
    }
    return 0;
}

} // namespace prebuilt::cli
