#pragma once

#include <prebuilt/config/package_config.h>
#include <prebuilt/core/types.h>
#include <prebuilt/extraction/archive_extractor.hpp>
#include <prebuilt/fetch/fetcher.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace CLI {
class App;
}

namespace prebuilt::cli {

struct FetchCommandOptions {
    // Layout
    std::filesystem::path root{"."}; // cache directory (staging + final archive)
    std::filesystem::path dest{"."}; // extraction directory

    // Package config overrides
    std::optional<std::filesystem::path> packageJson;
    std::optional<std::string> url;
    std::optional<std::string> checksum;
    std::optional<std::string> packageVersion;
    std::optional<std::string> proxy;

    // Transport
    int maxRedirects{10};
    int connectTimeoutSec{30};
    int timeoutSec{0}; // 0 = no overall cap
    bool insecure{false};
    std::optional<std::string> caPath;

    // Behavior / output
    bool noExtract{false};
    bool verbose{false};
    bool quiet{false};
};

void registerFetchOptions(CLI::App& app, FetchCommandOptions& opts);

// Package config from the environment (or --package-json), with CLI overrides applied
Result<config::PackageConfig> resolvePackageConfig(const FetchCommandOptions& opts,
                                                   const config::EnvLookup& env);

fetch::FetchOptions toFetchOptions(const FetchCommandOptions& opts);

// ensureArtifact, then extract unless the run was skipped or --no-extract was given
Result<void> runFetch(const FetchCommandOptions& opts, const config::PackageConfig& cfg,
                      fetch::IArtifactFetcher& fetcher, extraction::IArchiveExtractor& extractor);

// Parse, configure logging, run; returns the process exit code
int run(int argc, char* argv[], const config::EnvLookup& env);

} // namespace prebuilt::cli
