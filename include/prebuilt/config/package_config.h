#pragma once

#include <prebuilt/core/types.h>
#include <prebuilt/fetch/fetcher.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace prebuilt::config {

// Placeholder substituted with the package version in the URL template
inline constexpr std::string_view kVersionPlaceholder = "${npm_package_version}";

// Well-known file names under the cache root
inline constexpr const char* kStagingFileName = "unverified-prebuild.tmp";
inline constexpr const char* kFinalFileName = "prebuild.tar.gz";

// Environment accessor; injectable so configuration never depends on process globals
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Reads the real process environment. Empty values are reported as unset.
EnvLookup processEnvironment();

struct PackageConfig {
    std::string version;
    std::string prebuildUrlTemplate;
    std::string prebuildChecksum;          // empty = no verification requested
    std::optional<std::string> proxy;      // from HTTPS_PROXY / https_proxy
    std::optional<std::filesystem::path> packageJson; // set when read from a file
};

// Read version and config.prebuildUrl / config.prebuildChecksum from a package.json
Result<PackageConfig> loadPackageJson(const std::filesystem::path& path);

// Resolution order:
// 1. $npm_package_json (npm always provides it, even for registry installs)
// 2. $npm_package_config_prebuildUrl, $npm_package_config_prebuildChecksum,
//    $npm_package_version (yarn)
// The proxy always comes from the environment.
Result<PackageConfig> loadPackageConfig(const EnvLookup& env);

// Replace every occurrence of ${npm_package_version}
std::string resolveSourceUrl(std::string_view urlTemplate, std::string_view version);

// A missing URL is only an error when a checksum asks for a download
Result<fetch::ArtifactSpec> toArtifactSpec(const PackageConfig& cfg);

// <root>/unverified-prebuild.tmp and <root>/prebuild.tar.gz
fetch::CachePaths defaultCachePaths(const std::filesystem::path& root);

} // namespace prebuilt::config
