#include <prebuilt/config/package_config.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace prebuilt::config {

namespace {

using json = nlohmann::json;

std::string trimmed(std::string s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string stringField(const json& obj, const char* key) {
    if (!obj.is_object())
        return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return {};
    return trimmed(it->get<std::string>());
}

std::optional<std::string> proxyFromEnv(const EnvLookup& env) {
    for (const char* name : {"HTTPS_PROXY", "https_proxy"}) {
        if (auto v = env(name); v && !v->empty())
            return v;
    }
    return std::nullopt;
}

} // namespace

EnvLookup processEnvironment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* v = std::getenv(std::string(name).c_str());
        if (v == nullptr || *v == '\0')
            return std::nullopt;
        return std::string(v);
    };
}

Result<PackageConfig> loadPackageJson(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::ConfigError, "cannot open package.json: " + path.string()};
    }

    json pkg;
    try {
        in >> pkg;
    } catch (const json::exception& ex) {
        return Error{ErrorCode::ConfigError,
                     "cannot parse " + path.string() + ": " + std::string(ex.what())};
    }
    if (!pkg.is_object()) {
        return Error{ErrorCode::ConfigError, path.string() + " is not a JSON object"};
    }

    PackageConfig cfg;
    cfg.packageJson = path;
    cfg.version = stringField(pkg, "version");
    if (auto it = pkg.find("config"); it != pkg.end()) {
        cfg.prebuildUrlTemplate = stringField(*it, "prebuildUrl");
        cfg.prebuildChecksum = stringField(*it, "prebuildChecksum");
    }
    spdlog::debug("read package config from {} (version '{}')", path.string(), cfg.version);
    return cfg;
}

Result<PackageConfig> loadPackageConfig(const EnvLookup& env) {
    PackageConfig cfg;
    if (auto pkgJson = env("npm_package_json")) {
        auto loaded = loadPackageJson(*pkgJson);
        if (!loaded)
            return loaded.error();
        cfg = std::move(loaded).value();
    } else {
        cfg.prebuildUrlTemplate = trimmed(env("npm_package_config_prebuildUrl").value_or(""));
        cfg.prebuildChecksum = trimmed(env("npm_package_config_prebuildChecksum").value_or(""));
        cfg.version = trimmed(env("npm_package_version").value_or(""));
    }
    cfg.proxy = proxyFromEnv(env);
    return cfg;
}

std::string resolveSourceUrl(std::string_view urlTemplate, std::string_view version) {
    std::string out;
    out.reserve(urlTemplate.size() + version.size());
    std::size_t pos = 0;
    for (;;) {
        auto hit = urlTemplate.find(kVersionPlaceholder, pos);
        if (hit == std::string_view::npos) {
            out.append(urlTemplate.substr(pos));
            break;
        }
        out.append(urlTemplate.substr(pos, hit - pos));
        out.append(version);
        pos = hit + kVersionPlaceholder.size();
    }
    return out;
}

Result<fetch::ArtifactSpec> toArtifactSpec(const PackageConfig& cfg) {
    fetch::ArtifactSpec spec;
    spec.expectedDigestHex = cfg.prebuildChecksum;
    if (cfg.prebuildChecksum.empty()) {
        spec.sourceUrl = resolveSourceUrl(cfg.prebuildUrlTemplate, cfg.version);
        return spec;
    }

    if (cfg.prebuildUrlTemplate.empty()) {
        return Error{ErrorCode::ConfigError,
                     "prebuildChecksum is set but prebuildUrl is not configured"};
    }
    if (cfg.version.empty() &&
        cfg.prebuildUrlTemplate.find(kVersionPlaceholder) != std::string::npos) {
        return Error{ErrorCode::ConfigError,
                     "prebuildUrl needs the package version but none is known"};
    }
    spec.sourceUrl = resolveSourceUrl(cfg.prebuildUrlTemplate, cfg.version);
    return spec;
}

fetch::CachePaths defaultCachePaths(const std::filesystem::path& root) {
    return fetch::CachePaths{root / kFinalFileName, root / kStagingFileName};
}

} // namespace prebuilt::config
