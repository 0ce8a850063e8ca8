/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - One GET per call through the libcurl easy API; CURLOPT_FOLLOWLOCATION is off so the
 *   pipeline can bound and log the redirect chain itself.
 * - Captures the final status line and Location header; only 200 bodies reach the sink.
 * - Honors connect/low-speed/total timeouts, TLS verify/CA, proxy and user agent.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include "curl_callbacks.h"

#include <prebuilt/fetch/fetcher.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string_view>

namespace prebuilt::fetch {

namespace {

using detail::HeaderParseContext;
using detail::WriteContext;

struct CurlEasyDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlUrlDeleter {
    void operator()(CURLU* url) const noexcept { curl_url_cleanup(url); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

void ensureCurlGlobalInit() {
    static std::once_flag curlInitFlag;
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

void configure_common(CURL* curl, const FetchOptions& options) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.totalTimeout.count()));
    if (options.lowSpeedLimitBytes > 0 && options.lowSpeedTime.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options.lowSpeedLimitBytes);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(options.lowSpeedTime.count()));
    }

    // Redirects are followed by the caller; only HTTP(S) has the status codes it relies on
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    // Proxy
    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
        curl_easy_setopt(curl, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
    }

    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensureCurlGlobalInit(); }
    ~CurlHttpAdapter() override = default;

    Result<HttpResponse> get(std::string_view url, const FetchOptions& options,
                             const BodySink& sink) override {
        CurlEasyPtr curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, detail::header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.headers = &hctx;
        wctx.sink = &sink;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, detail::write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);

        configure_common(curl.get(), options);

        CURLcode rc = curl_easy_perform(curl.get());

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        auto resp = detail::finishTransfer(rc, code, hctx, wctx, url);
        if (resp) {
            spdlog::debug("GET {} -> {} {}", urlStr, resp.value().status, resp.value().reason);
        }
        return resp;
    }
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

Result<std::string> resolveRedirectLocation(std::string_view baseUrl, std::string_view location) {
    ensureCurlGlobalInit();
    CurlUrlPtr handle{curl_url()};
    if (!handle) {
        return Error{ErrorCode::Unknown, "curl_url failed"};
    }

    const std::string base(baseUrl);
    if (auto uc = curl_url_set(handle.get(), CURLUPART_URL, base.c_str(), 0); uc != CURLUE_OK) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid URL '" + base + "': " + curl_url_strerror(uc)};
    }
    // With a URL already set, a relative reference is resolved against it
    const std::string loc(detail::trim(location));
    if (auto uc = curl_url_set(handle.get(), CURLUPART_URL, loc.c_str(), 0); uc != CURLUE_OK) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid redirect location '" + loc + "': " + curl_url_strerror(uc)};
    }

    char* out = nullptr;
    if (auto uc = curl_url_get(handle.get(), CURLUPART_URL, &out, 0); uc != CURLUE_OK) {
        return Error{ErrorCode::InvalidArgument,
                     "cannot resolve redirect location '" + loc + "': " + curl_url_strerror(uc)};
    }
    std::string resolved(out);
    curl_free(out);
    return resolved;
}

} // namespace prebuilt::fetch
