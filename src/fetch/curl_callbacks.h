#pragma once

/*
 * libcurl header/write callbacks for the non-following GET in http_adapter_curl.cpp.
 *
 * - header_cb resets its context on every status line, so after a transfer it holds
 *   the last response only (interim 1xx responses are forgotten).
 * - write_cb forwards body chunks to the BodySink only while the current status is
 *   200; any other body is drained and dropped.
 * - A sink failure aborts the transfer; finishTransfer() reports it instead of
 *   curl's CURLE_WRITE_ERROR.
 */

#include <prebuilt/fetch/fetcher.hpp>

#include <curl/curl.h>

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace prebuilt::fetch::detail {

inline std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

inline std::string_view trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// Map CURLcode to Error
inline Error makeCurlError(CURLcode code, std::string_view url) {
    Error err;
    err.message = std::string(curl_easy_strerror(code)) + " (" + std::string(url) + ")";
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Header parser context; reset on every status line so only the last response counts
struct HeaderParseContext {
    long status{0};
    std::string reason;
    std::optional<std::string> location;
};

// "HTTP/1.1 302 Found" or "HTTP/2 200"
inline void parseStatusLine(std::string_view line, HeaderParseContext& ctx) {
    auto sp = line.find(' ');
    if (sp == std::string_view::npos)
        return;
    auto rest = trim(line.substr(sp + 1));
    long code = 0;
    auto res = std::from_chars(rest.data(), rest.data() + rest.size(), code);
    if (res.ec != std::errc())
        return;
    ctx.status = code;
    ctx.reason = std::string(trim(std::string_view(res.ptr, rest.data() + rest.size() - res.ptr)));
}

// CURL header callback
inline size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.size() > 5 && to_lower(line.substr(0, 5)) == "http/") {
        *ctx = HeaderParseContext{};
        parseStatusLine(line, *ctx);
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));
    if (key == "location" && !val.empty()) {
        ctx->location = std::string(val);
    }
    return total;
}

// Write sink context
struct WriteContext {
    const HeaderParseContext* headers{nullptr};
    const BodySink* sink{nullptr};
    std::uint64_t delivered{0};
    std::optional<Error> sinkError;
};

// CURL write callback; bodies of non-200 responses are drained and dropped
inline size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->headers == nullptr || ctx->headers->status != 200)
        return total;

    if (ctx->sink == nullptr || !*ctx->sink) {
        ctx->sinkError = Error{ErrorCode::Unknown, "no body sink provided"};
        return 0;
    }

    auto r = (*ctx->sink)(ByteSpan{reinterpret_cast<const std::byte*>(ptr), total});
    if (!r) {
        ctx->sinkError = r.error();
        return 0; // abort => CURLE_WRITE_ERROR
    }
    ctx->delivered += static_cast<std::uint64_t>(total);
    return total;
}

/**
 * Turn the outcome of curl_easy_perform into the adapter result. A stored sink error
 * wins over rc; curlStatus (CURLINFO_RESPONSE_CODE) wins over the parsed status line
 * when non-zero.
 */
inline Result<HttpResponse> finishTransfer(CURLcode rc, long curlStatus,
                                           const HeaderParseContext& headers,
                                           const WriteContext& body, std::string_view url) {
    if (body.sinkError) {
        return *body.sinkError;
    }
    if (rc != CURLE_OK) {
        return makeCurlError(rc, url);
    }

    HttpResponse resp;
    resp.status = curlStatus != 0 ? curlStatus : headers.status;
    resp.reason = headers.reason;
    resp.location = headers.location;
    resp.bodyBytes = body.delivered;
    return resp;
}

} // namespace prebuilt::fetch::detail
