/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Implements IHttpAdapter::get() with the libcurl easy API.
 * - Honors caller headers (Range), redirects and TLS verification.
 * - Reports status and Content-Length of the final response before the first body byte.
 * - No timeouts: a stalled server stalls the caller, which owns latency bounds.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <mediasync/sync/sync.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace mediasync::sync {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::WriteError;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// Header parser context
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A new status line starts a new response (redirect hop); forget earlier headers
    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        ctx->contentLength.reset();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        const char* first = val.data();
        const char* last = val.data() + val.size();
        auto res = std::from_chars(first, last, tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    }

    return total;
}

// Write sink context for get()
struct WriteContext {
    CURL* curl{nullptr};
    const HeaderParseContext* headers{nullptr};
    const ResponseCallback* onResponse{nullptr};
    const ByteSink* sink{nullptr};
    bool notified{false};
    std::optional<Error> error{};
};

static Result<void> notify_response(WriteContext& ctx) {
    ctx.notified = true;
    HttpResponseInfo info;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &info.status);
    info.contentLength = ctx.headers->contentLength;
    if (info.status >= 400) {
        return Error{ErrorCode::NetworkError, "HTTP error " + std::to_string(info.status)};
    }
    if (ctx.onResponse && *ctx.onResponse) {
        return (*ctx.onResponse)(info);
    }
    return Result<void>{};
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (!ctx->notified) {
        auto r = notify_response(*ctx);
        if (!r) {
            ctx->error = r.error();
            return 0; // signal error to curl => CURLE_WRITE_ERROR
        }
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Result<void>{Error{ErrorCode::InternalError, "No sink provided"}};
    if (!r) {
        ctx->error = r.error();
        return 0;
    }
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl) {
    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlHttpAdapter() override = default;

    Result<void> get(std::string_view url, const std::vector<Header>& headers,
                     const ResponseCallback& onResponse, const ByteSink& sink) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(headers);
        const std::string urlStr(url);

        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.headers = &hctx;
        wctx.onResponse = &onResponse;
        wctx.sink = &sink;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        configure_common(curl);

        spdlog::debug("GET {}", urlStr);
        CURLcode rc = curl_easy_perform(curl);

        // Empty bodies never reach write_cb; report the response anyway
        Result<void> late{};
        if (rc == CURLE_OK && !wctx.notified && !wctx.error) {
            late = notify_response(wctx);
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.error) {
            return *wctx.error;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "get(" + urlStr + ")");
        }
        return late;
    }
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace mediasync::sync
