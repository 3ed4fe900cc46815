/*
 * http_client_curl.cpp
 *
 * Notes
 * - Blocking request() on top of the libcurl easy API.
 * - Honors a per-request timeout; connection refusal and timeouts map to Error.
 * - Response bodies are capped; only health/seed/smoke responses pass through here.
 */

#include <cleanbench/net/http_client.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace cleanbench::net {

namespace {

constexpr size_t kMaxBodyBytes = 64 * 1024;

std::once_flag g_curlInitOnce;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* body = static_cast<std::string*>(userdata);
    if (body->size() < kMaxBodyBytes) {
        body->append(ptr, std::min(total, kMaxBodyBytes - body->size()));
    }
    return total;
}

struct CurlHandleDeleter {
    void operator()(CURL* h) const noexcept {
        if (h)
            curl_easy_cleanup(h);
    }
};

} // namespace

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::~CurlHttpClient() = default;

Result<HttpResponse> CurlHttpClient::request(const std::string& method, const std::string& url,
                                             std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl{curl_easy_init()};
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    HttpResponse response;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    if (method == "GET") {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    } else if (method == "POST") {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
    } else if (method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        auto err = makeCurlError(rc, method + " " + url);
        spdlog::debug("HttpClient: {}", err.message);
        return err;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("HttpClient: {} {} -> {}", method, url, response.status);
    return response;
}

std::shared_ptr<IHttpClient> makeCurlHttpClient() {
    return std::make_shared<CurlHttpClient>();
}

} // namespace cleanbench::net
