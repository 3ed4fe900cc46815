#pragma once

#include <cleanbench/core/types.h>

#include <chrono>
#include <memory>
#include <string>

namespace cleanbench::net {

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Minimal blocking HTTP client used for health, seed and smoke requests
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * Issue one request. Transport failures (refused, timeout) are returned as errors;
     * any HTTP status, including 4xx/5xx, is a successful result.
     */
    virtual Result<HttpResponse> request(const std::string& method, const std::string& url,
                                         std::chrono::milliseconds timeout) = 0;
};

/**
 * libcurl easy-API implementation. One handle per request; safe to share across threads.
 */
class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<HttpResponse> request(const std::string& method, const std::string& url,
                                 std::chrono::milliseconds timeout) override;
};

std::shared_ptr<IHttpClient> makeCurlHttpClient();

} // namespace cleanbench::net
