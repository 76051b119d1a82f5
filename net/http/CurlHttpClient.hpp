/**
 * @file CurlHttpClient.hpp
 * @brief libcurl implementation of the HTTP port
 *
 * One easy handle per request; basic authentication, JSON bodies and
 * per-request timeouts. Used by PlatformHttpClient on desktop builds.
 */

#pragma once

#include "ports/IHttpClient.hpp"
#include <string>

namespace iotagent {

class CurlHttpClient : public ports::IHttpClient {
public:
    /// Initializes libcurl globally; one instance per process is enough
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    ports::HttpResponse send(const ports::HttpRequest& request) override;

private:
    /// URL with the request's query parameters appended, percent-encoded
    static std::string buildUrl(void* curl, const ports::HttpRequest& request);

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

} // namespace iotagent
