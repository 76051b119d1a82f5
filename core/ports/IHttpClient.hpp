#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace iotagent::ports {

struct HttpRequest {
    std::string method = "GET";         // GET, POST, PATCH
    std::string url;                    // without query string
    std::vector<std::pair<std::string, std::string>> query;   // escaped by the client
    std::map<std::string, std::string> headers;
    std::string body;
    std::string username;               // basic auth when not empty
    std::string password;
    long timeoutMs = 20000;
};

struct HttpResponse {
    long statusCode = 0;                // 0 when no response was received
    std::string body;
    std::string error;                  // transport failure, empty otherwise
};

// Blocking HTTP exchange; implementations never throw for HTTP status codes
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace iotagent::ports
