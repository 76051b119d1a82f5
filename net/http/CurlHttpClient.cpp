#include "CurlHttpClient.hpp"
#include <curl/curl.h>
#include <iostream>

namespace iotagent {

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

size_t CurlHttpClient::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string CurlHttpClient::buildUrl(void* curl, const ports::HttpRequest& request) {
    std::string url = request.url;
    char separator = url.find('?') == std::string::npos ? '?' : '&';

    for (const auto& [key, value] : request.query) {
        char* escapedKey = curl_easy_escape(static_cast<CURL*>(curl), key.c_str(), static_cast<int>(key.size()));
        char* escapedValue = curl_easy_escape(static_cast<CURL*>(curl), value.c_str(), static_cast<int>(value.size()));
        if (escapedKey && escapedValue) {
            url += separator;
            url += escapedKey;
            url += '=';
            url += escapedValue;
            separator = '&';
        }
        curl_free(escapedKey);
        curl_free(escapedValue);
    }
    return url;
}

ports::HttpResponse CurlHttpClient::send(const ports::HttpRequest& request) {
    ports::HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize libcurl";
        return response;
    }

    std::string url = buildUrl(curl, request);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (!request.body.empty() || request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    struct curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string header = name + ": " + value;
        headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    if (!request.username.empty()) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERNAME, request.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, request.password.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
        std::cerr << "[HTTP] " << request.method << " " << url << " failed: " << response.error << std::endl;
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace iotagent
