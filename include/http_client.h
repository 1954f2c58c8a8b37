#pragma once

#include "errors.h"
#include <string>
#include <vector>

namespace call_relay {

struct HttpClientResponse {
    long status = 0;
    std::string content_type;
    std::string body;
};

struct MultipartField {
    std::string name;
    std::string data;
    std::string filename;      ///< Empty for plain form fields
    std::string content_type;  ///< Empty = let curl decide
};

/**
 * @brief Blocking libcurl POST helper for the HTTP collaborators
 *
 * One bounded attempt per call; no retries. Transport failures (including
 * timeouts) are ErrorType::Unreachable. Any HTTP status is returned as a
 * response for the caller to judge.
 */
class HttpClient {
public:
    explicit HttpClient(int timeout_ms, int connect_timeout_ms = 2000);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpClientResponse> post_json(const std::string& url, const std::string& json_body) const;

    Result<HttpClientResponse> post_multipart(const std::string& url,
                                              const std::vector<MultipartField>& fields) const;

    int timeout_ms() const { return timeout_ms_; }

private:
    int timeout_ms_;
    int connect_timeout_ms_;
};

} // namespace call_relay
