#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <sstream>

namespace call_relay {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
    return total;
}

/// Run a prepared handle; fills status, content type and body
Result<HttpClientResponse> perform(CURL* curl, const std::string& url, std::string& response_buffer) {
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::string what = (res == CURLE_OPERATION_TIMEDOUT) ? "timed out" : curl_easy_strerror(res);
        return make_error(ErrorType::Unreachable, "POST " + url + ": " + what);
    }

    HttpClientResponse response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }
    response.body = std::move(response_buffer);

    std::ostringstream oss;
    oss << "POST " << url << " -> " << response.status << " (" << response.body.size() << " bytes)";
    LOG_HTTP(oss.str());
    return response;
}

void apply_common_options(CURL* curl, const std::string& url, std::string& response_buffer,
                          int timeout_ms, int connect_timeout_ms) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms));
    // Worker threads: no SIGALRM-based DNS timeouts
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

} // namespace

HttpClient::HttpClient(int timeout_ms, int connect_timeout_ms)
    : timeout_ms_(timeout_ms), connect_timeout_ms_(connect_timeout_ms) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

Result<HttpClientResponse> HttpClient::post_json(const std::string& url, const std::string& json_body) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error(ErrorType::Unreachable, "Failed to initialize CURL");
    }

    std::string response_buffer;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    apply_common_options(curl, url, response_buffer, timeout_ms_, connect_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    Result<HttpClientResponse> result = perform(curl, url, response_buffer);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

Result<HttpClientResponse> HttpClient::post_multipart(const std::string& url,
                                                      const std::vector<MultipartField>& fields) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error(ErrorType::Unreachable, "Failed to initialize CURL");
    }

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, field.name.c_str());
        curl_mime_data(part, field.data.data(), field.data.size());
        if (!field.filename.empty()) {
            curl_mime_filename(part, field.filename.c_str());
        }
        if (!field.content_type.empty()) {
            curl_mime_type(part, field.content_type.c_str());
        }
    }

    std::string response_buffer;
    apply_common_options(curl, url, response_buffer, timeout_ms_, connect_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    Result<HttpClientResponse> result = perform(curl, url, response_buffer);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);
    return result;
}

} // namespace call_relay
