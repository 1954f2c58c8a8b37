#include "chat_client.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace call_relay {

class HttpChatClient::Impl {
public:
    explicit Impl(const ChatConfig& config)
        : config_(config), http_(config.timeout_ms) {}

    Result<std::string> reply(const std::string& prompt, const ChatMetadata& metadata) {
        if (utils::is_empty_or_whitespace(prompt)) {
            return make_error(ErrorType::EmptyPayload, "empty prompt");
        }

        json request;
        request["prompt"] = prompt;
        request["metadata"] = {
            {"source", metadata.source},
            {"from_call", true},
            {"call_active", metadata.call_active},
            {"audio_bytes", metadata.audio_bytes},
            {"sample_rate", metadata.sample_rate},
            {"channels", metadata.channels},
            {"turn_id", metadata.turn_id}
        };
        if (!metadata.call_id.empty()) {
            request["metadata"]["call_id"] = metadata.call_id;
        }

        const std::string url = config_.base_url + "/api/chat";
        auto result = http_.post_json(url, request.dump());
        if (!result) {
            return result.error();
        }

        const HttpClientResponse& response = result.value();
        if (response.status != 200 && response.status != 202) {
            return make_error(ErrorType::BadResponse,
                              "chat backend answered " + std::to_string(response.status) + ": " +
                              utils::preview(response.body, 200));
        }

        json body;
        try {
            body = json::parse(response.body);
        } catch (const json::exception& e) {
            return make_error(ErrorType::BadResponse, "chat response is not JSON: " + std::string(e.what()));
        }

        if (!body.is_object() || !body.contains("response") || !body["response"].is_string()) {
            return make_error(ErrorType::BadResponse, "chat response has no string 'response' field");
        }
        std::string text = body["response"].get<std::string>();
        if (utils::is_empty_or_whitespace(text)) {
            return make_error(ErrorType::BadResponse, "chat response is blank");
        }
        return text;
    }

private:
    ChatConfig config_;
    HttpClient http_;
};

HttpChatClient::HttpChatClient(const ChatConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

HttpChatClient::~HttpChatClient() = default;

Result<std::string> HttpChatClient::reply(const std::string& prompt, const ChatMetadata& metadata) {
    return pimpl_->reply(prompt, metadata);
}

} // namespace call_relay
