#pragma once

#include "errors.h"
#include "config.h"
#include <memory>
#include <string>

namespace call_relay {

/**
 * @brief Session metadata sent with every prompt
 */
struct ChatMetadata {
    std::string source = "call";
    bool call_active = false;
    size_t audio_bytes = 0;
    int sample_rate = 0;
    int channels = 0;
    std::string call_id;
    uint64_t turn_id = 0;
};

/**
 * @brief Abstract chat backend interface
 */
class IChatBackend {
public:
    virtual ~IChatBackend() = default;

    /**
     * @brief Ask the backend for a reply to one transcript
     * @return Reply text, or Unreachable / BadResponse
     */
    virtual Result<std::string> reply(const std::string& prompt, const ChatMetadata& metadata) = 0;
};

/**
 * @brief POST {base_url}/api/chat with {prompt, metadata}; expects {response}
 *
 * 200 and 202 are success. Any other status, unparsable JSON or a missing or
 * blank "response" is BadResponse.
 */
class HttpChatClient : public IChatBackend {
public:
    explicit HttpChatClient(const ChatConfig& config);
    ~HttpChatClient() override;

    Result<std::string> reply(const std::string& prompt, const ChatMetadata& metadata) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
