#pragma once

#include "config.h"
#include "errors.h"
#include <memory>

namespace call_relay {

class AudioEndpoint;
class DeviceRegistry;

/**
 * @brief HTTP/websocket front of the audio endpoint
 *
 * GET /devices  device listing
 * GET /relay    websocket upgrade; a second counterparty gets 409
 */
class AudioServer {
public:
    AudioServer(const AudioServerConfig& config, AudioEndpoint& endpoint, DeviceRegistry& registry,
                size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES);
    ~AudioServer();

    AudioServer(const AudioServer&) = delete;
    AudioServer& operator=(const AudioServer&) = delete;

    Result<void> start();

    /// Stop serving and close the attached counterparty
    void stop();

    int port() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
