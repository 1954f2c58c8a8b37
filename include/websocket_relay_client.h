#pragma once

#include "relay_transport.h"
#include "config.h"
#include <memory>

namespace call_relay {

/**
 * @brief Coordinator side of the relay: Beast websocket client
 *
 * Runs its own io thread; event and close handlers are invoked there.
 */
class WebSocketRelayClient : public IRelayTransport {
public:
    explicit WebSocketRelayClient(const RelayConfig& config);
    ~WebSocketRelayClient() override;

    WebSocketRelayClient(const WebSocketRelayClient&) = delete;
    WebSocketRelayClient& operator=(const WebSocketRelayClient&) = delete;

    Result<void> connect() override;
    void disconnect() override;
    Result<void> send(const RelayEvent& event) override;
    bool is_connected() const override;
    void set_event_handler(EventHandler handler) override;
    void set_close_handler(CloseHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
