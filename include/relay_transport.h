#pragma once

#include "errors.h"
#include "relay_protocol.h"
#include <functional>
#include <string>

namespace call_relay {

/**
 * @brief Duplex event channel to exactly one counterparty
 *
 * Handlers run on the transport's own connection thread, one event at a time,
 * in arrival order. The close handler fires once per connection; for a local
 * disconnect() it runs on the caller's thread before disconnect() returns.
 */
class IRelayTransport {
public:
    using EventHandler = std::function<void(const RelayEvent&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~IRelayTransport() = default;

    /// Succeeds immediately when already connected; bounded by the connect timeout
    virtual Result<void> connect() = 0;

    virtual void disconnect() = 0;

    /// At-most-once; queued for the connection's writer
    virtual Result<void> send(const RelayEvent& event) = 0;

    virtual bool is_connected() const = 0;

    /// Set before connect()
    virtual void set_event_handler(EventHandler handler) = 0;
    virtual void set_close_handler(CloseHandler handler) = 0;
};

} // namespace call_relay
