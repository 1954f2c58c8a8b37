#pragma once

#include "errors.h"
#include "relay_protocol.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace call_relay {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief One websocket connection speaking relay envelopes
 *
 * Owns the Beast stream for its whole life: handshake (client) or accept
 * (server), then a single read loop and a FIFO writer, all on the stream's
 * strand. Malformed inbound envelopes are logged and dropped.
 *
 * Thread Safety:
 * - send() and close() may be called from any thread
 * - Event and close handlers run on the io thread
 */
class RelayChannel : public std::enable_shared_from_this<RelayChannel> {
public:
    using EventHandler = std::function<void(const RelayEvent&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;
    using DoneHandler = std::function<void(Result<void>)>;

    /// Client side: stream on a new strand of `ioc`
    RelayChannel(net::io_context& ioc, size_t max_message_bytes);

    /// Server side: take over an accepted connection
    RelayChannel(tcp::socket&& socket, size_t max_message_bytes);

    RelayChannel(const RelayChannel&) = delete;
    RelayChannel& operator=(const RelayChannel&) = delete;

    /**
     * @brief Resolve, connect and perform the websocket handshake
     * @param done Called on the io thread with the outcome
     */
    void async_connect(const std::string& host, int port, const std::string& path,
                       int timeout_ms, DoneHandler done);

    /**
     * @brief Complete the upgrade of an already-read HTTP request
     */
    void async_accept(http::request<http::string_body> request, DoneHandler done);

    /**
     * @brief Begin the read loop; call once after a successful handshake
     */
    void start(EventHandler on_event, CloseHandler on_close);

    /**
     * @brief Queue an event for the writer
     * @return TransportError when the channel is not open
     */
    Result<void> send(const RelayEvent& event);

    /// Close handshake; the close handler fires when it completes
    void close();

    /// Abort a connect or accept still in progress
    void cancel();

    bool is_open() const { return open_.load(); }

    /// Remote endpoint as "ip:port" (for logs)
    std::string peer() const { return peer_; }

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_send(std::shared_ptr<const std::string> text);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);
    void finish(const std::string& reason);
    void record_peer();

    websocket::stream<beast::tcp_stream> ws_;
    tcp::resolver resolver_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> write_queue_;
    size_t max_message_bytes_;
    std::atomic<bool> open_;
    bool finished_;
    std::string peer_;
    EventHandler on_event_;
    CloseHandler on_close_;
};

} // namespace call_relay
