#include "relay_channel.h"
#include "logger.h"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <chrono>

namespace call_relay {

namespace {

/// Outbound backlog per connection; beyond this new events are refused
constexpr size_t kMaxQueuedWrites = 512;

} // namespace

RelayChannel::RelayChannel(net::io_context& ioc, size_t max_message_bytes)
    : ws_(net::make_strand(ioc)),
      resolver_(ws_.get_executor()),
      max_message_bytes_(max_message_bytes),
      open_(false),
      finished_(false) {
    ws_.read_message_max(max_message_bytes_);
}

RelayChannel::RelayChannel(tcp::socket&& socket, size_t max_message_bytes)
    : ws_(std::move(socket)),
      resolver_(ws_.get_executor()),
      max_message_bytes_(max_message_bytes),
      open_(false),
      finished_(false) {
    ws_.read_message_max(max_message_bytes_);
}

void RelayChannel::async_connect(const std::string& host, int port, const std::string& path,
                                 int timeout_ms, DoneHandler done) {
    auto self = shared_from_this();
    auto timeout = std::chrono::milliseconds(timeout_ms);
    std::string host_header = host + ":" + std::to_string(port);

    resolver_.async_resolve(host, std::to_string(port),
        [self, done, timeout, host_header, path](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                done(make_transport_error("resolve " + host_header + " failed: " + ec.message()));
                return;
            }

            beast::get_lowest_layer(self->ws_).expires_after(timeout);
            beast::get_lowest_layer(self->ws_).async_connect(results,
                [self, done, timeout, host_header, path](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                    if (ec) {
                        done(make_transport_error("connect " + host_header + " failed: " + ec.message()));
                        return;
                    }

                    // The websocket layer applies its own timeouts from here on
                    beast::get_lowest_layer(self->ws_).expires_never();
                    auto opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
                    opt.handshake_timeout = timeout;
                    self->ws_.set_option(opt);
                    self->ws_.set_option(websocket::stream_base::decorator(
                        [](websocket::request_type& req) {
                            req.set(http::field::user_agent, "call-relay");
                        }));

                    self->ws_.async_handshake(host_header, path,
                        [self, done, host_header, path](beast::error_code ec) {
                            if (ec) {
                                done(make_transport_error("websocket handshake with " + host_header + path +
                                                          " failed: " + ec.message()));
                                return;
                            }
                            self->record_peer();
                            self->open_.store(true);
                            done(Result<void>());
                        });
                });
        });
}

void RelayChannel::async_accept(http::request<http::string_body> request, DoneHandler done) {
    auto self = shared_from_this();
    auto req = std::make_shared<http::request<http::string_body>>(std::move(request));

    net::dispatch(ws_.get_executor(), [self, req, done]() {
        self->ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        self->ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, "call-relay");
            }));

        self->ws_.async_accept(*req, [self, req, done](beast::error_code ec) {
            if (ec) {
                done(make_transport_error("websocket accept failed: " + ec.message()));
                return;
            }
            self->record_peer();
            self->open_.store(true);
            done(Result<void>());
        });
    });
}

void RelayChannel::start(EventHandler on_event, CloseHandler on_close) {
    auto self = shared_from_this();
    net::dispatch(ws_.get_executor(), [self, on_event, on_close]() {
        self->on_event_ = on_event;
        self->on_close_ = on_close;
        if (!self->open_.load()) {
            self->finish("closed before start");
            return;
        }
        self->do_read();
    });
}

Result<void> RelayChannel::send(const RelayEvent& event) {
    if (!open_.load()) {
        return make_transport_error(std::string("relay closed; dropped ") + event_tag(event.type));
    }
    auto text = std::make_shared<const std::string>(encode_event(event));
    net::post(ws_.get_executor(), beast::bind_front_handler(&RelayChannel::on_send, shared_from_this(), text));
    return Result<void>();
}

void RelayChannel::close() {
    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self]() {
        if (self->finished_ || !self->open_.exchange(false)) {
            return;
        }
        // Keep only the frame already being written
        if (self->write_queue_.size() > 1) {
            self->write_queue_.erase(self->write_queue_.begin() + 1, self->write_queue_.end());
        }
        self->ws_.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
            self->finish(ec ? "close failed: " + ec.message() : std::string("closed locally"));
        });
    });
}

void RelayChannel::cancel() {
    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self]() {
        self->resolver_.cancel();
        beast::get_lowest_layer(self->ws_).cancel();
    });
}

void RelayChannel::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&RelayChannel::on_read, shared_from_this()));
}

void RelayChannel::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (ec == websocket::error::closed) {
            finish("closed by peer");
        } else if (ec == net::error::operation_aborted) {
            finish("aborted");
        } else {
            finish(ec.message());
        }
        return;
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    if (!open_.load()) {
        // Closing locally: drain until the close frame arrives
        do_read();
        return;
    }

    auto event = decode_event(text);
    if (!event) {
        Logger::warn("[Relay] Dropping malformed envelope (" + std::to_string(bytes) + " bytes) from " +
                     peer_ + ": " + event.error().message);
    } else if (on_event_) {
        try {
            on_event_(event.value());
        } catch (const std::exception& e) {
            Logger::error(std::string("[Relay] Event handler threw on ") + event_tag(event.value().type) +
                          ": " + e.what());
        }
    }

    do_read();
}

void RelayChannel::on_send(std::shared_ptr<const std::string> text) {
    if (!open_.load()) {
        return;
    }
    if (write_queue_.size() >= kMaxQueuedWrites) {
        Logger::warn("[Relay] Write backlog of " + std::to_string(write_queue_.size()) +
                     " to " + peer_ + "; dropping event");
        return;
    }
    write_queue_.push_back(std::move(text));
    if (write_queue_.size() > 1) {
        return;
    }
    do_write();
}

void RelayChannel::do_write() {
    auto text = write_queue_.front();
    ws_.text(true);
    auto self = shared_from_this();
    ws_.async_write(net::buffer(*text), [self, text](beast::error_code ec, std::size_t bytes) {
        self->on_write(ec, bytes);
    });
}

void RelayChannel::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        // Queued frames are dropped, not retried
        finish("write failed: " + ec.message());
        return;
    }
    if (!write_queue_.empty()) {
        write_queue_.pop_front();
    }
    if (!write_queue_.empty() && open_.load()) {
        do_write();
    }
}

void RelayChannel::finish(const std::string& reason) {
    if (finished_) {
        return;
    }
    finished_ = true;
    open_.store(false);
    write_queue_.clear();
    beast::get_lowest_layer(ws_).close();

    LOG_RELAY("Connection " + (peer_.empty() ? std::string("(unconnected)") : peer_) + " closed: " + reason);
    if (on_close_) {
        try {
            on_close_(reason);
        } catch (const std::exception& e) {
            Logger::error("[Relay] Close handler threw: " + std::string(e.what()));
        }
    }
}

void RelayChannel::record_peer() {
    beast::error_code ec;
    auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    if (!ec) {
        peer_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

} // namespace call_relay
