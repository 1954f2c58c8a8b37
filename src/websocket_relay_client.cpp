#include "websocket_relay_client.h"
#include "relay_channel.h"
#include "logger.h"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

namespace call_relay {

class WebSocketRelayClient::Impl {
public:
    explicit Impl(const RelayConfig& config)
        : config_(config),
          work_(net::make_work_guard(ioc_)),
          generation_(0) {
        io_thread_ = std::thread([this]() { ioc_.run(); });
    }

    ~Impl() {
        disconnect();
        work_.reset();
        ioc_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    Result<void> connect() {
        std::lock_guard<std::mutex> connect_lock(connect_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (channel_ && channel_->is_open()) {
                return Result<void>();
            }
        }
        if (std::this_thread::get_id() == io_thread_.get_id()) {
            return make_error(ErrorType::InvalidState, "connect() called from the relay thread");
        }

        const std::string url = "ws://" + config_.host + ":" + std::to_string(config_.port) + config_.path;
        LOG_RELAY("Connecting to " + url);

        auto channel = std::make_shared<RelayChannel>(ioc_, config_.max_message_bytes);
        auto handshake = std::make_shared<std::promise<Result<void>>>();
        std::future<Result<void>> handshake_done = handshake->get_future();
        channel->async_connect(config_.host, config_.port, config_.path, config_.connect_timeout_ms,
                               [handshake](Result<void> result) {
                                   handshake->set_value(std::move(result));
                               });

        if (handshake_done.wait_for(std::chrono::milliseconds(config_.connect_timeout_ms)) !=
            std::future_status::ready) {
            channel->cancel();
            Logger::error("[Relay] Connect to " + url + " timed out after " +
                          std::to_string(config_.connect_timeout_ms) + " ms");
            return make_timeout_error("connect to " + url + " timed out");
        }

        Result<void> result = handshake_done.get();
        if (!result) {
            Logger::error("[Relay] " + result.error().describe());
            return result;
        }

        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            channel_ = channel;
            generation = ++generation_;
        }

        channel->start(
            [this](const RelayEvent& event) {
                EventHandler handler;
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    handler = event_handler_;
                }
                if (handler) {
                    handler(event);
                }
            },
            [this, generation](const std::string& reason) {
                on_channel_closed(generation, reason);
            });

        LOG_RELAY("Connected to " + url);
        return Result<void>();
    }

    void disconnect() {
        std::shared_ptr<RelayChannel> channel;
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!channel_) {
                return;
            }
            channel = channel_;
            channel_.reset();
            // The channel's own close callback now belongs to a stale generation
            ++generation_;
            handler = close_handler_;
        }
        channel->close();
        LOG_RELAY("Disconnected from " + channel->peer());
        if (handler) {
            handler("disconnected locally");
        }
    }

    Result<void> send(const RelayEvent& event) {
        std::shared_ptr<RelayChannel> channel;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            channel = channel_;
        }
        if (!channel) {
            return make_transport_error(std::string("not connected; dropped ") + event_tag(event.type));
        }
        return channel->send(event);
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return channel_ && channel_->is_open();
    }

    void set_event_handler(EventHandler handler) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        event_handler_ = std::move(handler);
    }

    void set_close_handler(CloseHandler handler) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        close_handler_ = std::move(handler);
    }

private:
    void on_channel_closed(uint64_t generation, const std::string& reason) {
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (generation != generation_ || !channel_) {
                return;
            }
            channel_.reset();
            handler = close_handler_;
        }
        Logger::warn("[Relay] Connection lost: " + reason);
        if (handler) {
            handler(reason);
        }
    }

    RelayConfig config_;
    net::io_context ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_;
    std::thread io_thread_;

    std::mutex connect_mutex_;
    mutable std::mutex state_mutex_;
    std::shared_ptr<RelayChannel> channel_;
    uint64_t generation_;
    EventHandler event_handler_;
    CloseHandler close_handler_;
};

WebSocketRelayClient::WebSocketRelayClient(const RelayConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WebSocketRelayClient::~WebSocketRelayClient() = default;

Result<void> WebSocketRelayClient::connect() {
    return pimpl_->connect();
}

void WebSocketRelayClient::disconnect() {
    pimpl_->disconnect();
}

Result<void> WebSocketRelayClient::send(const RelayEvent& event) {
    return pimpl_->send(event);
}

bool WebSocketRelayClient::is_connected() const {
    return pimpl_->is_connected();
}

void WebSocketRelayClient::set_event_handler(EventHandler handler) {
    pimpl_->set_event_handler(std::move(handler));
}

void WebSocketRelayClient::set_close_handler(CloseHandler handler) {
    pimpl_->set_close_handler(std::move(handler));
}

} // namespace call_relay
