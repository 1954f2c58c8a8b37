#include "audio_server.h"
#include "audio_endpoint.h"
#include "device_registry.h"
#include "http_server.h"
#include "relay_channel.h"
#include "logger.h"
#include <mutex>

namespace call_relay {

class AudioServer::Impl {
public:
    Impl(const AudioServerConfig& config, AudioEndpoint& endpoint, DeviceRegistry& registry,
         size_t max_message_bytes)
        : endpoint_(endpoint),
          registry_(registry),
          server_("audio-server", config.host, config.port, config.io_threads) {
        server_.route("GET", "/devices", [this](const HttpRequest&) {
            return HttpResponse::json(200, devices_to_json(registry_.devices()));
        });

        server_.websocket_route(
            "/relay",
            [this](const HttpRequest&) -> std::optional<HttpResponse> {
                if (endpoint_.has_counterparty()) {
                    LOG_WARN("[Relay] Refusing second counterparty");
                    return HttpResponse::error(409, "audio endpoint already has a counterparty");
                }
                return std::nullopt;
            },
            [this](std::shared_ptr<RelayChannel> channel) { on_open(std::move(channel)); },
            max_message_bytes);
    }

    ~Impl() {
        stop();
    }

    Result<void> start() {
        return server_.start();
    }

    void stop() {
        std::shared_ptr<RelayChannel> channel;
        uint64_t session = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            channel = std::move(channel_);
            session = session_;
            session_ = 0;
        }
        if (session != 0) {
            endpoint_.detach(session);
        }
        if (channel) {
            channel->close();
        }
        server_.stop();
    }

    int port() const {
        return server_.port();
    }

private:
    void on_open(std::shared_ptr<RelayChannel> channel) {
        std::weak_ptr<RelayChannel> weak = channel;
        uint64_t session = endpoint_.attach([weak](const RelayEvent& event) -> Result<void> {
            auto ch = weak.lock();
            if (!ch) {
                return make_transport_error(std::string("counterparty gone; dropped ") + event_tag(event.type));
            }
            return ch->send(event);
        });

        if (session == 0) {
            // Lost the race with another upgrade that passed the gate
            LOG_WARN("[Relay] Closing extra counterparty " + channel->peer());
            channel->close();
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            channel_ = channel;
            session_ = session;
        }
        LOG_RELAY("Coordinator connected from " + channel->peer());

        channel->start(
            [this, session](const RelayEvent& event) { endpoint_.handle_event(session, event); },
            [this, session](const std::string& reason) {
                LOG_RELAY("Coordinator disconnected: " + reason);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (session_ == session) {
                        channel_.reset();
                        session_ = 0;
                    }
                }
                endpoint_.detach(session);
            });
    }

    AudioEndpoint& endpoint_;
    DeviceRegistry& registry_;
    HttpServer server_;

    std::mutex mutex_;
    std::shared_ptr<RelayChannel> channel_;
    uint64_t session_ = 0;
};

AudioServer::AudioServer(const AudioServerConfig& config, AudioEndpoint& endpoint, DeviceRegistry& registry,
                         size_t max_message_bytes)
    : pimpl_(std::make_unique<Impl>(config, endpoint, registry, max_message_bytes)) {}

AudioServer::~AudioServer() = default;

Result<void> AudioServer::start() {
    return pimpl_->start();
}

void AudioServer::stop() {
    pimpl_->stop();
}

int AudioServer::port() const {
    return pimpl_->port();
}

} // namespace call_relay
