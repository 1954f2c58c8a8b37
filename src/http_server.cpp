#include "http_server.h"
#include "relay_channel.h"
#include "worker_pool.h"
#include "logger.h"
#include "utils.h"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace call_relay {

HttpResponse HttpResponse::error(int status, const std::string& message) {
    nlohmann::json body;
    body["error"] = message;
    return json(status, body.dump());
}

namespace {

constexpr size_t kMaxBodyBytes = 16 * 1024 * 1024;
constexpr auto kReadTimeout = std::chrono::seconds(30);

struct Routes {
    struct WebSocketRoute {
        HttpServer::UpgradeGate gate;
        HttpServer::UpgradeHandler on_open;
        size_t max_message_bytes = 0;
    };

    std::string name;
    WorkerPool* workers = nullptr;
    std::map<std::string, std::map<std::string, HttpServer::Handler>> http;
    std::map<std::string, WebSocketRoute> websocket;
};

HttpRequest to_request(const http::request<http::string_body>& req) {
    HttpRequest out;
    out.method = std::string(req.method_string());
    out.target = std::string(req.target());
    std::string::size_type q = out.target.find('?');
    out.path = q == std::string::npos ? out.target : out.target.substr(0, q);
    out.body = req.body();
    for (const auto& field : req) {
        out.headers[utils::normalize_copy(std::string(field.name_string()))] = std::string(field.value());
    }
    return out;
}

HttpResponse run_handler(const std::string& server_name, const HttpServer::Handler& handler,
                         const HttpRequest& request) {
    try {
        return handler(request);
    } catch (const std::exception& e) {
        Logger::error("[" + server_name + "] Handler for " + request.method + " " + request.path +
                      " threw: " + e.what());
        return HttpResponse::error(500, e.what());
    }
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<const Routes> routes)
        : stream_(std::move(socket)), routes_(std::move(routes)) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(kMaxBodyBytes);
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                LOG_HTTP(routes_->name + " read failed: " + ec.message());
            }
            return;
        }

        http::request<http::string_body> req = parser_->release();
        HttpRequest request = to_request(req);

        if (websocket::is_upgrade(req)) {
            handle_upgrade(std::move(req), request);
            return;
        }
        dispatch(request, req.version(), req.keep_alive());
    }

    void handle_upgrade(http::request<http::string_body>&& req, const HttpRequest& request) {
        auto it = routes_->websocket.find(request.path);
        if (it == routes_->websocket.end()) {
            write(HttpResponse::error(404, "no websocket endpoint at " + request.path), req.version(), false);
            return;
        }
        if (it->second.gate) {
            std::optional<HttpResponse> refusal = it->second.gate(request);
            if (refusal) {
                write(*refusal, req.version(), false);
                return;
            }
        }

        stream_.expires_never();
        auto channel = std::make_shared<RelayChannel>(stream_.release_socket(), it->second.max_message_bytes);
        auto on_open = it->second.on_open;
        std::string name = routes_->name;
        channel->async_accept(std::move(req), [channel, on_open, name](Result<void> result) {
            if (!result) {
                Logger::warn("[" + name + "] " + result.error().describe());
                return;
            }
            if (on_open) {
                on_open(channel);
            }
        });
    }

    void dispatch(const HttpRequest& request, unsigned version, bool keep_alive) {
        auto path_it = routes_->http.find(request.path);
        if (path_it == routes_->http.end()) {
            write(HttpResponse::error(404, "not found: " + request.path), version, keep_alive);
            return;
        }
        auto method_it = path_it->second.find(request.method);
        if (method_it == path_it->second.end()) {
            write(HttpResponse::error(405, "method " + request.method + " not allowed on " + request.path),
                  version, keep_alive);
            return;
        }

        HttpServer::Handler handler = method_it->second;
        if (!routes_->workers) {
            write(run_handler(routes_->name, handler, request), version, keep_alive);
            return;
        }

        auto self = shared_from_this();
        std::string name = routes_->name;
        bool queued = routes_->workers->submit([self, handler, request, version, keep_alive, name]() {
            HttpResponse res = run_handler(name, handler, request);
            net::post(self->stream_.get_executor(), [self, res, version, keep_alive]() {
                self->write(res, version, keep_alive);
            });
        });
        if (!queued) {
            write(HttpResponse::error(503, "server shutting down"), version, false);
        }
    }

    void write(const HttpResponse& res, unsigned version, bool keep_alive) {
        auto msg = std::make_shared<http::response<http::string_body>>(
            static_cast<http::status>(res.status), version);
        msg->set(http::field::server, "call-relay");
        msg->set(http::field::content_type, res.content_type);
        msg->keep_alive(keep_alive);
        msg->body() = res.body;
        msg->prepare_payload();

        LOG_HTTP(routes_->name + " -> " + std::to_string(res.status) + " (" + std::to_string(res.body.size()) + " bytes)");

        auto self = shared_from_this();
        http::async_write(stream_, *msg, [self, msg](beast::error_code ec, std::size_t) {
            self->on_write(msg->need_eof(), ec);
        });
    }

    void on_write(bool close, beast::error_code ec) {
        if (ec) {
            LOG_HTTP(routes_->name + " write failed: " + ec.message());
            return;
        }
        if (close) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<const Routes> routes_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, std::shared_ptr<const Routes> routes)
        : ioc_(ioc), acceptor_(net::make_strand(ioc)), routes_(std::move(routes)) {}

    Result<void> open(const tcp::endpoint& endpoint) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) return make_transport_error("open: " + ec.message());
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) return make_transport_error("set_option: " + ec.message());
        acceptor_.bind(endpoint, ec);
        if (ec) return make_transport_error("bind " + endpoint.address().to_string() + ":" +
                                            std::to_string(endpoint.port()) + ": " + ec.message());
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) return make_transport_error("listen: " + ec.message());
        return Result<void>();
    }

    int port() const {
        beast::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    void run() {
        do_accept();
    }

    /// Only once the io threads are gone
    void close() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    void do_accept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            Logger::warn("[" + routes_->name + "] accept failed: " + ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), routes_)->run();
        }
        do_accept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<const Routes> routes_;
};

} // namespace

class HttpServer::Impl {
public:
    Impl(const std::string& name, const std::string& host, int port, int io_threads, WorkerPool* workers)
        : host_(host), port_(port), io_threads_(io_threads > 0 ? io_threads : 1),
          ioc_(io_threads_), routes_(std::make_shared<Routes>()), bound_port_(0), started_(false) {
        routes_->name = name;
        routes_->workers = workers;
    }

    ~Impl() {
        stop();
    }

    void route(const std::string& method, const std::string& path, Handler handler) {
        routes_->http[path][method] = std::move(handler);
    }

    void websocket_route(const std::string& path, UpgradeGate gate, UpgradeHandler on_open, size_t max_message_bytes) {
        Routes::WebSocketRoute ws;
        ws.gate = std::move(gate);
        ws.on_open = std::move(on_open);
        ws.max_message_bytes = max_message_bytes;
        routes_->websocket[path] = std::move(ws);
    }

    Result<void> start() {
        if (started_) {
            return Result<void>();
        }
        beast::error_code ec;
        auto address = net::ip::make_address(host_, ec);
        if (ec) {
            return make_error(ErrorType::ConfigError, "invalid listen address '" + host_ + "': " + ec.message());
        }
        if (port_ < 0 || port_ > 65535) {
            return make_error(ErrorType::ConfigError, "invalid listen port " + std::to_string(port_));
        }

        listener_ = std::make_shared<Listener>(ioc_, routes_);
        Result<void> opened = listener_->open(tcp::endpoint(address, static_cast<unsigned short>(port_)));
        if (!opened) {
            Logger::error("[" + routes_->name + "] " + opened.error().describe());
            listener_.reset();
            return opened;
        }
        bound_port_ = listener_->port();
        listener_->run();

        threads_.reserve(static_cast<size_t>(io_threads_));
        for (int i = 0; i < io_threads_; ++i) {
            threads_.emplace_back([this]() { ioc_.run(); });
        }
        started_ = true;
        Logger::info(routes_->name + " listening on http://" + host_ + ":" + std::to_string(bound_port_));
        return Result<void>();
    }

    void stop() {
        if (!started_) {
            return;
        }
        ioc_.stop();
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        threads_.clear();
        if (listener_) {
            listener_->close();
            listener_.reset();
        }
        started_ = false;
        Logger::info(routes_->name + " stopped");
    }

    int port() const {
        return bound_port_;
    }

private:
    std::string host_;
    int port_;
    int io_threads_;
    net::io_context ioc_;
    std::shared_ptr<Routes> routes_;
    std::shared_ptr<Listener> listener_;
    std::vector<std::thread> threads_;
    int bound_port_;
    bool started_;
};

HttpServer::HttpServer(const std::string& name, const std::string& host, int port,
                       int io_threads, WorkerPool* workers)
    : pimpl_(std::make_shared<Impl>(name, host, port, io_threads, workers)) {}

HttpServer::~HttpServer() = default;

void HttpServer::route(const std::string& method, const std::string& path, Handler handler) {
    pimpl_->route(method, path, std::move(handler));
}

void HttpServer::websocket_route(const std::string& path, UpgradeGate gate, UpgradeHandler on_open,
                                 size_t max_message_bytes) {
    pimpl_->websocket_route(path, std::move(gate), std::move(on_open), max_message_bytes);
}

Result<void> HttpServer::start() {
    return pimpl_->start();
}

void HttpServer::stop() {
    pimpl_->stop();
}

int HttpServer::port() const {
    return pimpl_->port();
}

} // namespace call_relay
