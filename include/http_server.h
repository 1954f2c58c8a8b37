#pragma once

#include "errors.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace call_relay {

class RelayChannel;
class WorkerPool;

struct HttpRequest {
    std::string method;  ///< "GET", "POST", ...
    std::string target;  ///< Raw request target
    std::string path;    ///< Target without query string
    std::string body;
    std::map<std::string, std::string> headers;  ///< Lower-cased names
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    static HttpResponse json(int status, std::string body) {
        HttpResponse res;
        res.status = status;
        res.body = std::move(body);
        return res;
    }

    /// {"error": message}
    static HttpResponse error(int status, const std::string& message);
};

/**
 * @brief Small Beast HTTP/1.1 server with optional websocket routes
 *
 * Requests are read on io threads. Handlers run on the worker pool when one
 * is given, otherwise on the io thread. Unknown path: 404; known path with
 * another method: 405.
 */
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    /// Return a response to refuse the upgrade, nullopt to accept it
    using UpgradeGate = std::function<std::optional<HttpResponse>(const HttpRequest&)>;

    /// Called on the io thread once the websocket handshake has completed
    using UpgradeHandler = std::function<void(std::shared_ptr<RelayChannel>)>;

    /**
     * @param name Used in log lines
     * @param workers Optional pool for handlers (not owned)
     */
    HttpServer(const std::string& name, const std::string& host, int port,
               int io_threads = 1, WorkerPool* workers = nullptr);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Register before start()
    void route(const std::string& method, const std::string& path, Handler handler);

    void websocket_route(const std::string& path, UpgradeGate gate, UpgradeHandler on_open,
                         size_t max_message_bytes);

    /**
     * @brief Bind, listen and spawn io threads
     */
    Result<void> start();

    void stop();

    /// Bound port (differs from the configured one when that was 0)
    int port() const;

private:
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace call_relay
