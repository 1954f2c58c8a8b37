#pragma once

#include "call_session.h"
#include "config.h"
#include "errors.h"
#include "http_server.h"
#include <memory>

namespace call_relay {

class CallStateMachine;

/**
 * @brief {connectedToService, callActive, framesSent, state, ...}
 */
std::string call_status_json(const CallSession& session);

/**
 * @brief Call lifecycle HTTP surface of the coordinator
 *
 * POST /api/call_started (/call-started)  200 started | 502 {error}
 * POST /api/call_ended   (/call-ended)    200 ended   | 502 {error}
 * GET  /api/call_status  (/call-status)   200 status snapshot
 *
 * Handlers run on a worker pool; start/end block for at most the relay
 * acknowledgement timeout.
 */
class CallServer {
public:
    CallServer(const CallServerConfig& config, CallStateMachine& machine);
    ~CallServer();

    CallServer(const CallServer&) = delete;
    CallServer& operator=(const CallServer&) = delete;

    Result<void> start();
    void stop();
    int port() const;

    /// Route handlers, callable without a socket
    HttpResponse handle_call_started(const HttpRequest& request);
    HttpResponse handle_call_ended(const HttpRequest& request);
    HttpResponse handle_call_status(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
