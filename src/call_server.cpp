#include "call_server.h"
#include "call_state_machine.h"
#include "worker_pool.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace call_relay {

std::string call_status_json(const CallSession& session) {
    json body;
    body["connectedToService"] = session.connected;
    body["callActive"] = session.active;
    body["framesSent"] = session.frames_sent;
    body["state"] = call_state_name(session.state());
    body["turnsDispatched"] = session.turns_dispatched;
    body["repliesDelivered"] = session.replies_delivered;
    body["disconnects"] = session.disconnects;
    body["callId"] = session.call_id.empty() ? json(nullptr) : json(session.call_id);
    return body.dump();
}

namespace {

std::string string_field(const json& body, const char* key) {
    if (body.is_object() && body.contains(key) && body[key].is_string()) {
        return body[key].get<std::string>();
    }
    return std::string();
}

} // namespace

class CallServer::Impl {
public:
    Impl(const CallServerConfig& config, CallStateMachine& machine)
        : machine_(machine),
          workers_("call-http", config.worker_threads > 0 ? static_cast<size_t>(config.worker_threads) : 1),
          server_("call-server", config.host, config.port, config.io_threads, &workers_) {}

    ~Impl() {
        stop();
    }

    CallStateMachine& machine_;
    WorkerPool workers_;
    HttpServer server_;

    void stop() {
        server_.stop();
        workers_.shutdown();
        // Finished handlers post their writes to the (stopped) io context
        workers_.wait_for_completion(0);
    }
};

CallServer::CallServer(const CallServerConfig& config, CallStateMachine& machine)
    : pimpl_(std::make_unique<Impl>(config, machine)) {
    auto started = [this](const HttpRequest& req) { return handle_call_started(req); };
    auto ended = [this](const HttpRequest& req) { return handle_call_ended(req); };
    auto status = [this](const HttpRequest& req) { return handle_call_status(req); };

    pimpl_->server_.route("POST", "/api/call_started", started);
    pimpl_->server_.route("POST", "/call-started", started);
    pimpl_->server_.route("POST", "/api/call_ended", ended);
    pimpl_->server_.route("POST", "/call-ended", ended);
    pimpl_->server_.route("GET", "/api/call_status", status);
    pimpl_->server_.route("GET", "/call-status", status);
}

CallServer::~CallServer() = default;

Result<void> CallServer::start() {
    return pimpl_->server_.start();
}

void CallServer::stop() {
    pimpl_->stop();
}

int CallServer::port() const {
    return pimpl_->server_.port();
}

HttpResponse CallServer::handle_call_started(const HttpRequest& request) {
    CallRequest call;
    if (!utils::is_empty_or_whitespace(request.body)) {
        json body;
        try {
            body = json::parse(request.body);
        } catch (const json::exception& e) {
            return HttpResponse::error(400, std::string("invalid JSON body: ") + e.what());
        }
        call.caller = string_field(body, "caller");
        call.call_id = string_field(body, "call_id");
        if (body.is_object() && body.contains("metadata") && !body["metadata"].is_null()) {
            LOG_CALL("call-started metadata: " + utils::preview(body["metadata"].dump(), 120));
        }
    }

    LOG_CALL("call-started" + (call.caller.empty() ? std::string() : " from " + call.caller));
    Result<void> result = pimpl_->machine_.start_call(call);
    if (!result) {
        return HttpResponse::error(502, result.error().describe());
    }

    CallSession session = pimpl_->machine_.status();
    json body;
    body["status"] = "started";
    body["call_active"] = session.active;
    body["call_id"] = session.call_id;
    return HttpResponse::json(200, body.dump());
}

HttpResponse CallServer::handle_call_ended(const HttpRequest&) {
    LOG_CALL("call-ended");
    Result<void> result = pimpl_->machine_.end_call();
    if (!result) {
        return HttpResponse::error(502, result.error().describe());
    }
    json body;
    body["status"] = "ended";
    body["call_active"] = false;
    return HttpResponse::json(200, body.dump());
}

HttpResponse CallServer::handle_call_status(const HttpRequest&) {
    return HttpResponse::json(200, call_status_json(pimpl_->machine_.status()));
}

} // namespace call_relay
