/**
 * Call lifecycle HTTP surface.
 * Asserts:
 * - call-started answers 200 with the call id, 502 with {error} on failure, 400 on bad JSON.
 * - call-ended answers 200 even when nothing is active.
 * - call-status reports the documented keys and the derived state.
 * - Both path spellings are routed; wrong methods get 405, unknown paths 404.
 *
 * Run from build dir: ./test_call_server
 */

#include "call_server.h"
#include "call_state_machine.h"
#include "http_client.h"
#include "test_support.h"
#include <nlohmann/json.hpp>

using namespace call_relay;
using namespace test_support;
using json = nlohmann::json;

namespace {

HttpRequest post(const std::string& path, const std::string& body) {
    HttpRequest req;
    req.method = "POST";
    req.target = path;
    req.path = path;
    req.body = body;
    return req;
}

CallServerConfig local_config() {
    CallServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.worker_threads = 2;
    return config;
}

} // namespace

int main() {
    // --- status document ---
    {
        CallSession session;
        json idle = json::parse(call_status_json(session));
        ASSERT(idle["connectedToService"] == false);
        ASSERT(idle["callActive"] == false);
        ASSERT(idle["framesSent"] == 0);
        ASSERT(idle["state"] == "idle");
        ASSERT(idle["callId"].is_null());

        session.connected = true;
        session.active = true;
        session.frames_sent = 12;
        session.turns_dispatched = 12;
        session.replies_delivered = 9;
        session.disconnects = 1;
        session.call_id = "call-9";
        json active = json::parse(call_status_json(session));
        ASSERT(active["state"] == "active");
        ASSERT(active["framesSent"] == 12);
        ASSERT(active["turnsDispatched"] == 12);
        ASSERT(active["repliesDelivered"] == 9);
        ASSERT(active["disconnects"] == 1);
        ASSERT(active["callId"] == "call-9");

        session.active = false;
        ASSERT(json::parse(call_status_json(session))["state"] == "connected");
    }

    // --- handlers ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);
        CallServer server(local_config(), machine);

        HttpResponse bad = server.handle_call_started(post("/api/call_started", "{oops"));
        ASSERT(bad.status == 400);
        ASSERT(json::parse(bad.body).contains("error"));
        ASSERT(!machine.status().active);

        HttpResponse started = server.handle_call_started(
            post("/api/call_started", R"({"caller":"+15550001111","call_id":"abc","metadata":{"k":1}})"));
        ASSERT(started.status == 200);
        json sb = json::parse(started.body);
        ASSERT(sb["status"] == "started");
        ASSERT(sb["call_active"] == true);
        ASSERT(sb["call_id"] == "abc");
        ASSERT(machine.status().caller == "+15550001111");

        HttpResponse again = server.handle_call_started(post("/call-started", ""));
        ASSERT(again.status == 200);
        ASSERT(transport.count_sent(EventType::StartRecording) == 1);

        HttpRequest get;
        get.method = "GET";
        get.path = "/api/call_status";
        HttpResponse status = server.handle_call_status(get);
        ASSERT(status.status == 200);
        ASSERT(json::parse(status.body)["state"] == "active");

        HttpResponse ended = server.handle_call_ended(post("/api/call_ended", ""));
        ASSERT(ended.status == 200);
        json eb = json::parse(ended.body);
        ASSERT(eb["status"] == "ended");
        ASSERT(eb["call_active"] == false);
        ASSERT(server.handle_call_ended(post("/call-ended", "")).status == 200);
        ASSERT(json::parse(server.handle_call_status(get).body)["state"] == "connected");
    }

    // --- start failures map to 502 ---
    {
        FakeTransport transport;
        transport.fail_connect = true;
        CallStateMachine machine(transport, 100);
        CallServer server(local_config(), machine);
        HttpResponse res = server.handle_call_started(post("/api/call_started", "{}"));
        ASSERT(res.status == 502);
        json body = json::parse(res.body);
        ASSERT(body["error"].get<std::string>().find("TransportError") != std::string::npos);

        transport.fail_connect = false;
        HttpResponse timeout = server.handle_call_started(post("/api/call_started", "{}"));
        ASSERT(timeout.status == 502);
        ASSERT(json::parse(timeout.body)["error"].get<std::string>().find("Timeout") != std::string::npos);
    }

    // --- over a socket ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);
        CallServer server(local_config(), machine);
        ASSERT(server.start());
        ASSERT(server.port() > 0);

        HttpClient client(2000);
        const std::string base = "http://127.0.0.1:" + std::to_string(server.port());

        auto started = client.post_json(base + "/api/call_started", R"({"call_id":"wire-1"})");
        ASSERT(started);
        if (started) {
            ASSERT(started.value().status == 200);
            ASSERT(json::parse(started.value().body)["call_id"] == "wire-1");
            ASSERT(started.value().content_type.find("application/json") != std::string::npos);
        }

        auto wrong_method = client.post_json(base + "/api/call_status", "{}");
        ASSERT(wrong_method);
        if (wrong_method) ASSERT(wrong_method.value().status == 405);

        auto missing = client.post_json(base + "/api/unknown", "{}");
        ASSERT(missing);
        if (missing) ASSERT(missing.value().status == 404);

        auto ended = client.post_json(base + "/call-ended", "");
        ASSERT(ended);
        if (ended) ASSERT(ended.value().status == 200);
        ASSERT(!machine.status().active);

        server.stop();
        auto after = client.post_json(base + "/api/call_started", "{}");
        ASSERT(!after);
        if (!after) ASSERT(after.error().type == ErrorType::Unreachable);
        server.stop();
    }

    return report("call server");
}
