/**
 * Call state transitions over a scripted relay transport.
 * Asserts:
 * - start_call() connects once, sends one start-recording and is idempotent.
 * - Refusal, timeout and connect failures leave the call inactive.
 * - A start that times out is withdrawn, so a slow endpoint stops capturing.
 * - A relay drop during end_call() wakes the wait and leaves the call idle.
 * - Concurrent start/end/close never leave active without connected.
 * - A disconnect during or right after the ack wait always wins.
 * - end_call() is a no-op when idle and ends inactive whatever the endpoint says.
 * - Unsolicited recording-stopped clears the active flag.
 * - A call is never active without a connection.
 * - Audio frames are counted and forwarded; replies need a connection.
 *
 * Run from build dir: ./test_call_state_machine
 */

#include "audio_endpoint.h"
#include "call_state_machine.h"
#include "utils.h"
#include "test_support.h"
#include <condition_variable>
#include <deque>
#include <vector>

using namespace call_relay;
using namespace test_support;

namespace {

bool consistent(const CallSession& s) {
    return !(s.active && !s.connected);
}

/**
 * Carries coordinator commands to a real AudioEndpoint on its own thread, one
 * at a time and in order, the way the relay channel's read loop does.
 * Endpoint replies come back through transport.emit().
 */
class EndpointLink {
public:
    EndpointLink(FakeTransport& transport, AudioEndpoint& endpoint)
        : transport_(transport), endpoint_(endpoint) {
        session_ = endpoint_.attach([this](const RelayEvent& e) -> Result<void> {
            transport_.emit(e);
            return Result<void>();
        });
        transport_.responder = [this](FakeTransport&, const RelayEvent& e) { post(e); };
        worker_ = std::thread([this] { run(); });
    }

    ~EndpointLink() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        worker_.join();
        transport_.responder = nullptr;
        endpoint_.detach(session_);
    }

private:
    void post(const RelayEvent& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.push_back(e);
        }
        cv_.notify_all();
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            cv_.wait(lock, [this] { return stopping_ || !inbox_.empty(); });
            if (inbox_.empty()) return;
            RelayEvent e = inbox_.front();
            inbox_.pop_front();
            lock.unlock();
            endpoint_.handle_event(session_, e);
            lock.lock();
        }
    }

    FakeTransport& transport_;
    AudioEndpoint& endpoint_;
    uint64_t session_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RelayEvent> inbox_;
    bool stopping_ = false;
    std::thread worker_;
};

AudioFormat small_format() {
    AudioFormat f;
    f.sample_rate = 16000;
    f.channels = 2;
    f.frames_per_chunk = 64;
    return f;
}

DeviceHandle loopback(DeviceDirection direction) {
    DeviceHandle h;
    h.info = make_device(0, "Loopback", 2, 2);
    h.direction = direction;
    return h;
}

} // namespace

int main() {
    // --- happy path and idempotent start ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);
        ASSERT(transport.has_handlers());
        ASSERT(machine.status().state() == CallState::Idle);

        CallRequest request;
        request.caller = "+15551234567";
        request.call_id = "call-42";
        ASSERT(machine.start_call(request));
        CallSession s = machine.status();
        ASSERT(s.state() == CallState::Active);
        ASSERT(s.call_id == "call-42");
        ASSERT(s.caller == "+15551234567");

        ASSERT(machine.start_call());
        ASSERT(transport.count_sent(EventType::StartRecording) == 1);
        ASSERT(transport.connects.load() == 1);
        ASSERT(machine.status().call_id == "call-42");

        ChatMetadata meta = machine.chat_metadata("call");
        ASSERT(meta.source == "call");
        ASSERT(meta.call_active);
        ASSERT(meta.call_id == "call-42");

        ASSERT(machine.end_call());
        s = machine.status();
        ASSERT(s.state() == CallState::Connected);
        ASSERT(transport.count_sent(EventType::StopRecording) == 1);
        ASSERT(!machine.chat_metadata("call").call_active);

        ASSERT(machine.end_call());  // nothing to stop
        ASSERT(transport.count_sent(EventType::StopRecording) == 1);
    }

    // --- generated call id ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);
        ASSERT(machine.start_call());
        std::string id = machine.status().call_id;
        ASSERT(id.rfind("call_", 0) == 0);
        ASSERT(id.size() > 5);
    }

    // --- connect failure ---
    {
        FakeTransport transport;
        transport.fail_connect = true;
        CallStateMachine machine(transport, 200);
        Result<void> r = machine.start_call();
        ASSERT(!r);
        ASSERT(r.error().type == ErrorType::TransportError);
        ASSERT(machine.status().state() == CallState::Idle);
        ASSERT(transport.count_sent(EventType::StartRecording) == 0);
    }

    // --- endpoint refuses ---
    {
        FakeTransport transport;
        transport.responder = [](FakeTransport& t, const RelayEvent& e) {
            if (e.type == EventType::StartRecording) {
                t.emit(RelayEvent::with_message(EventType::RecordingError, "Failed to start recording"));
            }
        };
        CallStateMachine machine(transport, 200);
        Result<void> r = machine.start_call();
        ASSERT(!r);
        ASSERT(r.error().type == ErrorType::DeviceError);
        ASSERT(r.error().message.find("Failed to start recording") != std::string::npos);
        ASSERT(machine.status().state() == CallState::Connected);
    }

    // --- ack timeout withdraws the start; a late ack is ignored ---
    {
        FakeTransport transport;
        CallStateMachine machine(transport, 50);
        Result<void> r = machine.start_call();
        ASSERT(!r);
        ASSERT(r.error().type == ErrorType::Timeout);
        ASSERT(machine.status().state() == CallState::Connected);
        std::vector<RelayEvent> sent = transport.sent();
        ASSERT(sent.size() == 2);
        ASSERT(sent.back().type == EventType::StopRecording);

        transport.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
        ASSERT(!machine.status().active);

        // Endpoint answers idempotently on retry
        transport.responder = acknowledge_commands;
        ASSERT(machine.start_call());
        ASSERT(machine.status().active);
        ASSERT(transport.count_sent(EventType::StartRecording) == 2);
    }

    // --- endpoint slower to open its device than the ack timeout ---
    {
        FakeAudioBackend backend;
        backend.open_delay_ms = 300;
        CaptureEngine capture(backend, loopback(DeviceDirection::Input), small_format(), 500, 1000);
        PlaybackEngine playback(backend, loopback(DeviceDirection::Output), small_format());
        AudioEndpoint endpoint(capture, playback);
        FakeTransport transport;
        CallStateMachine machine(transport, 100);
        {
            EndpointLink link(transport, endpoint);

            Result<void> r = machine.start_call();
            ASSERT(!r);
            ASSERT(r.error().type == ErrorType::Timeout);
            ASSERT(transport.count_sent(EventType::StopRecording) == 1);

            // The late start completes, then the withdrawal stops it
            ASSERT(wait_until([&] { return backend.opens.load() == 1; }));
            ASSERT(wait_until([&] { return !capture.is_running(); }));
            ASSERT(!machine.status().active);
            ASSERT(machine.status().connected);

            ASSERT(machine.end_call());
            ASSERT(!capture.is_running());
            ASSERT(wait_until([&] { return backend.live_streams.load() == 0; }));
        }
    }

    // --- disconnect while waiting for the ack ---
    {
        FakeTransport transport;
        transport.responder = [](FakeTransport& t, const RelayEvent& e) {
            if (e.type == EventType::StartRecording) {
                t.close("endpoint went away");
                t.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
            }
        };
        CallStateMachine machine(transport, 500);
        Result<void> r = machine.start_call();
        ASSERT(!r);
        ASSERT(r.error().type == ErrorType::TransportError);
        CallSession s = machine.status();
        ASSERT(s.state() == CallState::Idle);
        ASSERT(s.disconnects == 1);
        ASSERT(consistent(s));
    }

    // --- disconnect right after the ack ---
    {
        FakeTransport transport;
        transport.responder = [](FakeTransport& t, const RelayEvent& e) {
            if (e.type == EventType::StartRecording) {
                t.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
                t.close("endpoint went away");
            }
        };
        CallStateMachine machine(transport, 500);
        ASSERT(!machine.start_call());
        ASSERT(machine.status().state() == CallState::Idle);
        ASSERT(consistent(machine.status()));
    }

    // --- disconnect from another thread during a slow ack ---
    {
        FakeTransport transport;
        CallStateMachine machine(transport, 2000);
        std::thread closer([&transport] {
            wait_until([&transport] { return transport.count_sent(EventType::StartRecording) == 1; });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            transport.close("network dropped");
        });
        auto begin = Clock::now();
        Result<void> r = machine.start_call();
        closer.join();
        ASSERT(!r);
        ASSERT(ms_since(begin) < 1500);  // woken by the close, not the timeout
        ASSERT(machine.status().state() == CallState::Idle);

        // Reconnects on the next start
        transport.responder = acknowledge_commands;
        ASSERT(machine.start_call());
        ASSERT(transport.connects.load() == 2);
        ASSERT(machine.status().state() == CallState::Active);
    }

    // --- close while active ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);
        ASSERT(machine.start_call());
        transport.close("peer closed");
        CallSession s = machine.status();
        ASSERT(s.state() == CallState::Idle);
        ASSERT(!s.active);
        ASSERT(s.disconnects == 1);
        ASSERT(machine.end_call());  // no-op once idle
        ASSERT(transport.count_sent(EventType::StopRecording) == 0);
    }

    // --- relay drops while end_call waits for recording-stopped ---
    {
        FakeTransport transport;
        transport.responder = [](FakeTransport& t, const RelayEvent& e) {
            if (e.type == EventType::StartRecording) {
                t.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
            } else if (e.type == EventType::StopRecording) {
                t.close("endpoint went away mid-stop");
            }
        };
        CallStateMachine machine(transport, 2000);
        ASSERT(machine.start_call());

        auto begin = Clock::now();
        ASSERT(machine.end_call());
        ASSERT(ms_since(begin) < 1500);  // cancelled, not timed out
        CallSession s = machine.status();
        ASSERT(s.state() == CallState::Idle);
        ASSERT(!s.active);
        ASSERT(!s.connected);
        ASSERT(s.disconnects == 1);
    }

    // --- same, with the drop coming from another thread ---
    {
        FakeTransport transport;
        transport.responder = [](FakeTransport& t, const RelayEvent& e) {
            if (e.type == EventType::StartRecording) {
                t.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
            }
        };
        CallStateMachine machine(transport, 2000);
        ASSERT(machine.start_call());
        std::thread closer([&transport] {
            wait_until([&transport] { return transport.count_sent(EventType::StopRecording) == 1; });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            transport.close("network dropped");
        });
        auto begin = Clock::now();
        ASSERT(machine.end_call());
        closer.join();
        ASSERT(ms_since(begin) < 1500);
        ASSERT(machine.status().state() == CallState::Idle);
        ASSERT(consistent(machine.status()));
    }

    // --- concurrent start/end/close ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 50);
        std::atomic<bool> done{false};
        std::atomic<int> inconsistent{0};
        std::atomic<int> unexpected{0};

        std::thread watcher([&] {
            while (!done.load()) {
                if (!consistent(machine.status())) inconsistent++;
                std::this_thread::yield();
            }
        });

        std::vector<std::thread> callers;
        for (int t = 0; t < 3; ++t) {
            callers.emplace_back([&machine, &inconsistent, &unexpected, t] {
                for (int i = 0; i < 100; ++i) {
                    Result<void> r = ((i + t) % 2 == 0) ? machine.start_call() : machine.end_call();
                    // Only a relay drop may fail a transition here
                    if (!r && r.error().type != ErrorType::TransportError) unexpected++;
                    if (!consistent(machine.status())) inconsistent++;
                }
            });
        }
        std::thread dropper([&transport] {
            for (int i = 0; i < 20; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                transport.close("flaky network");
            }
        });

        for (auto& c : callers) c.join();
        dropper.join();
        done = true;
        watcher.join();

        ASSERT(inconsistent.load() == 0);
        ASSERT(unexpected.load() == 0);
        CallSession s = machine.status();
        ASSERT(consistent(s));

        // Still usable afterwards
        ASSERT(machine.start_call());
        ASSERT(machine.status().state() == CallState::Active);
        ASSERT(machine.end_call());
        ASSERT(machine.status().state() == CallState::Connected);
    }

    // --- unsolicited recording-stopped ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);
        ASSERT(machine.start_call());
        transport.emit(RelayEvent::with_status(EventType::RecordingStopped, "recording_stopped"));
        ASSERT(machine.status().state() == CallState::Connected);

        ASSERT(machine.start_call());
        transport.emit(RelayEvent::with_message(EventType::RecordingError, "device unplugged"));
        ASSERT(machine.status().state() == CallState::Connected);
    }

    // --- end_call when the endpoint says it was not recording ---
    {
        FakeTransport transport;
        transport.responder = [](FakeTransport& t, const RelayEvent& e) {
            if (e.type == EventType::StartRecording) {
                t.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
            } else if (e.type == EventType::StopRecording) {
                t.emit(RelayEvent::with_message(EventType::RecordingError, "Not currently recording"));
            }
        };
        CallStateMachine machine(transport, 200);
        ASSERT(machine.start_call());
        ASSERT(machine.end_call());
        ASSERT(!machine.status().active);
        ASSERT(machine.status().connected);
    }

    // --- end_call ack timeout still ends the call ---
    {
        FakeTransport transport;
        transport.responder = [](FakeTransport& t, const RelayEvent& e) {
            if (e.type == EventType::StartRecording) {
                t.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
            }
        };
        CallStateMachine machine(transport, 50);
        ASSERT(machine.start_call());
        ASSERT(machine.end_call());
        ASSERT(machine.status().state() == CallState::Connected);
    }

    // --- end_call send failure ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);
        ASSERT(machine.start_call());
        transport.fail_send = true;
        Result<void> r = machine.end_call();
        ASSERT(!r);
        ASSERT(r.error().type == ErrorType::TransportError);
        ASSERT(!machine.status().active);
    }

    // --- audio frames and replies ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        CallStateMachine machine(transport, 200);

        ASSERT(!machine.deliver_reply(ByteBuffer(4, 1)));  // not connected

        transport.emit(RelayEvent::with_audio(EventType::AudioStream, "AAAA"));
        ASSERT(machine.status().frames_sent == 1);
        ASSERT(machine.status().turns_dispatched == 0);

        std::vector<std::string> received;
        machine.set_frame_handler([&received](std::string audio) { received.push_back(std::move(audio)); });
        ASSERT(machine.start_call());
        transport.emit(RelayEvent::with_audio(EventType::AudioStream, "AQID"));
        transport.emit(RelayEvent::with_audio(EventType::AudioStream, "BAUG"));
        CallSession s = machine.status();
        ASSERT(s.frames_sent == 3);
        ASSERT(s.turns_dispatched == 2);
        ASSERT(received.size() == 2);
        ASSERT(received[0] == "AQID");
        ASSERT(received[1] == "BAUG");

        ByteBuffer reply = {1, 2, 3, 4};
        ASSERT(machine.deliver_reply(reply));
        ASSERT(machine.status().replies_delivered == 1);
        std::vector<RelayEvent> sent = transport.sent();
        ASSERT(sent.back().type == EventType::AudioInput);
        ASSERT(sent.back().audio == utils::base64_encode(reply));

        transport.fail_send = true;
        ASSERT(!machine.deliver_reply(reply));
        ASSERT(machine.status().replies_delivered == 1);

        // Informational events change nothing
        transport.emit(RelayEvent::with_status(EventType::Connected, "Connected to audio server"));
        transport.emit(RelayEvent::with_status(EventType::AudioReceived, "Audio received and queued for output"));
        transport.emit(RelayEvent::with_message(EventType::Error, "No audio data received"));
        ASSERT(machine.status().state() == CallState::Active);
    }

    // --- detach ---
    {
        FakeTransport transport;
        transport.responder = acknowledge_commands;
        {
            CallStateMachine machine(transport, 200);
            ASSERT(machine.start_call());
            machine.detach();
            ASSERT(!transport.has_handlers());
            transport.emit(RelayEvent::with_status(EventType::RecordingStopped, "recording_stopped"));
            ASSERT(machine.status().active);
            machine.detach();
        }
        transport.close("after machine destroyed");
    }

    return report("call state machine");
}
