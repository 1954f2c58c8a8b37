#include "call_state_machine.h"
#include "logger.h"
#include "utils.h"
#include <chrono>

namespace call_relay {

namespace {

std::string generate_call_id() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return "call_" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace

CallStateMachine::CallStateMachine(IRelayTransport& transport, int ack_timeout_ms)
    : transport_(transport),
      ack_timeout_ms_(ack_timeout_ms > 0 ? ack_timeout_ms : DEFAULT_ACK_TIMEOUT_MS),
      epoch_(0),
      attached_(true) {
    transport_.set_event_handler([this](const RelayEvent& event) { on_transport_event(event); });
    transport_.set_close_handler([this](const std::string& reason) { on_transport_closed(reason); });
}

CallStateMachine::~CallStateMachine() {
    detach();
}

void CallStateMachine::detach() {
    std::lock_guard<std::mutex> lock(detach_mutex_);
    if (!attached_) {
        return;
    }
    transport_.set_event_handler(nullptr);
    transport_.set_close_handler(nullptr);
    attached_ = false;
}

void CallStateMachine::set_frame_handler(FrameHandler handler) {
    frame_handler_ = std::move(handler);
}

Result<void> CallStateMachine::start_call(const CallRequest& request) {
    std::lock_guard<std::mutex> transition(transition_mutex_);

    uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (session_.active) {
            LOG_CALL("start_call: already active (" + session_.call_id + ")");
            return Result<void>();
        }
        epoch = epoch_;
    }

    Result<void> connected = transport_.connect();
    if (!connected) {
        LOG_ERROR("[Call] start_call: connect failed: " + connected.error().describe());
        return make_transport_error("relay connect failed: " + connected.error().message);
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (epoch_ != epoch) {
            return make_transport_error("relay closed while connecting");
        }
        session_.connected = true;
    }

    arm_ack(EventType::RecordingStarted);
    Result<void> sent = transport_.send(RelayEvent::command(EventType::StartRecording));
    if (!sent) {
        disarm_ack();
        LOG_ERROR("[Call] start_call: " + sent.error().describe());
        return make_transport_error("start-recording not sent: " + sent.error().message);
    }

    std::string message;
    AckOutcome outcome = wait_ack(message);
    switch (outcome) {
        case AckOutcome::Acknowledged:
            break;
        case AckOutcome::Refused:
            LOG_WARN("[Call] start_call: endpoint refused: " + message);
            return make_device_error("recording failed to start: " + message);
        case AckOutcome::Disconnected:
            LOG_WARN("[Call] start_call: relay closed while waiting for recording-started");
            return make_transport_error("relay closed during start");
        case AckOutcome::None:
            LOG_WARN("[Call] start_call: no recording-started within " + std::to_string(ack_timeout_ms_) + " ms");
            withdraw_start();
            return make_timeout_error("timed out waiting for recording-started");
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (epoch_ != epoch || !session_.connected) {
        // A disconnect slipped in after the ack
        return make_transport_error("relay closed during start");
    }
    session_.active = true;
    session_.caller = request.caller;
    session_.call_id = request.call_id.empty() ? generate_call_id() : request.call_id;
    LOG_CALL("Call started: " + session_.call_id +
             (session_.caller.empty() ? std::string() : " from " + session_.caller));
    return Result<void>();
}

Result<void> CallStateMachine::end_call() {
    std::lock_guard<std::mutex> transition(transition_mutex_);

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!session_.active) {
            LOG_CALL("end_call: no active call");
            return Result<void>();
        }
    }

    arm_ack(EventType::RecordingStopped);
    Result<void> sent = transport_.send(RelayEvent::command(EventType::StopRecording));
    if (!sent) {
        disarm_ack();
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_.active = false;
        }
        LOG_ERROR("[Call] end_call: " + sent.error().describe());
        return make_transport_error("stop-recording not sent: " + sent.error().message);
    }

    std::string message;
    AckOutcome outcome = wait_ack(message);
    if (outcome == AckOutcome::None) {
        LOG_WARN("[Call] end_call: no recording-stopped within " + std::to_string(ack_timeout_ms_) +
                 " ms; marking inactive");
    } else if (outcome == AckOutcome::Refused) {
        // "Not currently recording": the endpoint is already where we want it
        LOG_CALL("end_call: endpoint reports " + message);
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.active = false;
    LOG_CALL("Call ended: " + session_.call_id);
    return Result<void>();
}

void CallStateMachine::withdraw_start() {
    // The endpoint may still be opening its device; it handles commands in
    // order, so this stop lands after the late start.
    arm_ack(EventType::RecordingStopped);
    Result<void> sent = transport_.send(RelayEvent::command(EventType::StopRecording));
    if (!sent) {
        disarm_ack();
        LOG_WARN("[Call] withdraw start: " + sent.error().describe());
        return;
    }
    std::string message;
    switch (wait_ack(message)) {
        case AckOutcome::Acknowledged:
            LOG_CALL("Late capture on the endpoint stopped");
            break;
        case AckOutcome::Refused:
            LOG_CALL("Endpoint was not recording: " + message);
            break;
        case AckOutcome::Disconnected:
            break;
        case AckOutcome::None:
            LOG_WARN("[Call] No answer to stop-recording after a start timeout");
            break;
    }
}

CallSession CallStateMachine::status() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

ChatMetadata CallStateMachine::chat_metadata(const std::string& source) const {
    ChatMetadata metadata;
    metadata.source = source;
    std::lock_guard<std::mutex> lock(session_mutex_);
    metadata.call_active = session_.active;
    metadata.call_id = session_.call_id;
    return metadata;
}

bool CallStateMachine::deliver_reply(const ByteBuffer& pcm) {
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!session_.connected) {
            return false;
        }
    }
    Result<void> sent = transport_.send(RelayEvent::with_audio(EventType::AudioInput, utils::base64_encode(pcm)));
    if (!sent) {
        LOG_WARN("[Call] reply not sent: " + sent.error().describe());
        return false;
    }
    std::lock_guard<std::mutex> lock(session_mutex_);
    ++session_.replies_delivered;
    return true;
}

void CallStateMachine::on_transport_event(const RelayEvent& event) {
    switch (event.type) {
        case EventType::AudioStream: {
            {
                std::lock_guard<std::mutex> lock(session_mutex_);
                ++session_.frames_sent;
                if (frame_handler_) {
                    ++session_.turns_dispatched;
                }
            }
            if (frame_handler_) {
                frame_handler_(event.audio);
            }
            break;
        }
        case EventType::RecordingStarted:
        case EventType::RecordingStopped:
        case EventType::RecordingError: {
            if (resolve_ack(event)) {
                break;
            }
            if (event.type == EventType::RecordingStarted) {
                LOG_DEBUG("[Call] Unsolicited recording-started ignored");
                break;
            }
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (session_.active) {
                Logger::warn(std::string("[Call] Endpoint sent ") + event_tag(event.type) +
                             (event.message.empty() ? std::string() : ": " + event.message) +
                             "; call no longer active");
                session_.active = false;
            }
            break;
        }
        case EventType::Connected:
            LOG_RELAY("Endpoint says: " + (event.status.empty() ? std::string("connected") : event.status));
            break;
        case EventType::AudioReceived:
            LOG_DEBUG("[Relay] Endpoint queued reply audio");
            break;
        case EventType::Error:
            LOG_WARN("[Relay] Endpoint error: " + event.message);
            break;
        case EventType::StartRecording:
        case EventType::StopRecording:
        case EventType::AudioInput:
            LOG_WARN(std::string("[Relay] Unexpected ") + event_tag(event.type) + " from endpoint ignored");
            break;
    }
}

void CallStateMachine::on_transport_closed(const std::string& reason) {
    cancel_ack();

    std::lock_guard<std::mutex> lock(session_mutex_);
    bool was_active = session_.active;
    session_.connected = false;
    session_.active = false;
    ++session_.disconnects;
    ++epoch_;
    LOG_CALL("Relay closed (" + reason + ")" + (was_active ? "; active call dropped" : ""));
}

void CallStateMachine::arm_ack(EventType expected) {
    std::lock_guard<std::mutex> lock(ack_mutex_);
    ack_ = AckWait();
    ack_.armed = true;
    ack_.expected = expected;
}

CallStateMachine::AckOutcome CallStateMachine::wait_ack(std::string& message) {
    std::unique_lock<std::mutex> lock(ack_mutex_);
    ack_cv_.wait_for(lock, std::chrono::milliseconds(ack_timeout_ms_),
                     [this] { return ack_.outcome != AckOutcome::None; });
    AckOutcome outcome = ack_.outcome;
    message = ack_.message;
    ack_ = AckWait();
    return outcome;
}

void CallStateMachine::disarm_ack() {
    std::lock_guard<std::mutex> lock(ack_mutex_);
    ack_ = AckWait();
}

bool CallStateMachine::resolve_ack(const RelayEvent& event) {
    {
        std::lock_guard<std::mutex> lock(ack_mutex_);
        if (!ack_.armed || ack_.outcome != AckOutcome::None) {
            return false;
        }
        if (event.type == ack_.expected) {
            ack_.outcome = AckOutcome::Acknowledged;
            ack_.message = event.status;
        } else if (event.type == EventType::RecordingError) {
            ack_.outcome = AckOutcome::Refused;
            ack_.message = event.message;
        } else {
            return false;
        }
    }
    ack_cv_.notify_all();
    return true;
}

void CallStateMachine::cancel_ack() {
    {
        std::lock_guard<std::mutex> lock(ack_mutex_);
        if (!ack_.armed || ack_.outcome != AckOutcome::None) {
            return;
        }
        ack_.outcome = AckOutcome::Disconnected;
    }
    ack_cv_.notify_all();
}

} // namespace call_relay
