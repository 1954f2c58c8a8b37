#pragma once

#include "call_session.h"
#include "chat_client.h"
#include "common.h"
#include "errors.h"
#include "relay_transport.h"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

namespace call_relay {

/**
 * @brief Caller details carried by call-started
 */
struct CallRequest {
    std::string caller;
    std::string call_id;
};

/**
 * @brief Connection and call-active tracking for the coordinator
 *
 * Transitions:
 * - start_call(): Idle/Connected -> Active (connect if needed, start-recording,
 *   wait for recording-started)
 * - end_call(): Active -> Connected (stop-recording, wait for the ack)
 * - transport close: any -> Idle
 * - unsolicited recording-stopped / recording-error: Active -> Connected
 *
 * Disconnect always wins: the close handler cancels a pending ack wait, then
 * clears both flags and bumps the disconnect epoch. start_call() only commits
 * active=true when the epoch is unchanged since its connect.
 *
 * A start that times out is withdrawn with stop-recording, so a slow endpoint
 * never keeps capturing for a call the coordinator considers inactive.
 *
 * Thread Safety:
 * - start_call()/end_call() are serialized by the transition mutex
 * - Session fields change only under the session mutex, which is never held
 *   while waiting on the transport
 */
class CallStateMachine {
public:
    /// Receives the base64 payload of every audio-stream frame
    using FrameHandler = std::function<void(std::string base64_audio)>;

    CallStateMachine(IRelayTransport& transport, int ack_timeout_ms = DEFAULT_ACK_TIMEOUT_MS);

    /**
     * @brief Destructor - detaches from the transport
     */
    ~CallStateMachine();

    CallStateMachine(const CallStateMachine&) = delete;
    CallStateMachine& operator=(const CallStateMachine&) = delete;

    /// Set before the first start_call()
    void set_frame_handler(FrameHandler handler);

    /**
     * @brief Start capturing on the endpoint; idempotent while active
     * @return TransportError, DeviceError (recording-error) or Timeout on failure
     */
    Result<void> start_call(const CallRequest& request = CallRequest());

    /**
     * @brief Stop capturing; no-op success when not active
     */
    Result<void> end_call();

    /// Snapshot of the session
    CallSession status() const;

    /// Chat metadata for the current session
    ChatMetadata chat_metadata(const std::string& source) const;

    /**
     * @brief Send synthesized PCM to the endpoint as audio-input
     * @return False when the transport is closed
     */
    bool deliver_reply(const ByteBuffer& pcm);

    /// Relay event entry point (transport thread)
    void on_transport_event(const RelayEvent& event);

    /// Relay close entry point
    void on_transport_closed(const std::string& reason);

    /**
     * @brief Clear the transport handlers; call before the transport is destroyed
     */
    void detach();

private:
    enum class AckOutcome {
        None,
        Acknowledged,
        Refused,        ///< recording-error
        Disconnected
    };

    struct AckWait {
        bool armed = false;
        EventType expected = EventType::RecordingStarted;
        AckOutcome outcome = AckOutcome::None;
        std::string message;
    };

    void arm_ack(EventType expected);
    AckOutcome wait_ack(std::string& message);
    void disarm_ack();
    bool resolve_ack(const RelayEvent& event);
    void cancel_ack();

    /// Best-effort stop-recording after a start that was never acknowledged
    void withdraw_start();

    IRelayTransport& transport_;
    int ack_timeout_ms_;
    FrameHandler frame_handler_;

    std::mutex transition_mutex_;

    mutable std::mutex session_mutex_;
    CallSession session_;
    uint64_t epoch_;

    std::mutex ack_mutex_;
    std::condition_variable ack_cv_;
    AckWait ack_;

    std::mutex detach_mutex_;
    bool attached_;
};

} // namespace call_relay
