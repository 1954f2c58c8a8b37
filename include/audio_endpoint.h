#pragma once

#include "capture_engine.h"
#include "playback_engine.h"
#include "relay_protocol.h"
#include <atomic>
#include <functional>
#include <mutex>

namespace call_relay {

/**
 * @brief Device side of the relay: maps relay events onto the engines
 *
 * Serves one counterparty at a time. Captured frames go out as
 * audio-stream; audio-input payloads are queued for playback.
 *
 * Event mapping:
 * - start-recording -> capture start -> recording-started | recording-error
 * - stop-recording  -> capture stop  -> recording-stopped | recording-error
 * - audio-input     -> playback queue -> audio-received | error
 * - attach          -> connected
 * - detach          -> capture auto-stop
 * - capture failure -> recording-error
 */
class AudioEndpoint {
public:
    /// Sends one event to the attached counterparty
    using Sender = std::function<Result<void>(const RelayEvent&)>;

    AudioEndpoint(CaptureEngine& capture, PlaybackEngine& playback);
    ~AudioEndpoint();

    AudioEndpoint(const AudioEndpoint&) = delete;
    AudioEndpoint& operator=(const AudioEndpoint&) = delete;

    bool has_counterparty() const;

    /**
     * @brief Attach a counterparty and greet it with "connected"
     * @return Session id, or 0 when another counterparty is attached
     */
    uint64_t attach(Sender sender);

    /**
     * @brief Forget the counterparty; stops capture if it was recording
     */
    void detach(uint64_t session);

    /// Handle one inbound event from `session` (stale sessions are ignored)
    void handle_event(uint64_t session, const RelayEvent& event);

    uint64_t frames_relayed() const { return frames_relayed_.load(); }
    uint64_t frames_unsent() const { return frames_unsent_.load(); }

private:
    void on_frame(AudioFrame&& frame);
    void on_capture_error(const Error& error);
    void reply(uint64_t session, const RelayEvent& event);
    Sender current_sender() const;

    void handle_start(uint64_t session);
    void handle_stop(uint64_t session);
    void handle_audio_input(uint64_t session, const RelayEvent& event);

    CaptureEngine& capture_;
    PlaybackEngine& playback_;

    mutable std::mutex mutex_;
    Sender sender_;
    uint64_t session_;
    uint64_t next_session_;

    std::atomic<uint64_t> frames_relayed_;
    std::atomic<uint64_t> frames_unsent_;
};

} // namespace call_relay
