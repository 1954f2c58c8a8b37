#pragma once

#include "errors.h"
#include <string>
#include <optional>

namespace call_relay {

/**
 * @brief Named relay events (wire tags in comments)
 */
enum class EventType {
    StartRecording,    ///< start-recording   (coordinator -> endpoint)
    StopRecording,     ///< stop-recording    (coordinator -> endpoint)
    AudioStream,       ///< audio-stream      (endpoint -> coordinator, captured PCM)
    AudioInput,        ///< audio-input       (coordinator -> endpoint, PCM to play)
    RecordingStarted,  ///< recording-started
    RecordingStopped,  ///< recording-stopped
    RecordingError,    ///< recording-error
    AudioReceived,     ///< audio-received
    Connected,         ///< connected
    Error              ///< error
};

const char* event_tag(EventType type);
std::optional<EventType> parse_event_tag(const std::string& tag);

/// Audio events carry "audio", errors carry "message", the rest "status"
bool is_audio_event(EventType type);
bool is_error_event(EventType type);

/**
 * @brief One typed relay message
 */
struct RelayEvent {
    EventType type = EventType::Connected;
    std::string audio;    ///< base64 PCM (audio events)
    std::string status;   ///< status text (acks, connected)
    std::string message;  ///< error text (recording-error, error)

    static RelayEvent command(EventType type) {
        RelayEvent e;
        e.type = type;
        return e;
    }

    static RelayEvent with_audio(EventType type, std::string base64_audio) {
        RelayEvent e;
        e.type = type;
        e.audio = std::move(base64_audio);
        return e;
    }

    static RelayEvent with_status(EventType type, std::string status) {
        RelayEvent e;
        e.type = type;
        e.status = std::move(status);
        return e;
    }

    static RelayEvent with_message(EventType type, std::string message) {
        RelayEvent e;
        e.type = type;
        e.message = std::move(message);
        return e;
    }
};

/**
 * @brief Encode as {"event": tag, "data": {...}}
 */
std::string encode_event(const RelayEvent& event);

/**
 * @brief Decode a wire envelope
 *
 * ProtocolError for unparsable JSON, a non-object envelope, an unknown or
 * missing tag, a non-object "data", or a non-string field.
 */
Result<RelayEvent> decode_event(const std::string& text);

} // namespace call_relay
