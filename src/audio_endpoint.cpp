#include "audio_endpoint.h"
#include "logger.h"
#include "utils.h"

namespace call_relay {

AudioEndpoint::AudioEndpoint(CaptureEngine& capture, PlaybackEngine& playback)
    : capture_(capture),
      playback_(playback),
      session_(0),
      next_session_(1),
      frames_relayed_(0),
      frames_unsent_(0) {
    capture_.set_sink([this](AudioFrame&& frame) { on_frame(std::move(frame)); });
    capture_.set_error_callback([this](const Error& error) { on_capture_error(error); });
}

AudioEndpoint::~AudioEndpoint() {
    capture_.stop();
    capture_.set_sink(nullptr);
    capture_.set_error_callback(nullptr);
}

bool AudioEndpoint::has_counterparty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != 0;
}

uint64_t AudioEndpoint::attach(Sender sender) {
    uint64_t session = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ != 0) {
            return 0;
        }
        session = next_session_++;
        session_ = session;
        sender_ = std::move(sender);
    }
    LOG_RELAY("Counterparty attached (session " + std::to_string(session) + ")");
    reply(session, RelayEvent::with_status(EventType::Connected, "Connected to audio server"));
    return session;
}

void AudioEndpoint::detach(uint64_t session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session == 0 || session != session_) {
            return;
        }
        session_ = 0;
        sender_ = nullptr;
    }
    LOG_RELAY("Counterparty detached (session " + std::to_string(session) + ")");
    if (capture_.is_running()) {
        LOG_CAPTURE("Counterparty gone; stopping capture");
        capture_.stop();
    }
}

void AudioEndpoint::handle_event(uint64_t session, const RelayEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session != session_) {
            LOG_DEBUG(std::string("[Relay] Event from stale session ignored: ") + event_tag(event.type));
            return;
        }
    }

    switch (event.type) {
        case EventType::StartRecording:
            handle_start(session);
            break;
        case EventType::StopRecording:
            handle_stop(session);
            break;
        case EventType::AudioInput:
            handle_audio_input(session, event);
            break;
        default:
            LOG_WARN(std::string("[Relay] Unhandled event from coordinator: ") + event_tag(event.type));
            break;
    }
}

void AudioEndpoint::handle_start(uint64_t session) {
    if (capture_.is_running()) {
        LOG_CAPTURE("start-recording while already recording");
        reply(session, RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
        return;
    }
    if (capture_.start()) {
        reply(session, RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
    } else {
        reply(session, RelayEvent::with_message(EventType::RecordingError, "Failed to start recording"));
    }
}

void AudioEndpoint::handle_stop(uint64_t session) {
    if (capture_.stop()) {
        reply(session, RelayEvent::with_status(EventType::RecordingStopped, "recording_stopped"));
    } else {
        reply(session, RelayEvent::with_message(EventType::RecordingError, "Not currently recording"));
    }
}

void AudioEndpoint::handle_audio_input(uint64_t session, const RelayEvent& event) {
    if (event.audio.empty()) {
        reply(session, RelayEvent::with_message(EventType::Error, "No audio data received"));
        return;
    }
    auto bytes = utils::base64_decode(event.audio);
    if (!bytes) {
        LOG_WARN("[Playback] " + bytes.error().describe());
        reply(session, RelayEvent::with_message(EventType::Error,
                                                "Error processing audio: " + bytes.error().message));
        return;
    }
    if (bytes.value().empty()) {
        reply(session, RelayEvent::with_message(EventType::Error, "No audio data received"));
        return;
    }
    size_t size = bytes.value().size();
    if (!playback_.enqueue(std::move(bytes.value()))) {
        reply(session, RelayEvent::with_message(EventType::Error,
                                                "Error processing audio: malformed PCM buffer of " +
                                                std::to_string(size) + " bytes"));
        return;
    }
    reply(session, RelayEvent::with_status(EventType::AudioReceived, "Audio received and queued for output"));
}

void AudioEndpoint::on_frame(AudioFrame&& frame) {
    Sender sender = current_sender();
    if (!sender) {
        frames_unsent_++;
        return;
    }
    Result<void> sent = sender(RelayEvent::with_audio(EventType::AudioStream, utils::base64_encode(frame.bytes())));
    if (sent) {
        frames_relayed_++;
    } else {
        frames_unsent_++;
        LOG_DEBUG("[Capture] frame " + std::to_string(frame.sequence()) + " not sent: " + sent.error().describe());
    }
}

void AudioEndpoint::on_capture_error(const Error& error) {
    Logger::error("[Capture] " + error.describe());
    Sender sender = current_sender();
    if (!sender) {
        return;
    }
    Result<void> sent = sender(RelayEvent::with_message(EventType::RecordingError, error.message));
    if (!sent) {
        LOG_WARN("[Relay] recording-error not sent: " + sent.error().describe());
    }
}

void AudioEndpoint::reply(uint64_t session, const RelayEvent& event) {
    Sender sender;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session != session_) {
            return;
        }
        sender = sender_;
    }
    if (!sender) {
        return;
    }
    Result<void> sent = sender(event);
    if (!sent) {
        LOG_WARN(std::string("[Relay] ") + event_tag(event.type) + " not sent: " + sent.error().describe());
    }
}

AudioEndpoint::Sender AudioEndpoint::current_sender() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sender_;
}

} // namespace call_relay
