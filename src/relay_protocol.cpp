#include "relay_protocol.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace call_relay {

namespace {

struct TagEntry {
    EventType type;
    const char* tag;
};

const TagEntry kTags[] = {
    {EventType::StartRecording, "start-recording"},
    {EventType::StopRecording, "stop-recording"},
    {EventType::AudioStream, "audio-stream"},
    {EventType::AudioInput, "audio-input"},
    {EventType::RecordingStarted, "recording-started"},
    {EventType::RecordingStopped, "recording-stopped"},
    {EventType::RecordingError, "recording-error"},
    {EventType::AudioReceived, "audio-received"},
    {EventType::Connected, "connected"},
    {EventType::Error, "error"},
};

Result<std::string> optional_string(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return make_protocol_error(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

const char* event_tag(EventType type) {
    for (const auto& entry : kTags) {
        if (entry.type == type) return entry.tag;
    }
    return "unknown";
}

std::optional<EventType> parse_event_tag(const std::string& tag) {
    for (const auto& entry : kTags) {
        if (tag == entry.tag) return entry.type;
    }
    return std::nullopt;
}

bool is_audio_event(EventType type) {
    return type == EventType::AudioStream || type == EventType::AudioInput;
}

bool is_error_event(EventType type) {
    return type == EventType::RecordingError || type == EventType::Error;
}

std::string encode_event(const RelayEvent& event) {
    json data = json::object();
    if (is_audio_event(event.type)) {
        data["audio"] = event.audio;
    } else if (is_error_event(event.type)) {
        data["message"] = event.message;
    } else if (!event.status.empty()) {
        data["status"] = event.status;
    }

    json envelope;
    envelope["event"] = event_tag(event.type);
    envelope["data"] = data;
    return envelope.dump();
}

Result<RelayEvent> decode_event(const std::string& text) {
    json envelope;
    try {
        envelope = json::parse(text);
    } catch (const json::parse_error& e) {
        return make_protocol_error(std::string("unparsable envelope: ") + e.what());
    }

    if (!envelope.is_object()) {
        return make_protocol_error("envelope is not a JSON object");
    }
    auto tag_it = envelope.find("event");
    if (tag_it == envelope.end() || !tag_it->is_string()) {
        return make_protocol_error("envelope has no string 'event'");
    }
    std::string tag = tag_it->get<std::string>();
    auto type = parse_event_tag(tag);
    if (!type) {
        return make_protocol_error("unknown event tag '" + tag + "'");
    }

    RelayEvent event;
    event.type = *type;

    auto data_it = envelope.find("data");
    if (data_it == envelope.end() || data_it->is_null()) {
        return event;
    }
    if (!data_it->is_object()) {
        return make_protocol_error("'data' of '" + tag + "' is not an object");
    }

    auto audio = optional_string(*data_it, "audio");
    if (!audio) return audio.error();
    auto status = optional_string(*data_it, "status");
    if (!status) return status.error();
    auto message = optional_string(*data_it, "message");
    if (!message) return message.error();

    event.audio = std::move(audio.value());
    event.status = std::move(status.value());
    event.message = std::move(message.value());
    return event;
}

} // namespace call_relay
