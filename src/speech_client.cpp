#include "speech_client.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cstring>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace call_relay {

namespace {

void put_u32(ByteBuffer& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void put_u16(ByteBuffer& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_tag(ByteBuffer& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

uint32_t read_u32(const ByteBuffer& in, size_t at) {
    return static_cast<uint32_t>(in[at]) |
           (static_cast<uint32_t>(in[at + 1]) << 8) |
           (static_cast<uint32_t>(in[at + 2]) << 16) |
           (static_cast<uint32_t>(in[at + 3]) << 24);
}

bool tag_at(const ByteBuffer& in, size_t at, const char* tag) {
    return in.size() >= at + 4 && std::memcmp(in.data() + at, tag, 4) == 0;
}

Error status_error(const char* what, const HttpClientResponse& response) {
    return make_error(ErrorType::BadResponse,
                      std::string(what) + " request failed (" + std::to_string(response.status) + "): " +
                      utils::preview(utils::trim_copy(response.body), 200));
}

} // namespace

ByteBuffer wav_wrap(const ByteBuffer& pcm, const AudioFormat& format) {
    const uint32_t data_size = static_cast<uint32_t>(pcm.size());
    const uint16_t block_align = static_cast<uint16_t>(format.bytes_per_frame());
    const uint32_t byte_rate = static_cast<uint32_t>(format.sample_rate) * block_align;

    ByteBuffer out;
    out.reserve(44 + pcm.size());
    put_tag(out, "RIFF");
    put_u32(out, 36 + data_size);
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, static_cast<uint16_t>(format.channels));
    put_u32(out, static_cast<uint32_t>(format.sample_rate));
    put_u32(out, byte_rate);
    put_u16(out, block_align);
    put_u16(out, static_cast<uint16_t>(format.bits_per_sample));
    put_tag(out, "data");
    put_u32(out, data_size);
    out.insert(out.end(), pcm.begin(), pcm.end());
    return out;
}

ByteBuffer strip_wav_header(const ByteBuffer& bytes) {
    if (!tag_at(bytes, 0, "RIFF") || !tag_at(bytes, 8, "WAVE")) {
        return bytes;
    }
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = read_u32(bytes, pos + 4);
        if (tag_at(bytes, pos, "data")) {
            size_t begin = pos + 8;
            size_t end = std::min(bytes.size(), begin + static_cast<size_t>(chunk_size));
            return ByteBuffer(bytes.begin() + static_cast<std::ptrdiff_t>(begin),
                              bytes.begin() + static_cast<std::ptrdiff_t>(end));
        }
        // Chunks are word aligned
        pos += 8 + static_cast<size_t>(chunk_size) + (chunk_size & 1u);
    }
    return bytes;
}

Result<std::string> normalize_base_url(const std::string& base_url) {
    std::string base = utils::trim_copy(base_url);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.rfind("http://", 0) != 0 && base.rfind("https://", 0) != 0) {
        return make_error(ErrorType::ConfigError, "base_url must include http:// or https:// scheme: '" + base_url + "'");
    }
    return base;
}

class HttpSpeechClient::Impl {
public:
    explicit Impl(const SpeechConfig& config)
        : config_(config), http_(config.timeout_ms) {}

    Result<std::string> transcribe(const ByteBuffer& pcm, const AudioFormat& format) {
        if (pcm.empty()) {
            return make_error(ErrorType::EmptyPayload, "no audio to transcribe");
        }
        ByteBuffer wav = wav_wrap(pcm, format);
        return upload(std::string(wav.begin(), wav.end()), "chunk.wav", "audio/wav");
    }

    Result<std::string> upload(const std::string& file_bytes, const std::string& filename,
                               const std::string& content_type) {
        if (file_bytes.empty()) {
            return make_error(ErrorType::EmptyPayload, "no audio to transcribe");
        }
        auto base = normalize_base_url(config_.base_url);
        if (!base) {
            return base.error();
        }

        std::vector<MultipartField> fields;
        MultipartField file;
        file.name = "file";
        file.data = file_bytes;
        file.filename = filename;
        file.content_type = content_type;
        fields.push_back(std::move(file));
        if (!config_.language.empty()) {
            MultipartField language;
            language.name = "language";
            language.data = config_.language;
            fields.push_back(std::move(language));
        }

        auto result = http_.post_multipart(base.value() + "/transcribe", fields);
        if (!result) {
            return result.error();
        }
        const HttpClientResponse& response = result.value();
        if (response.status >= 400) {
            return status_error("Transcription", response);
        }

        json body;
        try {
            body = json::parse(response.body);
        } catch (const json::exception&) {
            return make_error(ErrorType::BadResponse, "Transcription response did not contain valid JSON");
        }
        if (!body.is_object() || !body.contains("text")) {
            return make_error(ErrorType::BadResponse, "Transcription response missing 'text' field");
        }
        if (body["text"].is_null()) {
            return std::string();
        }
        if (!body["text"].is_string()) {
            return make_error(ErrorType::BadResponse, "Transcription 'text' is not a string");
        }
        return body["text"].get<std::string>();
    }

    Result<SynthesizedAudio> synthesize(const std::string& text) {
        std::string stripped = utils::trim_copy(text);
        if (stripped.empty()) {
            return make_error(ErrorType::EmptyPayload, "Text to synthesize must not be empty");
        }
        auto base = normalize_base_url(config_.base_url);
        if (!base) {
            return base.error();
        }

        json payload;
        payload["text"] = stripped;
        if (!config_.voice.empty()) payload["voice"] = config_.voice;
        if (!config_.audio_format.empty()) payload["audio_format"] = config_.audio_format;

        auto result = http_.post_json(base.value() + "/synthesize", payload.dump());
        if (!result) {
            return result.error();
        }
        const HttpClientResponse& response = result.value();
        if (response.status >= 400) {
            return status_error("Synthesis", response);
        }
        if (response.body.empty()) {
            return make_error(ErrorType::BadResponse, "Synthesis response did not return any audio data");
        }

        SynthesizedAudio audio;
        audio.bytes.assign(response.body.begin(), response.body.end());
        if (!response.content_type.empty()) {
            audio.content_type = response.content_type;
        }
        return audio;
    }

private:
    SpeechConfig config_;
    HttpClient http_;
};

HttpSpeechClient::HttpSpeechClient(const SpeechConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

HttpSpeechClient::~HttpSpeechClient() = default;

Result<std::string> HttpSpeechClient::transcribe(const ByteBuffer& pcm, const AudioFormat& format) {
    return pimpl_->transcribe(pcm, format);
}

Result<std::string> HttpSpeechClient::transcribe_upload(const std::string& file_bytes, const std::string& filename) {
    return pimpl_->upload(file_bytes, filename, "application/octet-stream");
}

Result<SynthesizedAudio> HttpSpeechClient::synthesize(const std::string& text) {
    return pimpl_->synthesize(text);
}

} // namespace call_relay
