#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <memory>
#include <string>

namespace call_relay {

/**
 * @brief Synthesized audio plus the MIME type the service reported
 */
struct SynthesizedAudio {
    ByteBuffer bytes;
    std::string content_type = "audio/mpeg";
};

/**
 * @brief Speech-to-text collaborator
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /**
     * @brief Transcribe one chunk of raw PCM
     * @return Transcript (may be empty), or EmptyPayload / Unreachable / BadResponse
     */
    virtual Result<std::string> transcribe(const ByteBuffer& pcm, const AudioFormat& format) = 0;
};

/**
 * @brief Text-to-speech collaborator
 */
class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;

    /**
     * @brief Synthesize text
     * @return Audio bytes, or EmptyPayload / Unreachable / BadResponse
     */
    virtual Result<SynthesizedAudio> synthesize(const std::string& text) = 0;
};

/**
 * @brief Wrap raw PCM in a 44-byte RIFF/WAVE header
 */
ByteBuffer wav_wrap(const ByteBuffer& pcm, const AudioFormat& format);

/**
 * @brief Return the "data" chunk of a RIFF/WAVE buffer; other buffers unchanged
 */
ByteBuffer strip_wav_header(const ByteBuffer& bytes);

/**
 * @brief Strip trailing slashes; the URL must start with http:// or https://
 */
Result<std::string> normalize_base_url(const std::string& base_url);

/**
 * @brief HTTP client for the speech service
 *
 * POST {base_url}/transcribe (multipart "file" + optional "language") -> {text}
 * POST {base_url}/synthesize ({text, voice?, audio_format?}) -> raw audio
 *
 * One bounded attempt per call. HTTP status >= 400 or an unusable body is
 * BadResponse; transport failures are Unreachable.
 */
class HttpSpeechClient : public ITranscriber, public ISynthesizer {
public:
    explicit HttpSpeechClient(const SpeechConfig& config);
    ~HttpSpeechClient() override;

    HttpSpeechClient(const HttpSpeechClient&) = delete;
    HttpSpeechClient& operator=(const HttpSpeechClient&) = delete;

    Result<std::string> transcribe(const ByteBuffer& pcm, const AudioFormat& format) override;

    /**
     * @brief Upload an audio file as-is (any container the service accepts)
     */
    Result<std::string> transcribe_upload(const std::string& file_bytes, const std::string& filename);

    Result<SynthesizedAudio> synthesize(const std::string& text) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
