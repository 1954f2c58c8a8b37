#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <utility>

namespace call_relay {

// Audio types
using Sample = int16_t;
using AudioBuffer = std::vector<Sample>;
using ByteBuffer = std::vector<uint8_t>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 48000;
constexpr int DEFAULT_CHANNELS = 2;
constexpr int DEFAULT_BITS_PER_SAMPLE = 16;
constexpr int DEFAULT_FRAMES_PER_CHUNK = 1024;

// Capture worker
constexpr int DEFAULT_STOP_JOIN_TIMEOUT_MS = 2000;
constexpr int DEFAULT_DEVICE_OPEN_TIMEOUT_MS = 2000;

// Relay
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 5000;
constexpr int DEFAULT_ACK_TIMEOUT_MS = 3000;
constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 10 * 1024 * 1024;

/**
 * @brief PCM layout shared by capture, playback and the relay.
 *
 * Fixed for the lifetime of the process; samples are signed little-endian.
 */
struct AudioFormat {
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;
    int bits_per_sample = DEFAULT_BITS_PER_SAMPLE;
    int frames_per_chunk = DEFAULT_FRAMES_PER_CHUNK;

    size_t bytes_per_sample() const { return static_cast<size_t>(bits_per_sample / 8); }
    size_t bytes_per_frame() const { return bytes_per_sample() * static_cast<size_t>(channels); }
    size_t bytes_per_chunk() const { return bytes_per_frame() * static_cast<size_t>(frames_per_chunk); }

    /// Playback duration of a byte buffer in this format
    int64_t duration_ms(size_t byte_count) const {
        size_t frame_bytes = bytes_per_frame();
        if (frame_bytes == 0 || sample_rate <= 0) return 0;
        return static_cast<int64_t>((byte_count / frame_bytes) * 1000 / static_cast<size_t>(sample_rate));
    }
};

/**
 * @brief One captured chunk of interleaved PCM.
 *
 * Immutable once produced; moved from the capture worker to its sink.
 */
class AudioFrame {
public:
    AudioFrame(ByteBuffer bytes, const AudioFormat& format, uint64_t sequence)
        : bytes_(std::move(bytes)), format_(format), sequence_(sequence), captured_at_(Clock::now()) {}

    const ByteBuffer& bytes() const { return bytes_; }
    const AudioFormat& format() const { return format_; }
    uint64_t sequence() const { return sequence_; }
    TimePoint captured_at() const { return captured_at_; }
    size_t frame_count() const {
        size_t frame_bytes = format_.bytes_per_frame();
        return frame_bytes ? bytes_.size() / frame_bytes : 0;
    }

private:
    ByteBuffer bytes_;
    AudioFormat format_;
    uint64_t sequence_;
    TimePoint captured_at_;
};

} // namespace call_relay
