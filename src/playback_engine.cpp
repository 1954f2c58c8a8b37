#include "playback_engine.h"
#include "logger.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace call_relay {

namespace {

constexpr size_t kMaxPendingBuffers = 64;

Result<void> validate_layout(const ByteBuffer& bytes, const AudioFormat& format) {
    if (bytes.empty()) {
        return make_error(ErrorType::EmptyPayload, "empty playback buffer");
    }
    size_t frame_bytes = format.bytes_per_frame();
    if (frame_bytes == 0 || bytes.size() % frame_bytes != 0) {
        return make_error(ErrorType::ProtocolError,
                          "playback buffer of " + std::to_string(bytes.size()) +
                          " bytes is not a multiple of " + std::to_string(frame_bytes) + "-byte frames");
    }
    return Result<void>();
}

} // namespace

Result<PcmBlock> reshape_interleaved(const ByteBuffer& bytes, const AudioFormat& format, int device_channels) {
    Result<void> valid = validate_layout(bytes, format);
    if (!valid) {
        return valid.error();
    }
    if (format.bits_per_sample != 16) {
        return make_error(ErrorType::InvalidState,
                          "unsupported sample width " + std::to_string(format.bits_per_sample));
    }

    const size_t stream_channels = static_cast<size_t>(format.channels);
    const size_t sample_count = bytes.size() / sizeof(Sample);
    const size_t frames = sample_count / stream_channels;

    AudioBuffer samples(sample_count);
    for (size_t i = 0; i < sample_count; ++i) {
        uint16_t lo = bytes[2 * i];
        uint16_t hi = bytes[2 * i + 1];
        samples[i] = static_cast<Sample>(static_cast<uint16_t>(lo | (hi << 8)));
    }

    PcmBlock block;
    if (device_channels <= 0 || static_cast<size_t>(device_channels) >= stream_channels) {
        block.samples = std::move(samples);
        block.channels = static_cast<int>(stream_channels);
        return block;
    }

    const size_t out_channels = static_cast<size_t>(device_channels);
    block.channels = device_channels;
    block.samples.resize(frames * out_channels);
    for (size_t f = 0; f < frames; ++f) {
        for (size_t k = 0; k < out_channels; ++k) {
            int32_t sum = 0;
            int32_t n = 0;
            for (size_t j = k; j < stream_channels; j += out_channels) {
                sum += samples[f * stream_channels + j];
                ++n;
            }
            block.samples[f * out_channels + k] = static_cast<Sample>(sum / n);
        }
    }
    return block;
}

class PlaybackEngine::Impl {
public:
    Impl(IAudioBackend& backend, const DeviceHandle& device, const AudioFormat& format)
        : backend_(backend), device_(device), format_(format),
          shutdown_(false), played_(0) {
        thread_ = std::thread(&Impl::playback_loop, this);
    }

    ~Impl() {
        shutdown();
    }

    bool play(const ByteBuffer& bytes) {
        auto block = reshape_interleaved(bytes, format_, device_.channels());
        if (!block) {
            Logger::warn("[Playback] Dropping buffer: " + block.error().describe());
            return false;
        }
        return render(block.value(), bytes.size());
    }

    bool enqueue(ByteBuffer bytes) {
        Result<void> valid = validate_layout(bytes, format_);
        if (!valid) {
            Logger::warn("[Playback] Refusing buffer: " + valid.error().describe());
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_) {
                return false;
            }
            if (queue_.size() >= kMaxPendingBuffers) {
                queue_.pop_front();
                Logger::warn("[Playback] Queue full; dropped oldest buffer");
            }
            queue_.push_back(std::move(bytes));
        }
        queue_cv_.notify_one();
        return true;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return queue_.size();
    }

    uint64_t buffers_played() const {
        return played_.load();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_ && !thread_.joinable()) {
                return;
            }
            shutdown_ = true;
            queue_.clear();
        }
        queue_cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    bool render(const PcmBlock& block, size_t byte_count) {
        std::lock_guard<std::mutex> lock(render_mutex_);
        Result<void> result = backend_.play(device_, block, format_.sample_rate);
        if (!result) {
            Logger::error("[Playback] " + result.error().describe());
            return false;
        }
        played_.fetch_add(1);
        LOG_PLAYBACK("Played " + std::to_string(byte_count) + " bytes (" +
                     std::to_string(format_.duration_ms(byte_count)) + " ms, " +
                     std::to_string(block.channels) + " ch)");
        return true;
    }

    void playback_loop() {
        while (true) {
            ByteBuffer next;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
                if (shutdown_) {
                    break;
                }
                next = std::move(queue_.front());
                queue_.pop_front();
            }
            play(next);
        }
    }

    IAudioBackend& backend_;
    DeviceHandle device_;
    AudioFormat format_;

    std::mutex render_mutex_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<ByteBuffer> queue_;
    bool shutdown_;
    std::atomic<uint64_t> played_;
    std::thread thread_;
};

PlaybackEngine::PlaybackEngine(IAudioBackend& backend, const DeviceHandle& device, const AudioFormat& format)
    : pimpl_(std::make_unique<Impl>(backend, device, format)) {}

PlaybackEngine::~PlaybackEngine() = default;

bool PlaybackEngine::play(const ByteBuffer& bytes) {
    return pimpl_->play(bytes);
}

bool PlaybackEngine::enqueue(ByteBuffer bytes) {
    return pimpl_->enqueue(std::move(bytes));
}

size_t PlaybackEngine::pending() const {
    return pimpl_->pending();
}

uint64_t PlaybackEngine::buffers_played() const {
    return pimpl_->buffers_played();
}

void PlaybackEngine::shutdown() {
    pimpl_->shutdown();
}

} // namespace call_relay
