#pragma once

#include "common.h"
#include "errors.h"
#include "audio_backend.h"
#include <memory>

namespace call_relay {

/**
 * @brief Reshape interleaved little-endian PCM for an output device
 *
 * Rejects empty buffers and lengths that are not a whole number of frames.
 * When the device has fewer channels than the stream, output channel k is
 * the average of every stream channel j with j % device_channels == k.
 *
 * @param device_channels Output device channel capacity (<= 0: use stream layout)
 */
Result<PcmBlock> reshape_interleaved(const ByteBuffer& bytes, const AudioFormat& format, int device_channels);

/**
 * @brief Renders PCM buffers on the output device
 *
 * play() is synchronous and serialized; enqueue() hands the buffer to a
 * dedicated playback thread so callers never block on rendering.
 */
class PlaybackEngine {
public:
    PlaybackEngine(IAudioBackend& backend, const DeviceHandle& device, const AudioFormat& format);
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    /**
     * @brief Render and block until done
     * @return False (logged) for malformed buffers or device failure
     */
    bool play(const ByteBuffer& bytes);

    /**
     * @brief Queue for the playback thread
     * @return False when the buffer is malformed or the engine is shut down
     */
    bool enqueue(ByteBuffer bytes);

    /// Buffers waiting on the playback thread
    size_t pending() const;

    /// Buffers rendered successfully
    uint64_t buffers_played() const;

    /// Drain nothing further and join the playback thread
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
