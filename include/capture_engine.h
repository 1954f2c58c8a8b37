#pragma once

#include "common.h"
#include "errors.h"
#include "audio_backend.h"
#include <functional>
#include <memory>

namespace call_relay {

/**
 * @brief Continuous capture on one background worker
 *
 * start() spawns the worker and returns once the device is open; the worker
 * then reads one chunk at a time and hands each AudioFrame to the sink.
 *
 * Thread Safety:
 * - start()/stop() are serialized; both are idempotent
 * - The sink and error callback run on the capture worker
 * - There is never more than one live worker
 */
class CaptureEngine {
public:
    using FrameSink = std::function<void(AudioFrame&&)>;
    using ErrorCallback = std::function<void(const Error&)>;

    CaptureEngine(IAudioBackend& backend,
                  const DeviceHandle& device,
                  const AudioFormat& format,
                  int stop_join_timeout_ms = DEFAULT_STOP_JOIN_TIMEOUT_MS,
                  int device_open_timeout_ms = DEFAULT_DEVICE_OPEN_TIMEOUT_MS);
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    /// Set before start(); called synchronously for every captured chunk
    void set_sink(FrameSink sink);

    /// Called once when the device fails mid-capture (worker then exits)
    void set_error_callback(ErrorCallback callback);

    /**
     * @brief Start capturing
     * @return False if already running or the device could not be opened
     */
    bool start();

    /**
     * @brief Stop capturing; waits at most the join timeout
     * @return False if not running
     */
    bool stop();

    bool is_running() const;

    /// Total chunks delivered to the sink since construction
    uint64_t frames_captured() const;

    const AudioFormat& format() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
