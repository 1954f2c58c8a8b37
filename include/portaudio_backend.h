#pragma once

#include "audio_backend.h"
#include <memory>

namespace call_relay {

/**
 * @brief IAudioBackend on PortAudio blocking streams
 *
 * Pa_Initialize() in initialize(), Pa_Terminate() on destruction.
 *
 * Thread Safety:
 * - Stream open/close is serialized by an internal mutex
 * - A capture stream and a playback stream may run concurrently
 */
class PortAudioBackend : public IAudioBackend {
public:
    PortAudioBackend();
    ~PortAudioBackend() override;

    PortAudioBackend(const PortAudioBackend&) = delete;
    PortAudioBackend& operator=(const PortAudioBackend&) = delete;

    Result<void> initialize();

    std::vector<DeviceInfo> devices() override;
    int default_device(DeviceDirection direction) override;
    Result<std::unique_ptr<IInputStream>> open_input(const DeviceHandle& device,
                                                     const AudioFormat& format) override;
    Result<void> play(const DeviceHandle& device, const PcmBlock& block, int sample_rate) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace call_relay
