#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <vector>
#include <memory>

namespace call_relay {

enum class DeviceDirection {
    Input,
    Output
};

inline const char* direction_name(DeviceDirection direction) {
    return direction == DeviceDirection::Input ? "input" : "output";
}

/**
 * @brief One device as enumerated by the platform audio layer
 */
struct DeviceInfo {
    int index = -1;
    std::string name;
    int max_input_channels = 0;
    int max_output_channels = 0;
    double default_sample_rate = 0.0;

    int channels(DeviceDirection direction) const {
        return direction == DeviceDirection::Input ? max_input_channels : max_output_channels;
    }
};

/**
 * @brief Resolved device reference; read-only after startup
 *
 * index == -1 means "let the backend open its own default".
 */
struct DeviceHandle {
    DeviceInfo info;
    DeviceDirection direction = DeviceDirection::Input;
    bool is_default = false;

    int index() const { return info.index; }

    /// Declared channel capacity in this handle's direction (0 = unknown)
    int channels() const { return info.channels(direction); }
};

/**
 * @brief Interleaved int16 PCM grouped into frames for one output device
 */
struct PcmBlock {
    AudioBuffer samples;
    int channels = 0;

    size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }
};

/**
 * @brief Open capture stream; one chunk per read
 */
class IInputStream {
public:
    virtual ~IInputStream() = default;

    /**
     * @brief Blocking read of one chunk (frames_per_chunk frames)
     * @param out Replaced with the chunk's interleaved little-endian bytes
     */
    virtual Result<void> read(ByteBuffer& out) = 0;
};

/**
 * @brief Platform audio layer seen by the registry and the engines
 *
 * PortAudio in production; tests substitute an in-memory backend.
 */
class IAudioBackend {
public:
    virtual ~IAudioBackend() = default;

    virtual std::vector<DeviceInfo> devices() = 0;

    /// Platform default device index, or -1 when there is none
    virtual int default_device(DeviceDirection direction) = 0;

    virtual Result<std::unique_ptr<IInputStream>> open_input(const DeviceHandle& device,
                                                             const AudioFormat& format) = 0;

    /**
     * @brief Render a block and block until the device has drained it
     */
    virtual Result<void> play(const DeviceHandle& device, const PcmBlock& block, int sample_rate) = 0;
};

} // namespace call_relay
