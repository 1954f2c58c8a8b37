#include "portaudio_backend.h"
#include "logger.h"
#include <portaudio.h>
#include <memory>
#include <mutex>
#include <cstring>
#include <sstream>
#include <algorithm>

namespace call_relay {

namespace {

std::string pa_error(const std::string& what, PaError err) {
    return what + ": " + Pa_GetErrorText(err);
}

/// Resolve the index PortAudio should open (-1 = platform default)
PaDeviceIndex stream_device(const DeviceHandle& device) {
    if (device.index() >= 0) {
        return device.index();
    }
    return device.direction == DeviceDirection::Input ? Pa_GetDefaultInputDevice()
                                                      : Pa_GetDefaultOutputDevice();
}

/**
 * Blocking capture stream. Opens min(device, stream) channels and
 * duplicates the last device channel when the device has fewer.
 */
class PortAudioInputStream : public IInputStream {
public:
    PortAudioInputStream(PaStream* stream, std::mutex& lifecycle_mutex,
                         const AudioFormat& format, int device_channels)
        : stream_(stream), lifecycle_mutex_(lifecycle_mutex), format_(format),
          device_channels_(device_channels),
          scratch_(static_cast<size_t>(format.frames_per_chunk) * static_cast<size_t>(device_channels)) {}

    ~PortAudioInputStream() override {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
    }

    Result<void> read(ByteBuffer& out) override {
        PaError err = Pa_ReadStream(stream_, scratch_.data(), static_cast<unsigned long>(format_.frames_per_chunk));
        if (err == paInputOverflowed) {
            // Data is still delivered; the sink was slower than the device
            LOG_DEBUG("[Capture] input overflow");
        } else if (err != paNoError) {
            return make_device_error(pa_error("Pa_ReadStream failed", err));
        }

        const size_t frames = static_cast<size_t>(format_.frames_per_chunk);
        const size_t out_channels = static_cast<size_t>(format_.channels);
        const size_t in_channels = static_cast<size_t>(device_channels_);
        out.resize(frames * out_channels * sizeof(Sample));

        if (in_channels == out_channels) {
            std::memcpy(out.data(), scratch_.data(), out.size());
            return Result<void>();
        }

        AudioBuffer widened(frames * out_channels);
        for (size_t f = 0; f < frames; ++f) {
            for (size_t c = 0; c < out_channels; ++c) {
                size_t src = std::min(c, in_channels - 1);
                widened[f * out_channels + c] = scratch_[f * in_channels + src];
            }
        }
        std::memcpy(out.data(), widened.data(), out.size());
        return Result<void>();
    }

private:
    PaStream* stream_;
    std::mutex& lifecycle_mutex_;
    AudioFormat format_;
    int device_channels_;
    AudioBuffer scratch_;
};

} // namespace

class PortAudioBackend::Impl {
public:
    Impl() : initialized_(false) {}

    ~Impl() {
        if (initialized_) {
            Pa_Terminate();
        }
    }

    Result<void> initialize() {
        if (initialized_) {
            return Result<void>();
        }
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error(pa_error("PortAudio init error", err));
        }
        initialized_ = true;
        Logger::info(std::string("PortAudio initialized: ") + Pa_GetVersionText());
        return Result<void>();
    }

    std::vector<DeviceInfo> devices() {
        std::vector<DeviceInfo> out;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return out;
        }
        int num_devices = Pa_GetDeviceCount();
        if (num_devices < 0) {
            Logger::error(pa_error("Pa_GetDeviceCount failed", num_devices));
            return out;
        }
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            DeviceInfo d;
            d.index = i;
            d.name = info->name ? info->name : "";
            d.max_input_channels = info->maxInputChannels;
            d.max_output_channels = info->maxOutputChannels;
            d.default_sample_rate = info->defaultSampleRate;
            out.push_back(d);
        }
        return out;
    }

    int default_device(DeviceDirection direction) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return -1;
        }
        PaDeviceIndex idx = direction == DeviceDirection::Input ? Pa_GetDefaultInputDevice()
                                                                : Pa_GetDefaultOutputDevice();
        return idx == paNoDevice ? -1 : idx;
    }

    Result<std::unique_ptr<IInputStream>> open_input(const DeviceHandle& device, const AudioFormat& format) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return make_error(ErrorType::InvalidState, "PortAudio not initialized");
        }

        PaDeviceIndex idx = stream_device(device);
        if (idx == paNoDevice) {
            return make_device_error("No input device available");
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(idx);
        if (!info) {
            return make_device_error("Input device index " + std::to_string(idx) + " is not valid");
        }
        if (info->maxInputChannels <= 0) {
            return make_device_error(std::string("Device '") + info->name + "' has no input channels");
        }

        int device_channels = std::min(format.channels, info->maxInputChannels);

        PaStreamParameters input_params;
        std::memset(&input_params, 0, sizeof(input_params));
        input_params.device = idx;
        input_params.channelCount = device_channels;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        PaStream* stream = nullptr;
        PaError err = Pa_OpenStream(&stream, &input_params, nullptr, format.sample_rate,
                                    static_cast<unsigned long>(format.frames_per_chunk),
                                    paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            return make_device_error(pa_error(std::string("Failed to open input stream on '") + info->name + "'", err));
        }
        err = Pa_StartStream(stream);
        if (err != paNoError) {
            Pa_CloseStream(stream);
            return make_device_error(pa_error("Failed to start input stream", err));
        }

        std::ostringstream oss;
        oss << "Input stream open: [" << idx << "] " << info->name << " "
            << format.sample_rate << " Hz, " << device_channels << " ch";
        if (device_channels != format.channels) {
            oss << " (widened to " << format.channels << ")";
        }
        LOG_DEVICE(oss.str());

        std::unique_ptr<IInputStream> input =
            std::make_unique<PortAudioInputStream>(stream, mutex_, format, device_channels);
        return Result<std::unique_ptr<IInputStream>>(std::move(input));
    }

    Result<void> play(const DeviceHandle& device, const PcmBlock& block, int sample_rate) {
        PaStream* stream = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!initialized_) {
                return make_error(ErrorType::InvalidState, "PortAudio not initialized");
            }
            PaDeviceIndex idx = stream_device(device);
            if (idx == paNoDevice) {
                return make_device_error("No output device available");
            }
            const PaDeviceInfo* info = Pa_GetDeviceInfo(idx);
            if (!info) {
                return make_device_error("Output device index " + std::to_string(idx) + " is not valid");
            }

            PaStreamParameters output_params;
            std::memset(&output_params, 0, sizeof(output_params));
            output_params.device = idx;
            output_params.channelCount = block.channels;
            output_params.sampleFormat = paInt16;
            output_params.suggestedLatency = info->defaultHighOutputLatency;
            output_params.hostApiSpecificStreamInfo = nullptr;

            PaError err = Pa_OpenStream(&stream, nullptr, &output_params, sample_rate,
                                        paFramesPerBufferUnspecified, paClipOff, nullptr, nullptr);
            if (err != paNoError) {
                return make_device_error(pa_error(std::string("Failed to open output stream on '") + info->name + "'", err));
            }
            err = Pa_StartStream(stream);
            if (err != paNoError) {
                Pa_CloseStream(stream);
                return make_device_error(pa_error("Failed to start output stream", err));
            }
        }

        // Write outside the lifecycle lock so capture can open/close meanwhile
        PaError err = Pa_WriteStream(stream, block.samples.data(), static_cast<unsigned long>(block.frame_count()));
        Result<void> result;
        if (err != paNoError && err != paOutputUnderflowed) {
            result = make_device_error(pa_error("Pa_WriteStream failed", err));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        // Pa_StopStream returns once buffered output has played
        Pa_StopStream(stream);
        Pa_CloseStream(stream);
        return result;
    }

private:
    std::mutex mutex_;
    bool initialized_;
};

PortAudioBackend::PortAudioBackend()
    : pimpl_(std::make_unique<Impl>()) {}

PortAudioBackend::~PortAudioBackend() = default;

Result<void> PortAudioBackend::initialize() {
    return pimpl_->initialize();
}

std::vector<DeviceInfo> PortAudioBackend::devices() {
    return pimpl_->devices();
}

int PortAudioBackend::default_device(DeviceDirection direction) {
    return pimpl_->default_device(direction);
}

Result<std::unique_ptr<IInputStream>> PortAudioBackend::open_input(const DeviceHandle& device,
                                                                   const AudioFormat& format) {
    return pimpl_->open_input(device, format);
}

Result<void> PortAudioBackend::play(const DeviceHandle& device, const PcmBlock& block, int sample_rate) {
    return pimpl_->play(device, block, sample_rate);
}

} // namespace call_relay
