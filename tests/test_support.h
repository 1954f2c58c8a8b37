/**
 * Shared fakes for the test executables: an in-memory audio backend, a relay
 * transport that records what is sent, and scripted speech/chat collaborators.
 * Nothing here touches audio hardware or the network.
 */

#pragma once

#include "audio_backend.h"
#include "chat_client.h"
#include "relay_transport.h"
#include "speech_client.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace test_support {

using namespace call_relay;

/// Poll `pred` until it holds or `timeout_ms` passes
inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline int report(const char* suite) {
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All " << suite << " tests passed.\n";
    return 0;
}

inline DeviceInfo make_device(int index, const std::string& name, int in_ch, int out_ch) {
    DeviceInfo d;
    d.index = index;
    d.name = name;
    d.max_input_channels = in_ch;
    d.max_output_channels = out_ch;
    d.default_sample_rate = 48000.0;
    return d;
}

/**
 * In-memory audio backend. Input streams produce counting chunks every
 * `chunk_period_ms`; a stream can be told to fail after N reads.
 */
class FakeAudioBackend : public IAudioBackend {
public:
    std::vector<DeviceInfo> device_list;
    int default_input = -1;
    int default_output = -1;

    bool fail_open = false;
    int open_delay_ms = 0;
    int chunk_period_ms = 2;
    int fail_after_reads = -1;   ///< -1 = never
    int read_block_ms = 0;       ///< Extra time each read blocks (slow device)

    std::atomic<int> opens{0};
    std::atomic<int> live_streams{0};
    std::atomic<int> max_live_streams{0};

    std::vector<DeviceHandle> opened_devices;
    std::vector<PcmBlock> played;
    std::mutex mutex;

    std::vector<DeviceInfo> devices() override {
        return device_list;
    }

    int default_device(DeviceDirection direction) override {
        return direction == DeviceDirection::Input ? default_input : default_output;
    }

    Result<std::unique_ptr<IInputStream>> open_input(const DeviceHandle& device,
                                                     const AudioFormat& format) override {
        if (open_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(open_delay_ms));
        }
        opens++;
        if (fail_open) {
            return make_device_error("cannot open input device " + std::to_string(device.index()));
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            opened_devices.push_back(device);
        }
        std::unique_ptr<IInputStream> stream(new Stream(*this, format));
        return Result<std::unique_ptr<IInputStream>>(std::move(stream));
    }

    Result<void> play(const DeviceHandle&, const PcmBlock& block, int) override {
        std::lock_guard<std::mutex> lock(mutex);
        played.push_back(block);
        return Result<void>();
    }

    size_t played_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return played.size();
    }

private:
    class Stream : public IInputStream {
    public:
        Stream(FakeAudioBackend& owner, const AudioFormat& format) : owner_(owner), format_(format) {
            int live = ++owner_.live_streams;
            int seen = owner_.max_live_streams.load();
            while (live > seen && !owner_.max_live_streams.compare_exchange_weak(seen, live)) {
            }
        }

        ~Stream() override {
            owner_.live_streams--;
        }

        Result<void> read(ByteBuffer& out) override {
            int delay = owner_.chunk_period_ms + owner_.read_block_ms;
            if (delay > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }
            if (owner_.fail_after_reads >= 0 && reads_ >= owner_.fail_after_reads) {
                return make_device_error("device unplugged");
            }
            ++reads_;
            out.assign(format_.bytes_per_chunk(), static_cast<uint8_t>(reads_ & 0xFF));
            return Result<void>();
        }

    private:
        FakeAudioBackend& owner_;
        AudioFormat format_;
        int reads_ = 0;
    };
};

/**
 * Relay transport double. `responder` sees every sent event and may answer
 * through emit(); emit() and close() invoke the installed handlers directly.
 */
class FakeTransport : public IRelayTransport {
public:
    bool fail_connect = false;
    bool fail_send = false;
    std::function<void(FakeTransport&, const RelayEvent&)> responder;

    std::atomic<int> connects{0};

    Result<void> connect() override {
        if (connected_.load()) {
            return Result<void>();
        }
        connects++;
        if (fail_connect) {
            return make_transport_error("connection refused");
        }
        connected_ = true;
        return Result<void>();
    }

    void disconnect() override {
        close("disconnected locally");
    }

    Result<void> send(const RelayEvent& event) override {
        if (!connected_.load() || fail_send) {
            return make_transport_error(std::string("not connected; dropped ") + event_tag(event.type));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(event);
        }
        if (responder) {
            responder(*this, event);
        }
        return Result<void>();
    }

    bool is_connected() const override {
        return connected_.load();
    }

    void set_event_handler(EventHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_event_ = std::move(handler);
    }

    void set_close_handler(CloseHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_close_ = std::move(handler);
    }

    void emit(const RelayEvent& event) {
        EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = on_event_;
        }
        if (handler) handler(event);
    }

    void close(const std::string& reason) {
        if (!connected_.exchange(false)) {
            return;
        }
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = on_close_;
        }
        if (handler) handler(reason);
    }

    size_t count_sent(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : sent_) {
            if (e.type == type) ++n;
        }
        return n;
    }

    std::vector<RelayEvent> sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    bool has_handlers() {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(on_event_) && static_cast<bool>(on_close_);
    }

private:
    std::atomic<bool> connected_{false};
    std::mutex mutex_;
    std::vector<RelayEvent> sent_;
    EventHandler on_event_;
    CloseHandler on_close_;
};

/// Answers start/stop commands the way the audio endpoint does
inline void acknowledge_commands(FakeTransport& t, const RelayEvent& e) {
    if (e.type == EventType::StartRecording) {
        t.emit(RelayEvent::with_status(EventType::RecordingStarted, "recording_started"));
    } else if (e.type == EventType::StopRecording) {
        t.emit(RelayEvent::with_status(EventType::RecordingStopped, "recording_stopped"));
    }
}

class FakeTranscriber : public ITranscriber {
public:
    std::function<Result<std::string>(const ByteBuffer&)> script =
        [](const ByteBuffer&) -> Result<std::string> { return std::string("hello there"); };
    std::atomic<int> calls{0};

    Result<std::string> transcribe(const ByteBuffer& pcm, const AudioFormat&) override {
        calls++;
        if (pcm.empty()) {
            return make_error(ErrorType::EmptyPayload, "no audio to transcribe");
        }
        return script(pcm);
    }
};

class FakeChat : public IChatBackend {
public:
    std::function<Result<std::string>(const std::string&)> script =
        [](const std::string& prompt) -> Result<std::string> { return "you said: " + prompt; };
    std::atomic<int> calls{0};
    ChatMetadata last_metadata;
    std::mutex mutex;

    Result<std::string> reply(const std::string& prompt, const ChatMetadata& metadata) override {
        calls++;
        {
            std::lock_guard<std::mutex> lock(mutex);
            last_metadata = metadata;
        }
        return script(prompt);
    }
};

class FakeSynthesizer : public ISynthesizer {
public:
    bool fail = false;
    int delay_ms = 0;
    std::atomic<int> calls{0};
    std::vector<std::string> texts;
    std::mutex mutex;

    Result<SynthesizedAudio> synthesize(const std::string& text) override {
        calls++;
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            texts.push_back(text);
        }
        if (text.empty()) {
            return make_error(ErrorType::EmptyPayload, "Text to synthesize must not be empty");
        }
        if (fail) {
            return make_error(ErrorType::Unreachable, "POST /synthesize: timed out");
        }
        SynthesizedAudio audio;
        audio.bytes.assign(text.size() * 4, 0x11);  // whole 16-bit stereo frames
        audio.content_type = "audio/L16";
        return audio;
    }
};

} // namespace test_support
