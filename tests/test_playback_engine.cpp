/**
 * Playback reshaping and queueing.
 * Asserts:
 * - Empty buffers and partial frames are rejected.
 * - Stream layout is kept when the device has enough channels.
 * - Down-mixing averages channels that fold onto the same output channel.
 * - enqueue() renders on the playback thread in order; nothing after shutdown.
 *
 * Run from build dir: ./test_playback_engine
 */

#include "playback_engine.h"
#include "test_support.h"

using namespace call_relay;
using namespace test_support;

namespace {

void put_sample(ByteBuffer& bytes, int16_t value) {
    uint16_t raw = static_cast<uint16_t>(value);
    bytes.push_back(static_cast<uint8_t>(raw & 0xFF));
    bytes.push_back(static_cast<uint8_t>(raw >> 8));
}

AudioFormat stereo() {
    AudioFormat f;
    f.sample_rate = 48000;
    f.channels = 2;
    return f;
}

DeviceHandle output_device(int channels) {
    DeviceHandle h;
    h.info = make_device(1, "Speakers", 0, channels);
    h.direction = DeviceDirection::Output;
    return h;
}

} // namespace

int main() {
    // --- rejects malformed buffers ---
    {
        auto empty = reshape_interleaved(ByteBuffer(), stereo(), 2);
        ASSERT(!empty);
        ASSERT(empty.error().type == ErrorType::EmptyPayload);

        ByteBuffer partial(6, 0);  // 1.5 stereo frames
        auto odd = reshape_interleaved(partial, stereo(), 2);
        ASSERT(!odd);
        ASSERT(odd.error().type == ErrorType::ProtocolError);
    }

    // --- keeps layout when the device can take it ---
    {
        ByteBuffer bytes;
        put_sample(bytes, 100);
        put_sample(bytes, -200);
        put_sample(bytes, 300);
        put_sample(bytes, -32768);

        auto block = reshape_interleaved(bytes, stereo(), 2);
        ASSERT(block);
        ASSERT(block.value().channels == 2);
        ASSERT(block.value().frame_count() == 2);
        ASSERT(block.value().samples[1] == -200);
        ASSERT(block.value().samples[3] == -32768);

        auto unknown = reshape_interleaved(bytes, stereo(), 0);
        ASSERT(unknown);
        ASSERT(unknown.value().channels == 2);

        auto wider = reshape_interleaved(bytes, stereo(), 8);
        ASSERT(wider);
        ASSERT(wider.value().channels == 2);
    }

    // --- down-mix to mono averages ---
    {
        ByteBuffer bytes;
        put_sample(bytes, 1000);
        put_sample(bytes, 3000);
        put_sample(bytes, -400);
        put_sample(bytes, 400);

        auto mono = reshape_interleaved(bytes, stereo(), 1);
        ASSERT(mono);
        ASSERT(mono.value().channels == 1);
        ASSERT(mono.value().samples.size() == 2);
        ASSERT(mono.value().samples[0] == 2000);
        ASSERT(mono.value().samples[1] == 0);
    }

    // --- four channels onto two: k averages j where j % 2 == k ---
    {
        AudioFormat quad = stereo();
        quad.channels = 4;
        ByteBuffer bytes;
        put_sample(bytes, 10);
        put_sample(bytes, 20);
        put_sample(bytes, 30);
        put_sample(bytes, 40);

        auto folded = reshape_interleaved(bytes, quad, 2);
        ASSERT(folded);
        ASSERT(folded.value().channels == 2);
        ASSERT(folded.value().samples.size() == 2);
        ASSERT(folded.value().samples[0] == 20);
        ASSERT(folded.value().samples[1] == 30);
    }

    // --- mono stream stays mono ---
    {
        AudioFormat mono = stereo();
        mono.channels = 1;
        ByteBuffer bytes;
        put_sample(bytes, 7);
        auto block = reshape_interleaved(bytes, mono, 2);
        ASSERT(block);
        ASSERT(block.value().channels == 1);
        ASSERT(block.value().samples[0] == 7);
    }

    // --- engine: play, enqueue, shutdown ---
    {
        FakeAudioBackend backend;
        PlaybackEngine engine(backend, output_device(1), stereo());

        ByteBuffer frame;
        put_sample(frame, 50);
        put_sample(frame, 150);

        ASSERT(engine.play(frame));
        ASSERT(!engine.play(ByteBuffer()));
        ASSERT(!engine.play(ByteBuffer(3, 0)));
        ASSERT(engine.buffers_played() == 1);
        {
            std::lock_guard<std::mutex> lock(backend.mutex);
            ASSERT(backend.played.size() == 1);
            ASSERT(backend.played[0].channels == 1);
            ASSERT(backend.played[0].samples[0] == 100);
        }

        for (int i = 0; i < 5; ++i) {
            ByteBuffer buf;
            put_sample(buf, static_cast<int16_t>(i));
            put_sample(buf, static_cast<int16_t>(i));
            ASSERT(engine.enqueue(buf));
        }
        ASSERT(!engine.enqueue(ByteBuffer(2, 0)));
        ASSERT(wait_until([&] { return backend.played_count() == 6; }));
        ASSERT(engine.pending() == 0);
        {
            std::lock_guard<std::mutex> lock(backend.mutex);
            for (int i = 0; i < 5; ++i) {
                ASSERT(backend.played[1 + i].samples[0] == i);
            }
        }

        engine.shutdown();
        ASSERT(!engine.enqueue(frame));
        engine.shutdown();
        ASSERT(engine.buffers_played() == 6);
    }

    return report("playback engine");
}
