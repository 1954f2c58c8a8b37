/**
 * Turn pipeline against scripted collaborators.
 * Asserts:
 * - A normal frame is transcribed, answered, synthesized and delivered once.
 * - Empty transcripts never reach chat, synthesis or the relay.
 * - Chat failure delivers the fallback utterance (FailedChat).
 * - Decode, transcription and synthesis failures end the turn without a reply.
 * - A closed transport (sink returns false) drops the reply.
 * - Chat metadata carries the session probe fields plus per-turn audio facts.
 * - dispatch() runs turns off-thread; queue overflow drops the oldest turn.
 *
 * Run from build dir: ./test_turn_pipeline
 */

#include "turn_pipeline.h"
#include "utils.h"
#include "test_support.h"
#include <atomic>
#include <vector>

using namespace call_relay;
using namespace test_support;

namespace {

AudioFormat stereo_48k() {
    AudioFormat f;
    f.sample_rate = 48000;
    f.channels = 2;
    return f;
}

std::string frame_b64(size_t bytes = 64) {
    return utils::base64_encode(ByteBuffer(bytes, 3));
}

struct Harness {
    FakeTranscriber transcriber;
    FakeChat chat;
    FakeSynthesizer synthesizer;
    PipelineConfig config;
    std::mutex mutex;
    std::vector<ByteBuffer> delivered;
    bool sink_accepts = true;

    std::unique_ptr<TurnPipeline> make() {
        auto pipeline = std::make_unique<TurnPipeline>(transcriber, chat, synthesizer, config, stereo_48k());
        pipeline->set_reply_sink([this](const ByteBuffer& pcm) {
            std::lock_guard<std::mutex> lock(mutex);
            if (!sink_accepts) return false;
            delivered.push_back(pcm);
            return true;
        });
        return pipeline;
    }

    size_t delivered_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return delivered.size();
    }
};

} // namespace

int main() {
    // --- happy path ---
    {
        Harness h;
        auto pipeline = h.make();
        int observed = 0;
        pipeline->set_turn_observer([&observed](const TurnContext&) { observed++; });

        TurnContext turn = pipeline->process(frame_b64());
        ASSERT(turn.disposition == TurnDisposition::Delivered);
        ASSERT(turn.turn_id == 1);
        ASSERT(turn.transcript == "hello there");
        ASSERT(turn.reply_text == "you said: hello there");
        ASSERT(!turn.used_fallback);
        ASSERT(turn.audio.size() == 64);
        ASSERT(h.delivered_count() == 1);
        ASSERT(h.delivered[0].size() == turn.reply_text.size() * 4);
        ASSERT(h.transcriber.calls.load() == 1);
        ASSERT(h.chat.calls.load() == 1);
        ASSERT(h.synthesizer.calls.load() == 1);
        ASSERT(pipeline->count(TurnDisposition::Delivered) == 1);
        ASSERT(observed == 1);

        TurnContext second = pipeline->process(frame_b64());
        ASSERT(second.turn_id == 2);
    }

    // --- transcript is trimmed; blank transcripts are skipped ---
    {
        Harness h;
        h.transcriber.script = [](const ByteBuffer&) -> Result<std::string> { return std::string("   \n"); };
        auto pipeline = h.make();
        TurnContext turn = pipeline->process(frame_b64());
        ASSERT(turn.disposition == TurnDisposition::SkippedEmpty);
        ASSERT(h.chat.calls.load() == 0);
        ASSERT(h.synthesizer.calls.load() == 0);
        ASSERT(h.delivered_count() == 0);
        ASSERT(pipeline->count(TurnDisposition::SkippedEmpty) == 1);

        h.transcriber.script = [](const ByteBuffer&) -> Result<std::string> { return std::string("  hi  "); };
        TurnContext spoken = pipeline->process(frame_b64());
        ASSERT(spoken.transcript == "hi");
        ASSERT(spoken.disposition == TurnDisposition::Delivered);
    }

    // --- chat failure falls back ---
    {
        Harness h;
        h.config.fallback_utterance = "Sorry, say again?";
        h.chat.script = [](const std::string&) -> Result<std::string> {
            return make_error(ErrorType::Unreachable, "POST /api/chat: connection refused");
        };
        auto pipeline = h.make();
        TurnContext turn = pipeline->process(frame_b64());
        ASSERT(turn.disposition == TurnDisposition::FailedChat);
        ASSERT(turn.used_fallback);
        ASSERT(turn.reply_text == "Sorry, say again?");
        ASSERT(h.delivered_count() == 1);
        std::lock_guard<std::mutex> lock(h.synthesizer.mutex);
        ASSERT(h.synthesizer.texts.size() == 1);
        ASSERT(h.synthesizer.texts[0] == "Sorry, say again?");
    }

    // --- chat that throws behaves like a failure ---
    {
        Harness h;
        h.chat.script = [](const std::string&) -> Result<std::string> { throw std::runtime_error("boom"); };
        auto pipeline = h.make();
        ASSERT(pipeline->process(frame_b64()).disposition == TurnDisposition::FailedChat);
    }

    // --- undecodable or empty frames ---
    {
        Harness h;
        auto pipeline = h.make();
        ASSERT(pipeline->process("not*base64").disposition == TurnDisposition::FailedDecode);
        ASSERT(pipeline->process("").disposition == TurnDisposition::FailedDecode);
        ASSERT(h.transcriber.calls.load() == 0);
        ASSERT(pipeline->count(TurnDisposition::FailedDecode) == 2);
    }

    // --- transcription failure ---
    {
        Harness h;
        h.transcriber.script = [](const ByteBuffer&) -> Result<std::string> {
            return make_error(ErrorType::BadResponse, "Transcription request failed (500): oops");
        };
        auto pipeline = h.make();
        ASSERT(pipeline->process(frame_b64()).disposition == TurnDisposition::FailedTranscribe);
        ASSERT(h.chat.calls.load() == 0);

        h.transcriber.script = [](const ByteBuffer&) -> Result<std::string> { throw std::runtime_error("crash"); };
        ASSERT(pipeline->process(frame_b64()).disposition == TurnDisposition::FailedTranscribe);
        ASSERT(h.delivered_count() == 0);
    }

    // --- synthesis failure ---
    {
        Harness h;
        h.synthesizer.fail = true;
        auto pipeline = h.make();
        TurnContext turn = pipeline->process(frame_b64());
        ASSERT(turn.disposition == TurnDisposition::FailedSynthesize);
        ASSERT(turn.reply_audio.empty());
        ASSERT(h.delivered_count() == 0);
    }

    // --- transport closed before delivery ---
    {
        Harness h;
        h.sink_accepts = false;
        auto pipeline = h.make();
        ASSERT(pipeline->process(frame_b64()).disposition == TurnDisposition::Dropped);
        ASSERT(h.synthesizer.calls.load() == 1);

        TurnPipeline unwired(h.transcriber, h.chat, h.synthesizer, h.config, stereo_48k());
        ASSERT(unwired.process(frame_b64()).disposition == TurnDisposition::Dropped);
    }

    // --- chat metadata ---
    {
        Harness h;
        auto pipeline = h.make();
        pipeline->set_session_probe([] {
            ChatMetadata m;
            m.source = "call";
            m.call_active = true;
            m.call_id = "call-7";
            return m;
        });
        TurnContext turn = pipeline->process(frame_b64(128));
        std::lock_guard<std::mutex> lock(h.chat.mutex);
        const ChatMetadata& m = h.chat.last_metadata;
        ASSERT(m.source == "call");
        ASSERT(m.call_active);
        ASSERT(m.call_id == "call-7");
        ASSERT(m.audio_bytes == 128);
        ASSERT(m.sample_rate == 48000);
        ASSERT(m.channels == 2);
        ASSERT(m.turn_id == turn.turn_id);
    }

    // --- dispatch runs off-thread ---
    {
        Harness h;
        auto pipeline = h.make();
        for (int i = 0; i < 4; ++i) {
            ASSERT(pipeline->dispatch(frame_b64()));
        }
        ASSERT(pipeline->wait_idle(2000));
        ASSERT(pipeline->turns_dispatched() == 4);
        ASSERT(pipeline->count(TurnDisposition::Delivered) == 4);
        ASSERT(h.delivered_count() == 4);
        ASSERT(pipeline->pending() == 0);

        pipeline->shutdown();
        ASSERT(!pipeline->dispatch(frame_b64()));
        ASSERT(pipeline->turns_dispatched() == 4);
    }

    // --- queue overflow drops the oldest pending turn ---
    {
        Harness h;
        h.config.max_concurrent_turns = 1;
        h.config.max_queued_turns = 2;
        std::atomic<bool> release{false};
        h.transcriber.script = [&release](const ByteBuffer&) -> Result<std::string> {
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return std::string("queued words");
        };
        auto pipeline = h.make();

        ASSERT(pipeline->dispatch(frame_b64()));
        ASSERT(wait_until([&] { return h.transcriber.calls.load() == 1; }));  // worker busy
        for (int i = 0; i < 4; ++i) {
            ASSERT(pipeline->dispatch(frame_b64()));
        }
        ASSERT(pipeline->count(TurnDisposition::Dropped) == 2);

        release = true;
        ASSERT(pipeline->wait_idle(2000));
        ASSERT(pipeline->turns_dispatched() == 5);
        ASSERT(pipeline->count(TurnDisposition::Delivered) == 3);
        ASSERT(h.delivered_count() == 3);
    }

    // --- shutdown finishes queued turns ---
    {
        Harness h;
        h.synthesizer.delay_ms = 20;
        auto pipeline = h.make();
        for (int i = 0; i < 3; ++i) {
            ASSERT(pipeline->dispatch(frame_b64()));
        }
        pipeline->shutdown();
        ASSERT(pipeline->pending() == 0);
        ASSERT(h.delivered_count() == 3);
    }

    return report("turn pipeline");
}
