#include "call_server.h"
#include "call_state_machine.h"
#include "chat_client.h"
#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "speech_client.h"
#include "turn_pipeline.h"
#include "websocket_relay_client.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace call_relay {

static std::atomic<bool> g_running(true);

void signal_handler(int) {
    g_running = false;
}

} // namespace call_relay

int main(int argc, char* argv[]) {
    using namespace call_relay;

    Logger::initialize(LogLevel::INFO);

    std::string config_path;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [config.json]" << std::endl;
            return 0;
        }
        config_path = expand_path(arg);
    } else {
        config_path = default_config_path();
    }

    Config config = Config::load_from_file(config_path);
    config.apply_environment();
    Logger::reconfigure(parse_log_level(config.logging.level), expand_path(config.logging.file));

    HttpChatClient chat(config.chat);
    HttpSpeechClient speech(config.speech);

    auto transport = std::make_unique<WebSocketRelayClient>(config.relay);
    CallStateMachine machine(*transport, config.relay.ack_timeout_ms);
    TurnPipeline pipeline(speech, chat, speech, config.pipeline, config.audio.format());

    const std::string source = config.chat.source;
    pipeline.set_session_probe([&machine, source]() { return machine.chat_metadata(source); });
    pipeline.set_reply_sink([&machine](const ByteBuffer& pcm) { return machine.deliver_reply(pcm); });
    machine.set_frame_handler([&pipeline](std::string base64_audio) {
        pipeline.dispatch(std::move(base64_audio));
    });

    CallServer server(config.call_server, machine);
    Result<void> started = server.start();
    if (!started) {
        Logger::error("Call server failed to start: " + started.error().describe());
        machine.detach();
        Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::info("Coordinator ready; audio endpoint at ws://" + config.relay.host + ":" +
                 std::to_string(config.relay.port) + config.relay.path);

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Shutting down...");
    server.stop();

    Result<void> ended = machine.end_call();
    if (!ended) {
        Logger::warn("end_call during shutdown: " + ended.error().describe());
    }
    pipeline.shutdown();

    CallSession session = machine.status();
    Logger::info("Frames received: " + std::to_string(session.frames_sent) +
                 ", turns: " + std::to_string(session.turns_dispatched) +
                 ", replies: " + std::to_string(session.replies_delivered) +
                 ", fallbacks: " + std::to_string(pipeline.count(TurnDisposition::FailedChat)) +
                 ", dropped: " + std::to_string(pipeline.count(TurnDisposition::Dropped)));

    // Handlers off first, then join the relay io thread
    machine.detach();
    transport.reset();

    Logger::shutdown();
    return 0;
}
