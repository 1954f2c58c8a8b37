#include "audio_endpoint.h"
#include "audio_server.h"
#include "capture_engine.h"
#include "config.h"
#include "device_registry.h"
#include "logger.h"
#include "path_utils.h"
#include "playback_engine.h"
#include "portaudio_backend.h"
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

    bool list_devices = false;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            list_devices = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [--list-devices] [config.json]" << std::endl;
            return 0;
        } else {
            config_path = expand_path(arg);
        }
    }
    if (config_path.empty()) {
        config_path = default_config_path();
    }

    Config config = Config::load_from_file(config_path);
    config.apply_environment();
    Logger::reconfigure(parse_log_level(config.logging.level), expand_path(config.logging.file));

    PortAudioBackend backend;
    Result<void> init = backend.initialize();
    if (!init) {
        Logger::error(init.error().describe());
        Logger::shutdown();
        return 1;
    }

    DeviceRegistry registry(backend);
    if (list_devices) {
        registry.log_devices();
        Logger::shutdown();
        return 0;
    }

    const AudioFormat format = config.audio.format();
    DeviceHandle input = registry.resolve(config.audio.input_device, DeviceDirection::Input);
    DeviceHandle output = registry.resolve(config.audio.output_device, DeviceDirection::Output);

    CaptureEngine capture(backend, input, format,
                          config.audio.stop_join_timeout_ms, config.audio.device_open_timeout_ms);
    PlaybackEngine playback(backend, output, format);
    AudioEndpoint endpoint(capture, playback);
    AudioServer server(config.audio_server, endpoint, registry, config.relay.max_message_bytes);

    Result<void> started = server.start();
    if (!started) {
        Logger::error("Audio server failed to start: " + started.error().describe());
        Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::info("Audio endpoint ready (" + std::to_string(format.sample_rate) + " Hz, " +
                 std::to_string(format.channels) + " ch, " + std::to_string(format.frames_per_chunk) +
                 " frames/chunk)");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Shutting down...");
    server.stop();
    capture.stop();
    playback.shutdown();

    Logger::info("Frames relayed: " + std::to_string(endpoint.frames_relayed()) +
                 ", unsent: " + std::to_string(endpoint.frames_unsent()) +
                 ", replies played: " + std::to_string(playback.buffers_played()));

    Logger::shutdown();
    return 0;
}
