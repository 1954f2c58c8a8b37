#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "speech_client.h"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace call_relay {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " [--base-url URL] [--timeout SECONDS] transcribe FILE [--language LANG]\n"
              << "  " << prog << " [--base-url URL] [--timeout SECONDS] synthesize TEXT"
              << " [--voice ID] [--audio-format FMT] [-o FILE]\n"
              << "\nDefaults come from AUDIO_SERVICE_URL and AUDIO_CLIENT_TIMEOUT." << std::endl;
}

struct CliOptions {
    std::string command;
    std::string argument;
    std::string output;
};

/// Returns false (after printing why) on bad usage
bool parse_args(int argc, char* argv[], SpeechConfig& speech, CliOptions& opts) {
    auto need_value = [&](int& i, const std::string& flag, std::string& out) {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << flag << " requires a value" << std::endl;
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (arg == "--base-url") {
            if (!need_value(i, arg, value)) return false;
            speech.base_url = value;
        } else if (arg == "--timeout") {
            if (!need_value(i, arg, value)) return false;
            try {
                double seconds = std::stod(value);
                if (seconds <= 0) throw std::invalid_argument("non-positive");
                speech.timeout_ms = static_cast<int>(seconds * 1000.0);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --timeout '" << value << "'" << std::endl;
                return false;
            }
        } else if (arg == "--language") {
            if (!need_value(i, arg, value)) return false;
            speech.language = value;
        } else if (arg == "--voice") {
            if (!need_value(i, arg, value)) return false;
            speech.voice = value;
        } else if (arg == "--audio-format") {
            if (!need_value(i, arg, value)) return false;
            speech.audio_format = value;
        } else if (arg == "-o" || arg == "--output") {
            if (!need_value(i, arg, value)) return false;
            opts.output = expand_path(value);
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else if (opts.argument.empty()) {
            opts.argument = arg;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            return false;
        }
    }

    if (opts.command != "transcribe" && opts.command != "synthesize") {
        if (!opts.command.empty()) {
            std::cerr << "Error: unknown command '" << opts.command << "'" << std::endl;
        }
        return false;
    }
    if (opts.argument.empty()) {
        std::cerr << "Error: " << opts.command << " needs "
                  << (opts.command == "transcribe" ? "a FILE" : "TEXT") << std::endl;
        return false;
    }
    return true;
}

int run_transcribe(HttpSpeechClient& client, const CliOptions& opts) {
    std::string path = expand_path(opts.argument);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: Audio file does not exist: " << path << std::endl;
        return kExitError;
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::string filename = path;
    std::string::size_type slash = filename.find_last_of('/');
    if (slash != std::string::npos) filename = filename.substr(slash + 1);

    auto transcript = client.transcribe_upload(bytes, filename);
    if (!transcript) {
        std::cerr << "Error: " << transcript.error().describe() << std::endl;
        return kExitError;
    }
    if (transcript.value().empty()) {
        std::cerr << "Error: Transcription response missing 'text' field" << std::endl;
        return kExitError;
    }
    std::cout << transcript.value() << std::endl;
    return kExitOk;
}

int run_synthesize(HttpSpeechClient& client, const CliOptions& opts) {
    auto audio = client.synthesize(opts.argument);
    if (!audio) {
        std::cerr << "Error: " << audio.error().describe() << std::endl;
        return kExitError;
    }

    const SynthesizedAudio& result = audio.value();
    if (!opts.output.empty()) {
        std::ofstream out(opts.output, std::ios::binary);
        if (!out.is_open()) {
            std::cerr << "Error: cannot write " << opts.output << std::endl;
            return kExitError;
        }
        out.write(reinterpret_cast<const char*>(result.bytes.data()),
                  static_cast<std::streamsize>(result.bytes.size()));
        std::cout << "Saved audio (" << result.content_type << ") to " << opts.output << std::endl;
    } else {
        // Raw bytes on stdout for piping
        std::cout.write(reinterpret_cast<const char*>(result.bytes.data()),
                        static_cast<std::streamsize>(result.bytes.size()));
        std::cout.flush();
    }
    return kExitOk;
}

} // namespace

} // namespace call_relay

int main(int argc, char* argv[]) {
    using namespace call_relay;

    // stdout carries results (or raw audio); keep log lines off it
    Logger::initialize(LogLevel::WARN);

    Config config;
    config.apply_environment();
    // Only sent when asked for; the service picks its own default
    config.speech.audio_format.clear();

    CliOptions opts;
    if (!parse_args(argc, argv, config.speech, opts)) {
        print_usage(argv[0]);
        Logger::shutdown();
        return kExitUsage;
    }

    auto base = normalize_base_url(config.speech.base_url);
    if (!base) {
        std::cerr << "Error: " << base.error().message << std::endl;
        Logger::shutdown();
        return kExitError;
    }
    config.speech.base_url = base.value();

    HttpSpeechClient client(config.speech);
    int rc = opts.command == "transcribe" ? run_transcribe(client, opts) : run_synthesize(client, opts);
    Logger::shutdown();
    return rc;
}
