#include "logger.h"
#include "utils.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace call_relay {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

/// "[LEVEL] 2026-01-31 12:00:00.123: message"
std::string stamp_line(LogLevel level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream line;
    line << '[' << level_tag(level) << "] "
         << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setfill('0') << std::setw(3) << millis
         << ": " << message;
    return line.str();
}

void write_console(LogLevel level, const std::string& line) {
    std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
    out << line << '\n';
    out.flush();
}

// Serializes console output before initialize() or after shutdown()
std::mutex& bare_console_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    const std::string key = utils::normalize_copy(utils::trim_copy(name));
    if (key == "debug") return LogLevel::DEBUG;
    if (key == "info") return LogLevel::INFO;
    if (key == "warn" || key == "warning") return LogLevel::WARN;
    if (key == "error") return LogLevel::ERROR;
    return fallback;
}

class Logger::Impl {
public:
    Impl(LogLevel threshold, const std::string& path) : threshold_(threshold) {
        attach_file(path);
    }

    void write(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) return;
        const std::string line = stamp_line(level, message);
        write_console(level, line);
        if (file_) {
            *file_ << line << '\n';
            file_->flush();
        }
    }

    void reconfigure(LogLevel threshold, const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = threshold;
        if (path != path_) attach_file(path);
    }

    void set_threshold(LogLevel threshold) {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = threshold;
    }

    LogLevel threshold() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return threshold_;
    }

private:
    void attach_file(const std::string& path) {
        file_.reset();
        path_ = path;
        if (path.empty()) return;
        auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
        if (!stream->is_open()) {
            write_console(LogLevel::WARN, stamp_line(LogLevel::WARN, "Cannot open log file " + path));
            return;
        }
        file_ = std::move(stream);
    }

    mutable std::mutex mutex_;
    LogLevel threshold_;
    std::string path_;
    std::unique_ptr<std::ofstream> file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) impl_ = std::make_unique<Impl>(min_level, output_file);
}

void Logger::reconfigure(LogLevel min_level, const std::string& output_file) {
    if (impl_) {
        impl_->reconfigure(min_level, output_file);
    } else {
        initialize(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->write(level, message);
        return;
    }
    if (level < LogLevel::INFO) return;
    std::lock_guard<std::mutex> lock(bare_console_mutex());
    write_console(level, std::string("[") + level_tag(level) + "] " + message);
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

void Logger::set_level(LogLevel level) {
    if (impl_) impl_->set_threshold(level);
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->threshold() : LogLevel::INFO;
}

} // namespace call_relay
