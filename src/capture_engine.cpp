#include "capture_engine.h"
#include "logger.h"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

namespace call_relay {

class CaptureEngine::Impl {
public:
    Impl(IAudioBackend& backend, const DeviceHandle& device, const AudioFormat& format,
         int stop_join_timeout_ms, int device_open_timeout_ms)
        : backend_(backend), device_(device), format_(format),
          stop_join_timeout_ms_(stop_join_timeout_ms),
          device_open_timeout_ms_(device_open_timeout_ms),
          running_(false), frames_(0) {}

    ~Impl() {
        running_.store(false);
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        reap_worker();
    }

    void set_sink(FrameSink sink) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        sink_ = std::move(sink);
    }

    void set_error_callback(ErrorCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        error_callback_ = std::move(callback);
    }

    bool start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load()) {
            return false;
        }

        // A worker that outlived the last stop (or died on a device error) must
        // be gone before a new one exists
        if (worker_.joinable()) {
            if (!worker_done_.valid() ||
                worker_done_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
                LOG_CAPTURE("Waiting for previous capture worker to exit");
            }
            reap_worker();
        }

        std::promise<Result<void>> opened;
        std::future<Result<void>> opened_future = opened.get_future();
        std::promise<void> done;
        worker_done_ = done.get_future();

        running_.store(true);
        worker_ = std::thread(&Impl::worker_loop, this, std::move(opened), std::move(done));

        if (opened_future.wait_for(std::chrono::milliseconds(device_open_timeout_ms_)) != std::future_status::ready) {
            running_.store(false);
            Logger::error("[Capture] Device open timed out after " + std::to_string(device_open_timeout_ms_) + " ms");
            return false;
        }

        Result<void> open_result = opened_future.get();
        if (!open_result) {
            running_.store(false);
            reap_worker();
            Logger::error("[Capture] " + open_result.error().describe());
            return false;
        }

        LOG_CAPTURE("Started (" + std::to_string(format_.sample_rate) + " Hz, " +
                    std::to_string(format_.channels) + " ch, " +
                    std::to_string(format_.frames_per_chunk) + " frames/chunk)");
        return true;
    }

    bool stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!running_.exchange(false)) {
            return false;
        }

        if (std::this_thread::get_id() == worker_.get_id()) {
            // Called from the sink; the loop exits after this chunk
            return true;
        }

        if (worker_done_.valid() &&
            worker_done_.wait_for(std::chrono::milliseconds(stop_join_timeout_ms_)) == std::future_status::ready) {
            worker_.join();
            LOG_CAPTURE("Stopped after " + std::to_string(frames_.load()) + " frames");
        } else {
            Logger::warn("[Capture] Worker did not exit within " + std::to_string(stop_join_timeout_ms_) +
                         " ms; it will be joined before the next start");
        }
        return true;
    }

    bool is_running() const {
        return running_.load();
    }

    uint64_t frames_captured() const {
        return frames_.load();
    }

    const AudioFormat& format() const {
        return format_;
    }

private:
    void reap_worker() {
        if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
            worker_.join();
        }
    }

    void worker_loop(std::promise<Result<void>> opened, std::promise<void> done) {
        auto stream_result = backend_.open_input(device_, format_);
        if (!stream_result) {
            opened.set_value(stream_result.error());
            done.set_value();
            return;
        }
        std::unique_ptr<IInputStream> stream = std::move(stream_result.value());
        opened.set_value(Result<void>());

        FrameSink sink;
        ErrorCallback on_error;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            sink = sink_;
            on_error = error_callback_;
        }

        ByteBuffer chunk;
        while (running_.load()) {
            Result<void> read = stream->read(chunk);
            if (!read) {
                Logger::error("[Capture] " + read.error().describe());
                running_.store(false);
                if (on_error) {
                    on_error(read.error());
                }
                break;
            }

            uint64_t sequence = frames_.fetch_add(1);
            if (sink) {
                try {
                    sink(AudioFrame(std::move(chunk), format_, sequence));
                } catch (const std::exception& e) {
                    Logger::error("[Capture] Frame sink threw: " + std::string(e.what()));
                }
            }
            chunk = ByteBuffer();
        }

        stream.reset();
        done.set_value();
    }

    IAudioBackend& backend_;
    DeviceHandle device_;
    AudioFormat format_;
    int stop_join_timeout_ms_;
    int device_open_timeout_ms_;

    std::mutex lifecycle_mutex_;
    std::mutex callback_mutex_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> frames_;
    std::thread worker_;
    std::future<void> worker_done_;
    FrameSink sink_;
    ErrorCallback error_callback_;
};

CaptureEngine::CaptureEngine(IAudioBackend& backend,
                             const DeviceHandle& device,
                             const AudioFormat& format,
                             int stop_join_timeout_ms,
                             int device_open_timeout_ms)
    : pimpl_(std::make_unique<Impl>(backend, device, format, stop_join_timeout_ms, device_open_timeout_ms)) {}

CaptureEngine::~CaptureEngine() = default;

void CaptureEngine::set_sink(FrameSink sink) {
    pimpl_->set_sink(std::move(sink));
}

void CaptureEngine::set_error_callback(ErrorCallback callback) {
    pimpl_->set_error_callback(std::move(callback));
}

bool CaptureEngine::start() {
    return pimpl_->start();
}

bool CaptureEngine::stop() {
    return pimpl_->stop();
}

bool CaptureEngine::is_running() const {
    return pimpl_->is_running();
}

uint64_t CaptureEngine::frames_captured() const {
    return pimpl_->frames_captured();
}

const AudioFormat& CaptureEngine::format() const {
    return pimpl_->format();
}

} // namespace call_relay
