#include "progress.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <exception>
#include <utility>

void notify_progress(ProgressSink* sink, uint64_t bytes_processed, uint64_t frames_processed,
                     const std::string& message) {
    if (!sink) return;
    try {
        sink->notify(bytes_processed, frames_processed, message);
    } catch (const std::exception& e) {
        LOG_WARN("PROGRESS", "Progress sink failed (ignored): " << e.what());
    }
}

void CancellationToken::throwIfCancelled(const char* stage) const {
    if (cancelled()) throw CancelledError(std::string("Operation cancelled during ") + stage);
}

AsyncProgressRelay::AsyncProgressRelay(ProgressSink& target) : target_(target) {
    worker_ = std::thread([this]() { run(); });
}

AsyncProgressRelay::~AsyncProgressRelay() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable()) worker_.join();
}

void AsyncProgressRelay::notify(uint64_t bytes_processed, uint64_t frames_processed, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (has_pending_) ++superseded_;
        pending_.bytes = bytes_processed;
        pending_.frames = frames_processed;
        pending_.message = message;
        has_pending_ = true;
    }
    cv_.notify_one();
}

void AsyncProgressRelay::run() {
    while (true) {
        Update update;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return has_pending_ || stop_; });
            if (!has_pending_) return;   // stopping and nothing left
            update = std::move(pending_);
            has_pending_ = false;
        }
        notify_progress(&target_, update.bytes, update.frames, update.message);
        ++delivered_;
    }
}
