#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

// Receives job progress. Called from the job's thread, inside the hot loop.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void notify(uint64_t bytes_processed, uint64_t frames_processed, const std::string& message) = 0;
};

// Forwards to sink (if any). A sink that throws std::exception is logged and
// ignored, it never fails the job.
void notify_progress(ProgressSink* sink, uint64_t bytes_processed, uint64_t frames_processed,
                     const std::string& message);

class CancellationToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

    // Throws CancelledError naming the stage that noticed it
    void throwIfCancelled(const char* stage) const;

private:
    std::atomic<bool> flag_{false};
};

// Hands notifications to a slow sink on a thread of its own. Only the most
// recent update is kept, so notify() never waits for the target.
class AsyncProgressRelay : public ProgressSink {
public:
    explicit AsyncProgressRelay(ProgressSink& target);
    // Delivers the last pending update, then joins
    ~AsyncProgressRelay() override;

    AsyncProgressRelay(const AsyncProgressRelay&) = delete;
    AsyncProgressRelay& operator=(const AsyncProgressRelay&) = delete;

    void notify(uint64_t bytes_processed, uint64_t frames_processed, const std::string& message) override;

    uint64_t delivered() const { return delivered_.load(); }
    uint64_t superseded() const { return superseded_.load(); }

private:
    struct Update {
        uint64_t bytes = 0;
        uint64_t frames = 0;
        std::string message;
    };

    void run();

    ProgressSink& target_;
    std::mutex mutex_;
    std::condition_variable cv_;
    Update pending_;
    bool has_pending_ = false;
    bool stop_ = false;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> superseded_{0};
    std::thread worker_;
};
