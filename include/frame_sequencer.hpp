#ifndef PIXVAULT_FRAME_SEQUENCER_HPP
#define PIXVAULT_FRAME_SEQUENCER_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "ffmpeg_decoder.hpp"
#include "ffmpeg_encoder.h"
#include "pattern_codec.hpp"
#include "slicer.hpp"

// Fixed set of threads draining a FIFO of tasks. Queued tasks that have not
// started when the pool is destroyed are dropped.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_tasks.emplace([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return result;
    }

    size_t size() const { return m_workers.size(); }

private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stop = false;
};

// Renders chunks on the pool and hands the frames to the encoder strictly in
// submission order: frame i is always chunk i.
class FrameSequenceWriter {
public:
    using FrameCallback = std::function<void(uint64_t frame_index, size_t chunk_bytes)>;

    FrameSequenceWriter(const PatternEncoder& encoder, FFmpegEncoder& output, WorkerPool& pool,
                        FrameCallback onFrameWritten = nullptr);
    ~FrameSequenceWriter();

    FrameSequenceWriter(const FrameSequenceWriter&) = delete;
    FrameSequenceWriter& operator=(const FrameSequenceWriter&) = delete;

    // Blocks (writing the oldest frame) while the window is full
    void submit(Chunk chunk);
    // Writes every pending frame
    void drain();

    uint64_t framesWritten() const { return m_written; }
    size_t window() const { return m_window; }

private:
    struct Pending {
        std::future<cv::Mat> frame;
        size_t bytes;
    };

    void writeOldest();

    const PatternEncoder& m_encoder;
    FFmpegEncoder& m_output;
    WorkerPool& m_pool;
    FrameCallback m_onFrame;
    size_t m_window;
    std::deque<Pending> m_pending;
    uint64_t m_written = 0;
};

// Pulls frames from the decoder, reads them on the pool and returns the chunk
// bytes in frame order. Expects exactly expectedFrames frames.
class FrameSequenceReader {
public:
    FrameSequenceReader(FFmpegDecoder& input, const FrameGeometry& geometry,
                        std::optional<PatternStyle> style, const ErasureCoder& fec,
                        WorkerPool& pool, uint64_t expectedFrames);
    ~FrameSequenceReader();

    FrameSequenceReader(const FrameSequenceReader&) = delete;
    FrameSequenceReader& operator=(const FrameSequenceReader&) = delete;

    // False once expectedFrames chunks were returned. Throws DecodingError
    // when the artifact ends early or a frame has the wrong size.
    bool next(DecodedChunk& chunk);

    // Valid once the first frame has been read
    PatternStyle style() const { return m_style.value_or(PatternStyle::Rings); }
    uint64_t framesRead() const { return m_returned; }
    uint64_t repairedFrames() const { return m_repaired; }
    uint64_t damagedFrames() const { return m_damaged; }

private:
    void fill();

    FFmpegDecoder& m_input;
    FrameGeometry m_geometry;
    std::optional<PatternStyle> m_style;
    const ErasureCoder& m_fec;
    WorkerPool& m_pool;
    uint64_t m_expected;
    size_t m_window;
    std::unique_ptr<PatternDecoder> m_decoder;
    std::deque<std::future<DecodedChunk>> m_pending;
    uint64_t m_submitted = 0;
    uint64_t m_returned = 0;
    uint64_t m_repaired = 0;
    uint64_t m_damaged = 0;
};

#endif // PIXVAULT_FRAME_SEQUENCER_HPP
