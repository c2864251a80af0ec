#include "frame_sequencer.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>

// ---------------------- WorkerPool ----------------------

WorkerPool::WorkerPool(size_t threads) {
    const size_t count = std::max<size_t>(1, threads);
    m_workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        m_workers.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();
    for (auto& t : m_workers) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stop || !m_tasks.empty(); });
            if (m_stop) return;
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }
        // packaged_task stores any exception in its future
        task();
    }
}

// ---------------------- FrameSequenceWriter ----------------------

FrameSequenceWriter::FrameSequenceWriter(const PatternEncoder& encoder, FFmpegEncoder& output,
                                         WorkerPool& pool, FrameCallback onFrameWritten)
    : m_encoder(encoder), m_output(output), m_pool(pool), m_onFrame(std::move(onFrameWritten)),
      m_window(2 * pool.size()) {}

FrameSequenceWriter::~FrameSequenceWriter() {
    // running renders reference the encoder; let them finish
    for (auto& p : m_pending) {
        if (p.frame.valid()) p.frame.wait();
    }
}

void FrameSequenceWriter::submit(Chunk chunk) {
    while (m_pending.size() >= m_window) writeOldest();

    const size_t bytes = chunk.payload.size();
    auto shared = std::make_shared<Chunk>(std::move(chunk));
    const PatternEncoder* encoder = &m_encoder;
    m_pending.push_back({m_pool.submit([encoder, shared]() { return encoder->render(*shared); }), bytes});
}

void FrameSequenceWriter::writeOldest() {
    Pending next = std::move(m_pending.front());
    m_pending.pop_front();

    cv::Mat frame = next.frame.get();
    m_output.encodeFrame(frame);
    if (m_onFrame) m_onFrame(m_written, next.bytes);
    ++m_written;
}

void FrameSequenceWriter::drain() {
    while (!m_pending.empty()) writeOldest();
    LOG_DEBUG("SEQUENCER", "Drained writer after " << m_written << " frames");
}

// ---------------------- FrameSequenceReader ----------------------

FrameSequenceReader::FrameSequenceReader(FFmpegDecoder& input, const FrameGeometry& geometry,
                                         std::optional<PatternStyle> style, const ErasureCoder& fec,
                                         WorkerPool& pool, uint64_t expectedFrames)
    : m_input(input), m_geometry(geometry), m_style(style), m_fec(fec), m_pool(pool),
      m_expected(expectedFrames), m_window(2 * pool.size()) {
    if (m_style) m_decoder = std::make_unique<PatternDecoder>(m_geometry, *m_style, m_fec);
}

FrameSequenceReader::~FrameSequenceReader() {
    for (auto& f : m_pending) {
        if (f.valid()) f.wait();
    }
}

void FrameSequenceReader::fill() {
    while (m_pending.size() < m_window && m_submitted < m_expected) {
        auto frame = std::make_shared<cv::Mat>();
        if (!m_input.decode(*frame)) {
            throw DecodingError("Video ended after " + std::to_string(m_submitted) + " frames, expected " +
                                std::to_string(m_expected));
        }
        if (frame->cols != m_geometry.width || frame->rows != m_geometry.height) {
            throw DecodingError("Frame " + std::to_string(m_submitted) + " is " + std::to_string(frame->cols) +
                                "x" + std::to_string(frame->rows) + ", expected " +
                                std::to_string(m_geometry.width) + "x" + std::to_string(m_geometry.height));
        }

        if (!m_decoder) {
            m_style = detect_style(*frame, m_geometry, m_fec);
            LOG_INFO("SEQUENCER", "Detected pattern style: " << pattern_style_name(*m_style));
            m_decoder = std::make_unique<PatternDecoder>(m_geometry, *m_style, m_fec);
        }

        const PatternDecoder* decoder = m_decoder.get();
        m_pending.push_back(m_pool.submit([decoder, frame]() { return decoder->decode(*frame); }));
        ++m_submitted;
    }
}

bool FrameSequenceReader::next(DecodedChunk& chunk) {
    if (m_returned >= m_expected) return false;

    fill();
    std::future<DecodedChunk> oldest = std::move(m_pending.front());
    m_pending.pop_front();
    chunk = oldest.get();

    if (chunk.repaired) {
        ++m_repaired;
        LOG_DEBUG("SEQUENCER", "Frame " << m_returned << ": rebuilt " << chunk.erased_stripes
                  << " stripe(s) from parity");
    } else if (chunk.unrecoverable) {
        ++m_damaged;
        LOG_WARN("SEQUENCER", "Frame " << m_returned << ": " << chunk.erased_stripes
                 << " unreadable stripes exceed parity, keeping best-effort bytes");
    } else if (chunk.parity_mismatch) {
        ++m_damaged;
        LOG_WARN("SEQUENCER", "Frame " << m_returned << ": parity disagrees with data");
    }

    ++m_returned;
    return true;
}
