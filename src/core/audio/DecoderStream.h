#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "IDecoder.h"
#include "../MusicData.h"
#include "PlaybackError.h"
#include "StreamBuffer.h"

enum class UnderrunPolicy { Silence, RepeatLastBlock };

// One active decode: a decoder, its lookahead buffer and (in threaded
// mode) the worker that keeps the buffer topped up.
//
// read() is called from the render thread and never blocks. open(),
// seek() and close() belong to the control thread; seek() and close()
// stop the worker before touching the decoder.
class DecoderStream {
public:
    struct Options {
        int sampleRate        = 44100;
        int channels          = 2;
        int lookaheadFrames   = 88200;
        int decodeBlockFrames = 1024;
        UnderrunPolicy underrunPolicy = UnderrunPolicy::Silence;
        bool threaded         = true;  // false: decode on the caller of read()
    };

    struct ReadResult {
        int  frames = 0;         // real frames delivered
        int  padded = 0;         // frames filled by the underrun policy
        bool endOfStream = false;
        bool failed = false;
    };

    DecoderStream(TrackPtr track, quint64 entryId,
                  std::unique_ptr<IDecoder> decoder, const Options& options);
    ~DecoderStream();

    DecoderStream(const DecoderStream&) = delete;
    DecoderStream& operator=(const DecoderStream&) = delete;

    bool open(int64_t startFrame = 0, DecodeError* error = nullptr);

    // Always writes `frames` frames to out; anything beyond
    // result.frames + result.padded is silence.
    ReadResult read(float* out, int frames);

    bool seek(int64_t frame, DecodeError* error = nullptr);

    // Non-blocking; the worker exits at its next wakeup.
    void requestStop();
    void close();

    const TrackPtr& track() const { return m_track; }
    quint64 entryId() const { return m_entryId; }
    int channels() const { return m_options.channels; }

    int64_t position() const { return m_position.load(std::memory_order_acquire); }
    int64_t duration() const { return m_duration.load(std::memory_order_acquire); }
    bool hasKnownDuration() const { return duration() > 0; }
    int64_t remaining() const;

    bool isOpen() const { return m_open; }
    bool isFinished() const { return m_finished.load(std::memory_order_acquire); }
    // The decoder has delivered its last frame; some may still be buffered
    bool decoderExhausted() const
    {
        return m_decoderEof.load(std::memory_order_acquire) || isFinished();
    }
    bool hasFailed() const { return m_failed.load(std::memory_order_acquire); }
    DecodeError error() const;
    int underruns() const { return m_underruns.load(std::memory_order_relaxed); }

private:
    // Decodes one block into the buffer. Returns false once the decoder
    // is exhausted or failed.
    bool decodeBlock();
    void prefill();
    void startWorker();
    void stopWorker();
    void workerLoop();
    void recordFailure(DecodeError::Kind kind, const QString& message);
    int readInline(float* out, int frames, ReadResult& result);
    void fillUnderrun(float* out, int frames);
    void rememberTail(const float* out, int frames);

    TrackPtr m_track;
    quint64 m_entryId = 0;
    std::unique_ptr<IDecoder> m_decoder;
    Options m_options;
    bool m_open = false;

    StreamBuffer m_buffer;
    std::vector<float> m_scratch;    // worker decode block
    std::vector<float> m_lastBlock;  // for RepeatLastBlock
    int m_lastBlockFrames = 0;

    std::thread m_worker;
    std::mutex m_workerMutex;
    std::condition_variable m_workerCv;
    std::atomic<bool> m_stop{false};

    std::atomic<int64_t> m_position{0};
    std::atomic<int64_t> m_duration{0};
    std::atomic<bool> m_decoderEof{false};
    std::atomic<bool> m_finished{false};
    std::atomic<bool> m_failed{false};
    std::atomic<int> m_underruns{0};

    mutable std::mutex m_errorMutex;
    DecodeError m_error;
};
