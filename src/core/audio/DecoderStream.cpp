#include "DecoderStream.h"
#include <QDebug>
#include <algorithm>
#include <chrono>
#include <cstring>

DecoderStream::DecoderStream(TrackPtr track, quint64 entryId,
                             std::unique_ptr<IDecoder> decoder, const Options& options)
    : m_track(std::move(track))
    , m_entryId(entryId)
    , m_decoder(std::move(decoder))
    , m_options(options)
{
    m_options.channels = std::max(1, m_options.channels);
    m_options.decodeBlockFrames = std::max(1, m_options.decodeBlockFrames);
    m_options.lookaheadFrames = std::max(m_options.decodeBlockFrames, m_options.lookaheadFrames);

    m_scratch.resize(size_t(m_options.decodeBlockFrames) * m_options.channels);
    m_lastBlock.resize(size_t(m_options.decodeBlockFrames) * m_options.channels);
    if (m_options.threaded)
        m_buffer.resize(m_options.lookaheadFrames, m_options.channels);
}

DecoderStream::~DecoderStream()
{
    close();
}

bool DecoderStream::open(int64_t startFrame, DecodeError* error)
{
    const QString path = m_track ? m_track->filePath : QString();
    if (!m_decoder) {
        recordFailure(DecodeError::Unsupported, QStringLiteral("no decoder for this track"));
        if (error) *error = this->error();
        return false;
    }

    m_decoder->setOutputFormat(m_options.sampleRate, m_options.channels);
    if (!m_decoder->open(path.toStdString())) {
        recordFailure(DecodeError::OpenFailed, m_decoder->errorString());
        if (error) *error = this->error();
        qWarning() << "[Stream] Open failed:" << path << m_decoder->errorString();
        return false;
    }
    m_open = true;

    int64_t total = m_decoder->format().totalFrames;
    if (total <= 0 && m_track)
        total = m_track->durationFrames;
    m_duration.store(std::max<int64_t>(0, total), std::memory_order_release);

    if (startFrame > 0) {
        if (!m_decoder->seek(startFrame)) {
            recordFailure(DecodeError::SeekFailed, m_decoder->errorString());
            if (error) *error = this->error();
            return false;
        }
        m_position.store(startFrame, std::memory_order_release);
    }

    if (m_options.threaded) {
        prefill();
        startWorker();
    }

    qDebug() << "[Stream] Opened" << (m_track ? m_track->id : QString())
             << "duration" << duration() << "frames"
             << (m_options.threaded ? "(threaded)" : "(inline)");
    return true;
}

DecoderStream::ReadResult DecoderStream::read(float* out, int frames)
{
    ReadResult result;
    if (frames <= 0) return result;

    const int channels = m_options.channels;

    // A threaded stream may still hold frames decoded before a failure
    const bool drained = isFinished() || (hasFailed() && !m_options.threaded)
                         || (hasFailed() && m_buffer.available() == 0);
    if (drained) {
        std::memset(out, 0, size_t(frames) * channels * sizeof(float));
        result.endOfStream = isFinished();
        result.failed = !result.endOfStream;
        return result;
    }

    if (!m_options.threaded) {
        result.frames = readInline(out, frames, result);
    } else {
        // Flags first: everything pushed before they were raised is poppable
        const bool eof = m_decoderEof.load(std::memory_order_acquire);
        const bool failed = m_failed.load(std::memory_order_acquire);

        result.frames = m_buffer.pop(out, frames);
        if (result.frames < frames) {
            if (eof) {
                result.endOfStream = true;
            } else if (failed) {
                result.failed = true;
            } else {
                result.padded = frames - result.frames;
                fillUnderrun(out + size_t(result.frames) * channels, result.padded);
                m_underruns.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    if (result.frames > 0) {
        rememberTail(out, result.frames);
        m_position.fetch_add(result.frames, std::memory_order_acq_rel);
    }

    const int written = result.frames + result.padded;
    if (written < frames)
        std::memset(out + size_t(written) * channels, 0,
                    size_t(frames - written) * channels * sizeof(float));

    if (result.endOfStream) {
        // True length is known now
        m_duration.store(position(), std::memory_order_release);
        m_finished.store(true, std::memory_order_release);
    }
    return result;
}

int DecoderStream::readInline(float* out, int frames, ReadResult& result)
{
    const int channels = m_options.channels;
    int got = 0;
    while (got < frames) {
        int n = m_decoder->read(out + size_t(got) * channels, frames - got);
        if (n < 0) {
            recordFailure(DecodeError::ReadFailed, m_decoder->errorString());
            result.failed = true;
            break;
        }
        if (n == 0) {
            result.endOfStream = true;
            break;
        }
        got += n;
    }
    return got;
}

bool DecoderStream::seek(int64_t frame, DecodeError* error)
{
    if (!m_open) {
        if (error) {
            error->kind = DecodeError::SeekFailed;
            error->message = QStringLiteral("stream not open");
            error->trackId = m_track ? m_track->id : QString();
        }
        return false;
    }

    stopWorker();

    const int64_t dur = duration();
    if (dur > 0)
        frame = std::min(frame, dur);
    frame = std::max<int64_t>(0, frame);

    if (!m_decoder->seek(frame)) {
        recordFailure(DecodeError::SeekFailed, m_decoder->errorString());
        if (error) *error = this->error();
        return false;
    }

    m_buffer.clear();
    m_lastBlockFrames = 0;
    m_decoderEof.store(false, std::memory_order_release);
    m_finished.store(false, std::memory_order_release);
    m_position.store(frame, std::memory_order_release);

    if (m_options.threaded) {
        prefill();
        startWorker();
    }
    return true;
}

void DecoderStream::requestStop()
{
    m_stop.store(true, std::memory_order_release);
    m_workerCv.notify_all();
}

void DecoderStream::close()
{
    stopWorker();
    if (m_open) {
        m_decoder->close();
        m_open = false;
        qDebug() << "[Stream] Closed" << (m_track ? m_track->id : QString())
                 << "at" << position() << "underruns" << underruns();
    }
}

int64_t DecoderStream::remaining() const
{
    const int64_t dur = duration();
    if (dur <= 0) return -1;
    return std::max<int64_t>(0, dur - position());
}

DecodeError DecoderStream::error() const
{
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_error;
}

// ── Worker ──────────────────────────────────────────────────────────

bool DecoderStream::decodeBlock()
{
    const int block = std::min(m_options.decodeBlockFrames, m_buffer.freeSpace());
    if (block <= 0) return true;

    int n = m_decoder->read(m_scratch.data(), block);
    if (n < 0) {
        recordFailure(DecodeError::ReadFailed, m_decoder->errorString());
        return false;
    }
    if (n == 0) {
        m_decoderEof.store(true, std::memory_order_release);
        return false;
    }
    // Single producer: free space only grows while we push
    m_buffer.push(m_scratch.data(), n);
    return true;
}

void DecoderStream::prefill()
{
    while (m_buffer.freeSpace() > 0) {
        if (!decodeBlock()) break;
    }
}

void DecoderStream::startWorker()
{
    if (m_decoderEof.load(std::memory_order_acquire) || hasFailed()) return;
    m_stop.store(false, std::memory_order_release);
    m_worker = std::thread(&DecoderStream::workerLoop, this);
}

void DecoderStream::stopWorker()
{
    requestStop();
    if (m_worker.joinable())
        m_worker.join();
}

void DecoderStream::workerLoop()
{
    while (!m_stop.load(std::memory_order_acquire)) {
        if (m_buffer.freeSpace() >= std::min(m_options.decodeBlockFrames, m_buffer.capacity())) {
            if (!decodeBlock()) break;
            continue;
        }
        std::unique_lock<std::mutex> lock(m_workerMutex);
        m_workerCv.wait_for(lock, std::chrono::milliseconds(2), [this] {
            return m_stop.load(std::memory_order_acquire);
        });
    }
}

void DecoderStream::recordFailure(DecodeError::Kind kind, const QString& message)
{
    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_error.kind = kind;
        m_error.message = message;
        m_error.trackId = m_track ? m_track->id : QString();
    }
    m_failed.store(true, std::memory_order_release);
}

// ── Underrun fill ───────────────────────────────────────────────────

void DecoderStream::fillUnderrun(float* out, int frames)
{
    const int channels = m_options.channels;
    if (m_options.underrunPolicy == UnderrunPolicy::Silence || m_lastBlockFrames == 0) {
        std::memset(out, 0, size_t(frames) * channels * sizeof(float));
        return;
    }
    int done = 0;
    while (done < frames) {
        int n = std::min(m_lastBlockFrames, frames - done);
        std::memcpy(out + size_t(done) * channels, m_lastBlock.data(),
                    size_t(n) * channels * sizeof(float));
        done += n;
    }
}

void DecoderStream::rememberTail(const float* out, int frames)
{
    if (m_options.underrunPolicy != UnderrunPolicy::RepeatLastBlock) return;
    const int channels = m_options.channels;
    const int keep = std::min(frames, m_options.decodeBlockFrames);
    std::memcpy(m_lastBlock.data(), out + size_t(frames - keep) * channels,
                size_t(keep) * channels * sizeof(float));
    m_lastBlockFrames = keep;
}
