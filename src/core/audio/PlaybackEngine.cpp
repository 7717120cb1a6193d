#include "PlaybackEngine.h"
#include "../Settings.h"

#include <QDebug>
#include <algorithm>
#include <cmath>
#include <cstring>

// ── Constructor ─────────────────────────────────────────────────────
PlaybackEngine::PlaybackEngine(std::unique_ptr<IAudioOutput> output,
                               DecoderFactory decoderFactory,
                               const EngineConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_output(std::move(output))
    , m_decoderFactory(std::move(decoderFactory))
    , m_queue(config.historyDepth)
{
    m_config.channels = std::max(1, m_config.channels);
    m_crossfadeMs = std::clamp(m_config.crossfadeMs, 0, Settings::kMaxCrossfadeMs);
    m_curve = m_config.curve;

    m_session.crossfadeFrames = m_config.msToFrames(m_crossfadeMs);
    m_session.crossfade.setCurve(m_curve);
    m_session.crossfade.preallocate(m_config.channels, std::max(m_config.bufferFrames, 1024));

    m_queue.setShuffle(m_config.shuffle);
    m_queue.setRepeatMode(m_config.repeat);
    m_volume.store(std::clamp(m_config.volume, 0.0f, 1.0f), std::memory_order_relaxed);

    if (m_output) {
        m_output->setRenderCallback([this](float* buf, int frames) {
            return render(buf, frames);
        });
    }

    if (m_config.pollIntervalMs > 0) {
        m_pollTimer = new QTimer(this);
        m_pollTimer->setInterval(m_config.pollIntervalMs);
        connect(m_pollTimer, &QTimer::timeout, this, &PlaybackEngine::poll);
        m_pollTimer->start();
    }

    qDebug() << "[Engine] Created:" << m_config.sampleRate << "Hz" << m_config.channels << "ch,"
             << "crossfade" << m_crossfadeMs << "ms" << crossfadeCurveName(m_curve)
             << (m_config.threadedDecode ? "threaded decode" : "inline decode");
}

PlaybackEngine::~PlaybackEngine()
{
    // Stop the output first: its callback points at this object
    if (m_output) {
        m_output->stop();
        m_output->close();
    }
    Lock lock(m_sessionMutex);
    closeAllStreamsLocked();
    m_session.retired.clear();
}

double PlaybackEngine::position() const
{
    return double(positionFrames()) / m_config.sampleRate;
}

// ── render (called from audio thread) ───────────────────────────────
int PlaybackEngine::render(float* buf, int frames)
{
    const int channels = m_config.channels;
    const size_t samples = size_t(frames) * channels;

    // Never block the realtime audio thread
    Lock lock(m_sessionMutex, std::try_to_lock);
    if (!lock.owns_lock() || state() != Playing) {
        // A command holds the session, or nothing should sound
        std::memset(buf, 0, samples * sizeof(float));
        return frames;
    }

    int done = 0;
    for (int segment = 0; done < frames && segment < 32; ++segment) {
        float* out = buf + size_t(done) * channels;
        if (m_session.crossfade.isActive()) {
            renderTransition(out, frames - done, done);
            continue;
        }
        if (!m_session.current || !renderCurrent(out, frames - done, done))
            break;
    }

    if (done < frames)
        std::memset(buf + size_t(done) * channels, 0, size_t(frames - done) * channels * sizeof(float));

    updatePositionLocked();
    lock.unlock();

    // Volume after mixing, then clip to the valid range
    const float vol = m_volume.load(std::memory_order_relaxed);
    for (size_t i = 0; i < samples; ++i)
        buf[i] = std::clamp(buf[i] * vol, -1.0f, 1.0f);

    return frames;
}

int64_t PlaybackEngine::framesUntilTransition() const
{
    const DecoderStream* cur = m_session.current.get();
    const DecoderStream* next = m_session.prepared.get();
    if (!cur || !next || m_session.crossfadeFrames <= 0 || !cur->hasKnownDuration())
        return -1;

    const int64_t remaining = cur->remaining();
    if (remaining <= 0) return -1;

    // Never crossfade past the end of a short incoming track
    int64_t window = m_session.crossfadeFrames;
    if (next->hasKnownDuration())
        window = std::min(window, next->duration());

    return remaining <= window ? 0 : remaining - window;
}

void PlaybackEngine::beginTransition()
{
    const int64_t remaining = m_session.current->remaining();
    int64_t window = m_session.crossfadeFrames;
    if (m_session.prepared->hasKnownDuration())
        window = std::min(window, m_session.prepared->duration());

    TrackPtr incoming = m_session.prepared->track();
    m_session.crossfade.begin(std::move(m_session.current), std::move(m_session.prepared),
                              std::min(window, remaining));
    setTransitioningLocked(true);
    publish(EngineEvent::TransitionStarted, incoming, QString(),
            int(m_session.crossfade.durationFrames()));
}

void PlaybackEngine::renderTransition(float* out, int frames, int& done)
{
    CrossfadeController& xf = m_session.crossfade;
    CrossfadeController::MixResult r = xf.mix(out, frames);
    done += r.frames;
    if (r.underrun)
        m_underruns.fetch_add(1, std::memory_order_relaxed);

    if (r.outgoingFailed)
        publishDecodeError(*xf.outgoing());

    if (r.incomingFailed) {
        // Stay on outgoing at full gain; the failed candidate is stepped over
        publishDecodeError(*xf.incoming());
        CrossfadeController::Handover h = xf.abortKeepingOutgoing();
        m_session.current = std::move(h.kept);
        retire(std::move(h.dropped));
        ++m_session.skipCount;
        ++m_session.generation;
        setTransitioningLocked(false);
        publish(EngineEvent::TransitionAborted);
        return;
    }

    if (r.completed) {
        CrossfadeController::Handover h = xf.finish();
        m_session.current = std::move(h.kept);
        retire(std::move(h.dropped));
        setTransitioningLocked(false);
        publish(EngineEvent::TransitionFinished);
        if (m_session.current)
            pushCommit(m_session.current->entryId());
    }
}

bool PlaybackEngine::renderCurrent(float* out, int frames, int& done)
{
    const int64_t until = framesUntilTransition();
    if (until == 0) {
        beginTransition();
        return true;
    }

    const int n = (until > 0 && until < frames) ? int(until) : frames;
    DecoderStream::ReadResult r = m_session.current->read(out, n);
    done += r.frames + r.padded;
    if (r.padded > 0)
        m_underruns.fetch_add(1, std::memory_order_relaxed);

    if (r.endOfStream) {
        retire(std::move(m_session.current));
        if (m_session.prepared) {
            // Gapless handover
            m_session.current = std::move(m_session.prepared);
            pushCommit(m_session.current->entryId());
            return true;
        }
        m_session.advancePending = true;
        return false;
    }

    if (r.failed) {
        publishDecodeError(*m_session.current);
        const quint64 failedEntry = m_session.current->entryId();
        retire(std::move(m_session.current));
        if (m_session.prepared && m_session.prepared->entryId() != failedEntry) {
            m_session.current = std::move(m_session.prepared);
            pushCommit(m_session.current->entryId());
            return true;
        }
        retire(std::move(m_session.prepared));
        m_session.recoveryPending = true;
        return false;
    }

    // Start exactly on the scheduled frame, even at a buffer boundary
    if (framesUntilTransition() == 0)
        beginTransition();
    return true;
}

void PlaybackEngine::retire(std::unique_ptr<DecoderStream> stream)
{
    if (!stream) return;
    stream->requestStop();
    m_session.retired.push_back(std::move(stream));
}

void PlaybackEngine::pushCommit(quint64 entryId)
{
    if (m_session.pendingCommitCount < PlaybackSession::kMaxPendingCommits)
        m_session.pendingCommits[m_session.pendingCommitCount++] = entryId;
    else
        m_session.pendingCommits[PlaybackSession::kMaxPendingCommits - 1] = entryId;
}

void PlaybackEngine::publishDecodeError(const DecoderStream& stream)
{
    publish(EngineEvent::DecodeFailed, stream.track(), stream.error().message);
}

// ── Control path (session lock held) ────────────────────────────────

void PlaybackEngine::syncQueueLocked()
{
    for (int i = 0; i < m_session.pendingCommitCount; ++i) {
        const quint64 id = m_session.pendingCommits[i];
        QueueManager::Entry next = m_queue.peekNextEntry(m_session.skipCount);
        if (next && next.id == id)
            m_queue.advance(m_session.skipCount);
        else if (!m_queue.jumpToEntry(id))
            qWarning() << "[Engine] Handover to an entry no longer queued:" << id;

        m_session.skipCount = 0;
        ++m_session.generation;
        publish(EngineEvent::CurrentTrackChanged, m_queue.current());
    }
    m_session.pendingCommitCount = 0;
}

std::unique_ptr<DecoderStream> PlaybackEngine::makeStream(const QueueManager::Entry& entry) const
{
    std::unique_ptr<IDecoder> decoder;
    if (m_decoderFactory && entry.track)
        decoder = m_decoderFactory(*entry.track);

    DecoderStream::Options opts;
    opts.sampleRate        = m_config.sampleRate;
    opts.channels          = m_config.channels;
    opts.lookaheadFrames   = m_config.lookaheadFrames;
    opts.decodeBlockFrames = m_config.decodeBlockFrames;
    opts.underrunPolicy    = m_config.underrunPolicy;
    opts.threaded          = m_config.threadedDecode;
    return std::make_unique<DecoderStream>(entry.track, entry.id, std::move(decoder), opts);
}

bool PlaybackEngine::openCurrentLocked(int64_t startFrame)
{
    m_session.current.reset();

    QueueManager::Entry entry = m_queue.currentEntry();
    if (!entry) return false;

    std::unique_ptr<DecoderStream> stream = makeStream(entry);
    DecodeError err;
    if (!stream->open(startFrame, &err)) {
        publish(EngineEvent::DecodeFailed, entry.track, err.message);
        return false;
    }
    m_session.current = std::move(stream);
    updatePositionLocked();
    return true;
}

PlaybackResult PlaybackEngine::advanceToPlayableLocked(bool bypassRepeatOne)
{
    // Under RepeatOne a failed candidate is the current track itself
    if (m_queue.repeatMode() == RepeatMode::One && m_session.skipCount > 0) {
        bypassRepeatOne = true;
        m_session.skipCount = 0;
    }

    for (int attempts = m_queue.size(); attempts > 0; --attempts) {
        QueueManager::AdvanceResult res = bypassRepeatOne
            ? m_queue.skipForward(m_session.skipCount)
            : m_queue.advance(m_session.skipCount);
        m_session.skipCount = 0;
        ++m_session.generation;
        m_session.prepared.reset();

        if (res == QueueManager::EndOfQueue) {
            qDebug() << "[Engine] End of queue";
            stopLocked();
            publish(EngineEvent::QueueExhausted);
            return PlaybackResult::failure(PlaybackError::EndOfQueue,
                                           QStringLiteral("End of queue"));
        }

        publish(EngineEvent::CurrentTrackChanged, m_queue.current());
        if (openCurrentLocked(0))
            return PlaybackResult::success();

        // A failing track must not be repeated
        bypassRepeatOne = true;
    }

    stopLocked();
    const QString msg = QStringLiteral("No playable track in queue");
    publish(EngineEvent::PlaybackFailed, TrackPtr(), msg);
    return PlaybackResult::failure(PlaybackError::DecodeFailed, msg);
}

PlaybackResult PlaybackEngine::startTargetLocked()
{
    // Hard cut: nothing of the previous streams stays audible
    closeAllStreamsLocked();
    publish(EngineEvent::CurrentTrackChanged, m_queue.current());

    if (state() == Stopped) return PlaybackResult::success();
    if (openCurrentLocked(0)) return PlaybackResult::success();
    return advanceToPlayableLocked(true);
}

void PlaybackEngine::abortTransitionLocked(bool keepOutgoing)
{
    if (!m_session.crossfade.isActive()) return;

    CrossfadeController::Handover h = m_session.crossfade.abortKeepingOutgoing();
    if (keepOutgoing)
        m_session.current = std::move(h.kept);
    h.kept.reset();
    h.dropped.reset();  // closed before the command returns
    setTransitioningLocked(false);
    publish(EngineEvent::TransitionAborted);
}

void PlaybackEngine::closeAllStreamsLocked()
{
    abortTransitionLocked(false);
    m_session.current.reset();
    m_session.prepared.reset();
    m_session.advancePending = false;
    m_session.recoveryPending = false;
    updatePositionLocked();
}

void PlaybackEngine::discardPreparedLocked()
{
    m_session.prepared.reset();
}

void PlaybackEngine::validatePreparedLocked()
{
    if (!m_session.prepared) return;
    QueueManager::Entry next = m_queue.peekNextEntry(m_session.skipCount);
    if (!next || next.id != m_session.prepared->entryId())
        discardPreparedLocked();
}

void PlaybackEngine::queueMutatedLocked()
{
    ++m_session.generation;
    m_session.skipCount = 0;
    validatePreparedLocked();
    publish(EngineEvent::QueueChanged);
}

void PlaybackEngine::stopLocked()
{
    closeAllStreamsLocked();
    setStateLocked(Stopped);
}

void PlaybackEngine::setStateLocked(State s)
{
    if (m_state.load(std::memory_order_acquire) == s) return;
    m_state.store(s, std::memory_order_release);
    publish(EngineEvent::StateChanged, TrackPtr(), QString(), int(s));
}

void PlaybackEngine::setTransitioningLocked(bool on)
{
    m_transitioning.store(on, std::memory_order_release);
}

void PlaybackEngine::publish(EngineEvent::Type type, const TrackPtr& track,
                             const QString& message, int value)
{
    EngineEvent e;
    e.type = type;
    e.track = track;
    e.message = message;
    e.value = value;
    m_session.events.publish(std::move(e));
}

void PlaybackEngine::updatePositionLocked()
{
    const DecoderStream* s = m_session.audibleStream();
    m_positionFrames.store(s ? s->position() : 0, std::memory_order_release);
    m_durationFrames.store(s ? s->duration() : 0, std::memory_order_release);
}

// ── Transport ───────────────────────────────────────────────────────

PlaybackResult PlaybackEngine::play()
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        if (m_queue.isEmpty()) {
            result = PlaybackResult::failure(PlaybackError::QueueEmpty,
                                             QStringLiteral("Queue is empty"));
        } else if (state() != Playing) {
            const bool needStream = !m_session.current && !m_session.crossfade.isActive();
            const bool opened = !needStream || openCurrentLocked(0);
            setStateLocked(Playing);
            if (!opened)
                result = advanceToPlayableLocked(true);
        }
    }

    if (result.ok() && state() == Playing && !ensureOutputRunning()) {
        Lock lock(m_sessionMutex);
        stopLocked();
        result = PlaybackResult::failure(PlaybackError::OutputFailed,
                                         QStringLiteral("Audio output unavailable"));
    }

    ensureNextPrepared();
    drainEvents();
    return result;
}

PlaybackResult PlaybackEngine::pause()
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        if (state() == Playing)
            setStateLocked(Paused);   // transition, if any, is kept as is
        else if (state() == Stopped)
            result = PlaybackResult::failure(PlaybackError::NoActiveStream,
                                             QStringLiteral("Nothing is playing"));
    }
    drainEvents();
    return result;
}

PlaybackResult PlaybackEngine::togglePlayPause()
{
    return state() == Playing ? pause() : play();
}

PlaybackResult PlaybackEngine::stop()
{
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        stopLocked();
    }
    if (m_output && m_output->isRunning())
        m_output->stop();
    drainEvents();
    return PlaybackResult::success();
}

PlaybackResult PlaybackEngine::skip()
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        if (m_queue.isEmpty()) {
            result = PlaybackResult::failure(PlaybackError::QueueEmpty,
                                             QStringLiteral("Queue is empty"));
        } else if (m_queue.skipForward(m_session.skipCount) == QueueManager::EndOfQueue) {
            result = PlaybackResult::failure(PlaybackError::EndOfQueue,
                                             QStringLiteral("No next track"));
        } else {
            m_session.skipCount = 0;
            ++m_session.generation;
            qDebug() << "[Engine] Skip ->" << m_queue.current()->id;
            result = startTargetLocked();
        }
    }
    ensureNextPrepared();
    drainEvents();
    return result;
}

PlaybackResult PlaybackEngine::previous()
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        if (m_queue.isEmpty()) {
            result = PlaybackResult::failure(PlaybackError::QueueEmpty,
                                             QStringLiteral("Queue is empty"));
        } else if (m_queue.previous()) {
            m_session.skipCount = 0;
            ++m_session.generation;
            qDebug() << "[Engine] Previous ->" << m_queue.current()->id;
            result = startTargetLocked();
        } else {
            // No history: restart the current track
            abortTransitionLocked(true);
            if (m_session.current) {
                DecodeError err;
                if (!m_session.current->seek(0, &err)) {
                    publish(EngineEvent::DecodeFailed, m_session.current->track(), err.message);
                    result = PlaybackResult::failure(PlaybackError::DecodeFailed, err.message);
                }
            } else if (state() != Stopped && !openCurrentLocked(0)) {
                result = advanceToPlayableLocked(true);
            }
            updatePositionLocked();
        }
    }
    ensureNextPrepared();
    drainEvents();
    return result;
}

PlaybackResult PlaybackEngine::seekTo(double secs)
{
    return seekToFrame(int64_t(std::llround(secs * m_config.sampleRate)));
}

PlaybackResult PlaybackEngine::seekToFrame(int64_t frame)
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        DecoderStream* stream = m_session.audibleStream();
        if (!stream) {
            result = PlaybackResult::failure(PlaybackError::NoActiveStream,
                                             QStringLiteral("Nothing to seek"));
        } else if (!stream->hasKnownDuration()) {
            result = PlaybackResult::failure(PlaybackError::UnknownDuration,
                                             QStringLiteral("Stream length unknown"));
        } else {
            abortTransitionLocked(true);
            const int64_t target = std::clamp<int64_t>(frame, 0, m_session.current->duration());
            DecodeError err;
            if (!m_session.current->seek(target, &err)) {
                publish(EngineEvent::DecodeFailed, m_session.current->track(), err.message);
                result = PlaybackResult::failure(PlaybackError::DecodeFailed, err.message);
            }
            updatePositionLocked();
        }
    }
    ensureNextPrepared();
    drainEvents();
    return result;
}

PlaybackResult PlaybackEngine::playIndex(int index)
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        if (!m_queue.jumpTo(index)) {
            result = PlaybackResult::failure(PlaybackError::InvalidIndex,
                                             QStringLiteral("No queue entry %1").arg(index));
        } else {
            m_session.skipCount = 0;
            ++m_session.generation;
            setStateLocked(Playing);
            result = startTargetLocked();
        }
    }

    if (result.ok() && state() == Playing && !ensureOutputRunning()) {
        Lock lock(m_sessionMutex);
        stopLocked();
        result = PlaybackResult::failure(PlaybackError::OutputFailed,
                                         QStringLiteral("Audio output unavailable"));
    }

    ensureNextPrepared();
    drainEvents();
    return result;
}

// ── Modes ───────────────────────────────────────────────────────────

void PlaybackEngine::setShuffle(bool enabled)
{
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        m_queue.setShuffle(enabled);
        queueMutatedLocked();
    }
    qDebug() << "[Engine] Shuffle" << enabled;
    ensureNextPrepared();
    drainEvents();
}

void PlaybackEngine::setRandomSeed(quint32 seed)
{
    Lock lock(m_sessionMutex);
    m_queue.setRandomSeed(seed);
}

void PlaybackEngine::setRepeatMode(RepeatMode mode)
{
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        m_queue.setRepeatMode(mode);
        queueMutatedLocked();
    }
    qDebug() << "[Engine] Repeat mode" << int(mode);
    ensureNextPrepared();
    drainEvents();
}

void PlaybackEngine::cycleRepeat()
{
    RepeatMode mode;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        m_queue.cycleRepeat();
        mode = m_queue.repeatMode();
        queueMutatedLocked();
    }
    qDebug() << "[Engine] Repeat mode" << int(mode);
    ensureNextPrepared();
    drainEvents();
}

void PlaybackEngine::setVolume(float vol)
{
    m_volume.store(std::clamp(vol, 0.0f, 1.0f), std::memory_order_relaxed);
}

void PlaybackEngine::setCrossfadeDuration(int ms)
{
    ms = std::clamp(ms, 0, Settings::kMaxCrossfadeMs);
    {
        Lock lock(m_sessionMutex);
        m_crossfadeMs = ms;
        m_session.crossfadeFrames = m_config.msToFrames(ms);
        // Turning crossfade off cancels the window in flight: the outgoing
        // track plays on at full gain and the incoming one is prepared
        // again as a gapless successor. Other changes apply to the next
        // transition.
        if (ms == 0 && m_session.crossfade.isActive()) {
            abortTransitionLocked(true);
            ++m_session.generation;
            updatePositionLocked();
        }
    }
    qDebug() << "[Crossfade] Duration set to" << ms << "ms";
    ensureNextPrepared();
    drainEvents();
}

void PlaybackEngine::setCrossfadeCurve(CrossfadeCurve curve)
{
    Lock lock(m_sessionMutex);
    m_curve = curve;
    m_session.crossfade.setCurve(curve);
}

void PlaybackEngine::savePreferences(Settings& settings) const
{
    settings.setCrossfadeDurationMs(m_crossfadeMs);
    settings.setCrossfadeCurve(crossfadeCurveName(m_curve));
    settings.setShuffleEnabled(m_queue.shuffleEnabled());
    settings.setRepeatMode(int(m_queue.repeatMode()));
    settings.setVolume(int(std::lround(volume() * 100.0f)));
}

// ── Queue edits ─────────────────────────────────────────────────────

void PlaybackEngine::setQueue(const QVector<TrackPtr>& tracks)
{
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        closeAllStreamsLocked();
        m_queue.setQueue(tracks);
        queueMutatedLocked();
        if (m_queue.isEmpty())
            stopLocked();
        startTargetLocked();
    }
    ensureNextPrepared();
    drainEvents();
}

void PlaybackEngine::enqueue(const TrackPtr& track)
{
    enqueue(QVector<TrackPtr>{track});
}

void PlaybackEngine::enqueue(const QVector<TrackPtr>& tracks)
{
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        const bool wasEmpty = m_queue.isEmpty();
        m_queue.append(tracks);
        queueMutatedLocked();
        if (wasEmpty && !m_queue.isEmpty())
            publish(EngineEvent::CurrentTrackChanged, m_queue.current());
    }
    ensureNextPrepared();
    drainEvents();
}

PlaybackResult PlaybackEngine::insertAt(int index, const TrackPtr& track)
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        const bool wasEmpty = m_queue.isEmpty();
        if (!m_queue.insert(index, track)) {
            result = PlaybackResult::failure(PlaybackError::InvalidIndex,
                                             QStringLiteral("Cannot insert at %1").arg(index));
        } else {
            queueMutatedLocked();
            if (wasEmpty)
                publish(EngineEvent::CurrentTrackChanged, m_queue.current());
        }
    }
    ensureNextPrepared();
    drainEvents();
    return result;
}

PlaybackResult PlaybackEngine::removeFromQueue(int index)
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();

        QueueManager::Entry removed = m_queue.entryAt(index);
        if (!removed) {
            result = PlaybackResult::failure(PlaybackError::InvalidIndex,
                                             QStringLiteral("No queue entry %1").arg(index));
        } else {
            CrossfadeController& xf = m_session.crossfade;
            const bool wasCurrent = removed.id == m_queue.currentEntry().id;

            // The incoming side of a transition is going away
            if (!wasCurrent && xf.isActive() && xf.incoming()->entryId() == removed.id)
                abortTransitionLocked(true);
            if (m_session.prepared && m_session.prepared->entryId() == removed.id)
                discardPreparedLocked();

            QueueManager::RemoveResult res = m_queue.remove(index);
            queueMutatedLocked();

            if (res == QueueManager::RemovedCurrent) {
                publish(EngineEvent::CurrentTrackChanged, m_queue.current());
                const quint64 nowId = m_queue.currentEntry().id;
                if (xf.isActive() && xf.incoming()->entryId() == nowId) {
                    // The successor is already audible: hand over at full gain
                    CrossfadeController::Handover h = xf.finish();
                    m_session.current = std::move(h.kept);
                    h.dropped.reset();
                    setTransitioningLocked(false);
                    publish(EngineEvent::TransitionFinished);
                    updatePositionLocked();
                } else if (state() != Stopped) {
                    closeAllStreamsLocked();
                    if (!openCurrentLocked(0))
                        result = advanceToPlayableLocked(true);
                }
            } else if (res == QueueManager::RemovedCurrentEndOfQueue) {
                stopLocked();
                publish(EngineEvent::CurrentTrackChanged, m_queue.current());
            }
        }
    }
    ensureNextPrepared();
    drainEvents();
    return result;
}

PlaybackResult PlaybackEngine::reorderQueue(int fromIndex, int toIndex)
{
    PlaybackResult result;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        const int n = m_queue.size();
        if (fromIndex < 0 || fromIndex >= n || toIndex < 0 || toIndex >= n) {
            result = PlaybackResult::failure(PlaybackError::InvalidIndex,
                                             QStringLiteral("Cannot move %1 to %2").arg(fromIndex).arg(toIndex));
        } else if (fromIndex != toIndex) {
            m_queue.reorder(fromIndex, toIndex);
            queueMutatedLocked();
        }
    }
    ensureNextPrepared();
    drainEvents();
    return result;
}

void PlaybackEngine::clearQueue()
{
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        stopLocked();
        m_queue.clear();
        queueMutatedLocked();
        publish(EngineEvent::CurrentTrackChanged);
    }
    if (m_output && m_output->isRunning())
        m_output->stop();
    drainEvents();
}

// ── Control thread, no lock held ────────────────────────────────────

bool PlaybackEngine::ensureOutputRunning()
{
    if (!m_output) return false;

    if (!m_outputOpen) {
        AudioStreamFormat fmt;
        fmt.sampleRate = m_config.sampleRate;
        fmt.channels = m_config.channels;
        if (!m_output->open(fmt, m_config.bufferFrames)) {
            qWarning() << "[Engine] Failed to open output";
            return false;
        }
        m_outputOpen = true;
        qDebug() << "[Engine] Output:" << QString::fromStdString(m_output->deviceName());
    }
    if (!m_output->isRunning() && !m_output->start()) {
        qWarning() << "[Engine] Failed to start output";
        return false;
    }
    return true;
}

void PlaybackEngine::ensureNextPrepared()
{
    for (int attempt = 0; attempt < 16; ++attempt) {
        QueueManager::Entry entry;
        quint64 generation = 0;
        int skip = 0;
        {
            Lock lock(m_sessionMutex);
            syncQueueLocked();
            if (state() == Stopped || m_session.prepared || m_session.crossfade.isActive()
                || !m_session.current)
                return;
            if (!m_config.gapless && m_session.crossfadeFrames <= 0)
                return;
            if (!nextStreamDueLocked())
                return;
            entry = m_queue.peekNextEntry(m_session.skipCount);
            if (!entry) return;
            generation = m_session.generation;
            skip = m_session.skipCount;
        }

        // Open and prefill outside the lock; render keeps playing meanwhile
        std::unique_ptr<DecoderStream> stream = makeStream(entry);
        DecodeError err;
        const bool opened = stream->open(0, &err);

        Lock lock(m_sessionMutex);
        const bool stale = m_session.generation != generation || m_session.skipCount != skip
                           || m_session.pendingCommitCount > 0 || m_session.prepared;
        if (stale) {
            lock.unlock();
            continue;
        }
        if (!opened) {
            publish(EngineEvent::DecodeFailed, entry.track, err.message);
            ++m_session.skipCount;
            lock.unlock();
            continue;
        }
        qDebug() << "[Engine] Prepared next:" << entry.track->id;
        m_session.prepared = std::move(stream);
        return;
    }
}

int64_t PlaybackEngine::prepareMarginFrames() const
{
    // Covers the lookahead prefill plus one output buffer and one poll
    // period, so the successor is in place before the scheduled frame
    return int64_t(m_config.lookaheadFrames) + m_config.bufferFrames
           + m_config.msToFrames(m_config.pollIntervalMs);
}

bool PlaybackEngine::nextStreamDueLocked() const
{
    const DecoderStream* cur = m_session.current.get();
    if (!cur->hasKnownDuration()) {
        // Length unknown: wait until the decoder has delivered its last
        // block; what is still buffered covers the handover
        return cur->decoderExhausted();
    }
    return cur->remaining() <= m_session.crossfadeFrames + prepareMarginFrames();
}

void PlaybackEngine::poll()
{
    std::vector<std::unique_ptr<DecoderStream>> reaped;
    {
        Lock lock(m_sessionMutex);
        syncQueueLocked();
        if (m_session.recoveryPending) {
            m_session.recoveryPending = false;
            m_session.advancePending = false;
            advanceToPlayableLocked(true);
        } else if (m_session.advancePending) {
            m_session.advancePending = false;
            advanceToPlayableLocked(false);
        }
        for (auto& s : m_session.retired)
            reaped.push_back(std::move(s));
        m_session.retired.clear();
        updatePositionLocked();
    }
    // Joins decode workers outside the lock
    reaped.clear();

    ensureNextPrepared();

    if (state() == Stopped && m_output && m_output->isRunning())
        m_output->stop();

    drainEvents();

    const int underruns = underrunCount();
    if (underruns != m_reportedUnderruns) {
        m_reportedUnderruns = underruns;
        emit bufferUnderrun(underruns);
    }
    if (state() != Stopped)
        emit positionChanged(position());
}

void PlaybackEngine::drainEvents()
{
    std::vector<EngineEvent> events;
    int dropped = 0;
    {
        Lock lock(m_sessionMutex);
        m_session.events.takeAll(events);
        dropped = m_session.events.dropped();
    }

    if (dropped != m_reportedDroppedEvents) {
        qWarning() << "[Engine] Event channel full," << dropped - m_reportedDroppedEvents
                   << "notifications lost," << dropped << "in total";
        m_reportedDroppedEvents = dropped;
    }

    for (const EngineEvent& e : events) {
        switch (e.type) {
        case EngineEvent::StateChanged:
            qDebug() << "[Engine] State" << State(e.value);
            emit stateChanged(State(e.value));
            break;
        case EngineEvent::TransitionStarted:
            qDebug() << "[Crossfade] Started ->" << (e.track ? e.track->id : QString())
                     << "over" << e.value << "frames";
            emit transitioningChanged(true);
            break;
        case EngineEvent::TransitionFinished:
            emit transitioningChanged(false);
            break;
        case EngineEvent::TransitionAborted:
            qDebug() << "[Crossfade] Aborted";
            emit transitioningChanged(false);
            break;
        case EngineEvent::CurrentTrackChanged:
            emit currentTrackChanged(e.track ? *e.track : Track());
            break;
        case EngineEvent::DecodeFailed:
            qWarning() << "[Engine] Decode error on" << (e.track ? e.track->filePath : QString())
                       << ":" << e.message;
            emit decodeError(e.track ? *e.track : Track(), e.message);
            break;
        case EngineEvent::QueueChanged:
            emit queueChanged();
            break;
        case EngineEvent::QueueExhausted:
            emit queueExhausted();
            break;
        case EngineEvent::PlaybackFailed:
            qWarning() << "[Engine]" << e.message;
            emit errorOccurred(e.message);
            break;
        }
    }
}
