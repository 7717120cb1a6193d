#pragma once

#include <QObject>
#include <QTimer>
#include <QString>
#include <QVector>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "EngineConfig.h"
#include "IDecoder.h"
#include "PlaybackError.h"
#include "PlaybackSession.h"
#include "../MusicData.h"
#include "../QueueManager.h"
#include "../../platform/IAudioOutput.h"

class Settings;

// Drives playback: owns the queue, the playback session and the output.
//
// Two paths touch the session, both under m_sessionMutex:
//   - render(), called by the output on its own thread. It try_locks,
//     plays silence when a command holds the lock, never opens files
//     and never touches the queue.
//   - commands and poll(), on the thread that owns this object. They
//     open streams, commit stream handovers to the queue and turn
//     published events into signals after releasing the lock.
class PlaybackEngine : public QObject {
    Q_OBJECT

public:
    enum State { Stopped, Playing, Paused };
    Q_ENUM(State)

    PlaybackEngine(std::unique_ptr<IAudioOutput> output, DecoderFactory decoderFactory,
                   const EngineConfig& config, QObject* parent = nullptr);
    ~PlaybackEngine() override;

    State state() const { return m_state.load(std::memory_order_acquire); }
    bool isTransitioning() const { return m_transitioning.load(std::memory_order_acquire); }

    // Position of the audible track (the outgoing one while transitioning)
    int64_t positionFrames() const { return m_positionFrames.load(std::memory_order_acquire); }
    double position() const;
    int64_t durationFrames() const { return m_durationFrames.load(std::memory_order_acquire); }

    // Control thread only
    const QueueManager& queue() const { return m_queue; }
    TrackPtr currentTrack() const { return m_queue.current(); }

    float volume() const { return m_volume.load(std::memory_order_relaxed); }
    int crossfadeDurationMs() const { return m_crossfadeMs; }
    CrossfadeCurve crossfadeCurve() const { return m_curve; }
    int underrunCount() const { return m_underruns.load(std::memory_order_relaxed); }
    const EngineConfig& config() const { return m_config; }

    // Output callback. Always fills `frames` frames.
    int render(float* buf, int frames);

    // ── Transport ────────────────────────────────────────────────────
    PlaybackResult play();
    PlaybackResult pause();
    PlaybackResult togglePlayPause();
    PlaybackResult stop();
    PlaybackResult skip();
    PlaybackResult previous();
    PlaybackResult seekTo(double secs);
    PlaybackResult seekToFrame(int64_t frame);
    PlaybackResult playIndex(int index);

    // ── Modes ────────────────────────────────────────────────────────
    void setShuffle(bool enabled);
    void setRandomSeed(quint32 seed);
    void setRepeatMode(RepeatMode mode);
    void cycleRepeat();
    void setVolume(float vol);  // 0.0 - 1.0
    void setCrossfadeDuration(int ms);
    void setCrossfadeCurve(CrossfadeCurve curve);

    // Writes the user-adjustable modes (crossfade, shuffle, repeat,
    // volume) back to the preferences file.
    void savePreferences(Settings& settings) const;

    // ── Queue edits ──────────────────────────────────────────────────
    void setQueue(const QVector<TrackPtr>& tracks);
    void enqueue(const TrackPtr& track);
    void enqueue(const QVector<TrackPtr>& tracks);
    PlaybackResult insertAt(int index, const TrackPtr& track);
    PlaybackResult removeFromQueue(int index);
    PlaybackResult reorderQueue(int fromIndex, int toIndex);
    void clearQueue();

    // Drain events into signals, run deferred work, prepare the next
    // stream. Runs on a timer unless pollIntervalMs is 0.
    void poll();

signals:
    void stateChanged(PlaybackEngine::State state);
    void transitioningChanged(bool transitioning);
    void currentTrackChanged(const Track& track);
    void positionChanged(double secs);
    void decodeError(const Track& track, const QString& message);
    void queueChanged();
    void bufferUnderrun(int total);
    void queueExhausted();
    void errorOccurred(const QString& message);

private:
    using Lock = std::unique_lock<std::mutex>;

    // ── Render thread (session lock held) ────────────────────────────
    int64_t framesUntilTransition() const;
    void beginTransition();
    void renderTransition(float* out, int frames, int& done);
    bool renderCurrent(float* out, int frames, int& done);
    void abortTransitionLocked(bool keepOutgoing);
    void retire(std::unique_ptr<DecoderStream> stream);
    void pushCommit(quint64 entryId);
    void publishDecodeError(const DecoderStream& stream);

    // ── Control thread (session lock held) ───────────────────────────
    void syncQueueLocked();
    std::unique_ptr<DecoderStream> makeStream(const QueueManager::Entry& entry) const;
    bool openCurrentLocked(int64_t startFrame = 0);
    PlaybackResult advanceToPlayableLocked(bool bypassRepeatOne);
    PlaybackResult startTargetLocked();
    void closeAllStreamsLocked();
    void discardPreparedLocked();
    void validatePreparedLocked();
    void queueMutatedLocked();
    void stopLocked();
    void setStateLocked(State s);
    void setTransitioningLocked(bool on);
    void publish(EngineEvent::Type type, const TrackPtr& track = TrackPtr(),
                 const QString& message = QString(), int value = 0);
    void updatePositionLocked();
    int64_t prepareMarginFrames() const;
    bool nextStreamDueLocked() const;

    // ── Control thread (no lock held) ────────────────────────────────
    bool ensureOutputRunning();
    // Opens the queue successor once the current stream is near its end
    void ensureNextPrepared();
    void drainEvents();

    EngineConfig m_config;
    std::unique_ptr<IAudioOutput> m_output;
    DecoderFactory m_decoderFactory;
    bool m_outputOpen = false;

    QueueManager m_queue;

    std::mutex m_sessionMutex;
    PlaybackSession m_session;

    std::atomic<State> m_state{Stopped};
    std::atomic<bool> m_transitioning{false};
    std::atomic<int64_t> m_positionFrames{0};
    std::atomic<int64_t> m_durationFrames{0};
    std::atomic<float> m_volume{1.0f};
    std::atomic<int> m_underruns{0};
    int m_reportedUnderruns = 0;
    int m_reportedDroppedEvents = 0;
    int m_crossfadeMs = 0;
    CrossfadeCurve m_curve = CrossfadeCurve::Linear;

    QTimer* m_pollTimer = nullptr;
};
