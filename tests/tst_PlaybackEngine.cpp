#include <QtTest/QtTest>
#include <QElapsedTimer>
#include <QSet>
#include <QTemporaryDir>
#include <cmath>
#include <functional>
#include <memory>

#include "FakeDecoder.h"
#include "ManualAudioOutput.h"
#include "NullAudioOutput.h"
#include "PlaybackEngine.h"
#include "Settings.h"

// 1 kHz mono keeps frame arithmetic readable: 1000 frames == 1 s
static EngineConfig testConfig(int crossfadeMs = 0)
{
    EngineConfig c;
    c.sampleRate = 1000;
    c.channels = 1;
    c.bufferFrames = 1000;
    c.crossfadeMs = crossfadeMs;
    c.lookaheadFrames = 1000;
    c.decodeBlockFrames = 100;
    c.threadedDecode = false;
    c.pollIntervalMs = 0;
    c.volume = 1.0f;
    return c;
}

static FakeDecoder::Script constant(int64_t frames, float value)
{
    FakeDecoder::Script s;
    s.totalFrames = frames;
    s.value = value;
    return s;
}

static bool near(float a, float b, float eps = 1e-4f)
{
    return std::fabs(a - b) < eps;
}

// Engine wired to a manually clocked output; run() stands in for the
// device callback plus the poll timer.
struct Harness {
    FakeDecoderLibrary lib;
    ManualAudioOutput* out = nullptr;
    std::unique_ptr<PlaybackEngine> engine;

    void start(const EngineConfig& config)
    {
        auto output = std::make_unique<ManualAudioOutput>();
        output->capture = true;
        out = output.get();
        engine = std::make_unique<PlaybackEngine>(std::move(output), lib.factory(), config);
    }

    void queue(const QStringList& ids)
    {
        QVector<TrackPtr> tracks;
        for (const QString& id : ids)
            tracks.append(lib.track(id));
        engine->setQueue(tracks);
    }

    void run(int64_t frames)
    {
        while (frames > 0) {
            const int64_t n = std::min<int64_t>(1000, frames);
            out->tick(n);
            engine->poll();
            frames -= n;
        }
    }

    // For threaded decoding: polls until the worker has caught up
    bool pollUntil(const std::function<bool()>& done, int timeoutMs = 5000)
    {
        QElapsedTimer timer;
        timer.start();
        while (!done()) {
            if (timer.elapsed() > timeoutMs)
                return false;
            QTest::qWait(2);
            engine->poll();
        }
        return true;
    }

    QString current() const
    {
        TrackPtr t = engine->currentTrack();
        return t ? t->id : QString();
    }

    float sampleAt(int64_t frame) const { return out->captured.at(size_t(frame)); }
};

class tst_PlaybackEngine : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        qRegisterMetaType<Track>();
        qRegisterMetaType<PlaybackEngine::State>();
    }

    // ── Transport basics ─────────────────────────────────────────
    void play_emptyQueue_fails()
    {
        Harness h;
        h.start(testConfig());
        PlaybackResult r = h.engine->play();
        QCOMPARE(r.error, PlaybackError::QueueEmpty);
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
    }

    void play_startsFromFirstTrack()
    {
        Harness h;
        h.lib.add("A", constant(5000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});

        QSignalSpy stateSpy(h.engine.get(), &PlaybackEngine::stateChanged);
        QVERIFY(h.engine->play().ok());
        QCOMPARE(h.engine->state(), PlaybackEngine::Playing);
        QCOMPARE(stateSpy.count(), 1);
        QVERIFY(h.out->isRunning());

        h.run(2000);
        QCOMPARE(h.engine->positionFrames(), int64_t(2000));
        QCOMPARE(h.engine->durationFrames(), int64_t(5000));
        QVERIFY(near(h.sampleAt(1999), 0.5f));
    }

    void play_outputUnavailable_fails()
    {
        Harness h;
        h.lib.add("A", constant(5000, 0.5f));
        h.start(testConfig());
        h.out->failOpen = true;
        h.queue({"A"});

        PlaybackResult r = h.engine->play();
        QCOMPARE(r.error, PlaybackError::OutputFailed);
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
    }

    void pause_freezesPosition()
    {
        Harness h;
        h.lib.add("A", constant(5000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();
        h.run(1000);

        QVERIFY(h.engine->pause().ok());
        QCOMPARE(h.engine->state(), PlaybackEngine::Paused);
        h.run(2000);
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));
        QCOMPARE(h.sampleAt(2500), 0.0f);

        QVERIFY(h.engine->togglePlayPause().ok());
        QCOMPARE(h.engine->state(), PlaybackEngine::Playing);
        h.run(1000);
        QCOMPARE(h.engine->positionFrames(), int64_t(2000));
    }

    void pause_whenStopped_fails()
    {
        Harness h;
        h.start(testConfig());
        QCOMPARE(h.engine->pause().error, PlaybackError::NoActiveStream);
    }

    void stop_closesStreams()
    {
        Harness h;
        h.lib.add("A", constant(5000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();
        h.run(1000);

        QVERIFY(h.engine->stop().ok());
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
        QCOMPARE(h.engine->positionFrames(), int64_t(0));
        QVERIFY(!h.out->isRunning());
        QCOMPARE(h.current(), QStringLiteral("A"));
    }

    void volume_scalesAndClips()
    {
        Harness h;
        h.lib.add("A", constant(5000, 0.8f));
        h.lib.add("L", constant(5000, 1.5f));
        h.start(testConfig());
        h.queue({"A", "L"});
        h.engine->setVolume(0.5f);
        h.engine->play();
        h.run(1000);
        QVERIFY(near(h.sampleAt(500), 0.4f));

        h.engine->setVolume(3.0f);
        QCOMPARE(h.engine->volume(), 1.0f);
        h.engine->skip();
        h.run(1000);
        QCOMPARE(h.sampleAt(1500), 1.0f);
    }

    // ── Gapless ──────────────────────────────────────────────────
    void gapless_handoverWithoutSilence()
    {
        Harness h;
        h.lib.add("A", constant(3000, 0.8f));
        h.lib.add("B", constant(3000, 0.4f));
        h.start(testConfig());
        h.queue({"A", "B"});

        QSignalSpy trackSpy(h.engine.get(), &PlaybackEngine::currentTrackChanged);
        h.engine->play();
        h.run(4000);

        QVERIFY(near(h.sampleAt(2999), 0.8f));
        QVERIFY(near(h.sampleAt(3000), 0.4f));
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));
        QCOMPARE(h.engine->queue().history(), QVector<int>({0}));
        QCOMPARE(trackSpy.count(), 1);
        QCOMPARE(trackSpy.at(0).at(0).value<Track>().id, QStringLiteral("B"));
    }

    void endOfQueue_stopsAndReports()
    {
        Harness h;
        h.lib.add("A", constant(2000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});

        QSignalSpy exhaustedSpy(h.engine.get(), &PlaybackEngine::queueExhausted);
        h.engine->play();
        h.run(3000);

        QCOMPARE(exhaustedSpy.count(), 1);
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
        QVERIFY(!h.out->isRunning());
    }

    // ── Crossfade ────────────────────────────────────────────────
    void crossfade_startsAndCompletesOnSchedule()
    {
        // A = 180 s, B = 200 s, T = 5 s
        Harness h;
        h.lib.add("A", constant(180000, 0.8f));
        h.lib.add("B", constant(200000, 0.4f));
        h.start(testConfig(5000));
        h.queue({"A", "B"});

        QSignalSpy xfSpy(h.engine.get(), &PlaybackEngine::transitioningChanged);
        QVERIFY(h.engine->play().ok());

        h.run(174000);
        QVERIFY(!h.engine->isTransitioning());

        h.run(1000);
        QCOMPARE(h.engine->positionFrames(), int64_t(175000));
        QVERIFY(h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(xfSpy.count(), 1);
        QCOMPARE(xfSpy.at(0).at(0).toBool(), true);

        h.run(5000);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->queue().history(), QVector<int>({0}));
        QCOMPARE(h.engine->positionFrames(), int64_t(5000));
        QCOMPARE(xfSpy.count(), 2);

        // Linear envelope: full A before, even mix halfway, nearly all B at the end
        QVERIFY(near(h.sampleAt(174999), 0.8f));
        QVERIFY(near(h.sampleAt(177500), 0.6f));
        QVERIFY(near(h.sampleAt(179999), 0.4f, 1e-3f));
    }

    void crossfade_equalPowerCurve()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.lib.add("B", constant(10000, 0.5f));
        EngineConfig c = testConfig(2000);
        c.curve = CrossfadeCurve::EqualPower;
        h.start(c);
        h.queue({"A", "B"});
        h.engine->play();
        h.run(10000);

        // cos(pi/4) * 0.5 + sin(pi/4) * 0.5
        QVERIFY(near(h.sampleAt(9000), float(std::sqrt(2.0) * 0.5)));
        QCOMPARE(h.current(), QStringLiteral("B"));
    }

    void crossfade_clampedToShortIncomingTrack()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(1000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});

        QSignalSpy exhaustedSpy(h.engine.get(), &PlaybackEngine::queueExhausted);
        h.engine->play();
        h.run(8000);
        QVERIFY(!h.engine->isTransitioning());
        h.run(1000);
        QVERIFY(h.engine->isTransitioning());

        h.run(1000);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));
        QCOMPARE(exhaustedSpy.count(), 0);

        h.run(1000);
        QCOMPARE(exhaustedSpy.count(), 1);
    }

    void crossfade_outgoingEndsEarly_incomingAtFullGain()
    {
        // A claims 10 s but holds 9.5 s
        Harness h;
        FakeDecoder::Script a = constant(9500, 0.8f);
        a.reportedFrames = 10000;
        h.lib.add("A", a);
        h.lib.add("B", constant(10000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();

        h.run(9000);
        QVERIFY(h.engine->isTransitioning());
        h.run(1000);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(2000));
        QVERIFY(near(h.sampleAt(9400), 0.52f));
        QVERIFY(near(h.sampleAt(9600), 0.4f));
    }

    void crossfade_durationClamped()
    {
        Harness h;
        h.start(testConfig());
        h.engine->setCrossfadeDuration(60000);
        QCOMPARE(h.engine->crossfadeDurationMs(), 12000);
        h.engine->setCrossfadeDuration(-1);
        QCOMPARE(h.engine->crossfadeDurationMs(), 0);
    }

    void crossfadeSetToZero_midTransition_cancelsToOutgoing()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();
        h.run(8500);
        QVERIFY(h.engine->isTransitioning());

        QSignalSpy xfSpy(h.engine.get(), &PlaybackEngine::transitioningChanged);
        h.engine->setCrossfadeDuration(0);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(xfSpy.count(), 1);
        QCOMPARE(xfSpy.at(0).at(0).toBool(), false);
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->positionFrames(), int64_t(8500));

        // A finishes at full gain, then B follows without a gap
        h.run(2500);
        QVERIFY(near(h.sampleAt(8600), 0.8f));
        QVERIFY(near(h.sampleAt(9999), 0.8f));
        QVERIFY(near(h.sampleAt(10000), 0.4f));
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));
        QCOMPARE(h.engine->queue().history(), QVector<int>({0}));
    }

    void crossfadeChanged_midTransition_keepsWindow()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();
        h.run(8500);

        h.engine->setCrossfadeDuration(5000);
        QVERIFY(h.engine->isTransitioning());
        h.run(1500);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(2000));
    }

    void pause_midTransition_resumesAtSamePoint()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();
        h.run(8500);
        QVERIFY(h.engine->isTransitioning());

        h.engine->pause();
        h.run(3000);
        QVERIFY(h.engine->isTransitioning());
        QCOMPARE(h.engine->positionFrames(), int64_t(8500));

        h.engine->play();
        h.run(1000);
        QVERIFY(h.engine->isTransitioning());
        h.run(500);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1500));
    }

    // ── Repeat ───────────────────────────────────────────────────
    void repeatOne_replaysSameTrack()
    {
        Harness h;
        h.lib.add("A", constant(2000, 0.5f));
        h.lib.add("B", constant(2000, 0.5f));
        EngineConfig c = testConfig();
        c.repeat = RepeatMode::One;
        h.start(c);
        h.queue({"A", "B"});
        h.engine->play();

        h.run(3000);
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));
        QCOMPARE(h.engine->queue().history(), QVector<int>({0}));
    }

    void repeatOne_crossfadesIntoItself()
    {
        Harness h;
        h.lib.add("A", constant(5000, 0.5f));
        EngineConfig c = testConfig(1000);
        c.repeat = RepeatMode::One;
        h.start(c);
        h.queue({"A"});
        h.engine->play();

        h.run(4000);
        QVERIFY(h.engine->isTransitioning());
        h.run(1000);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));
        QCOMPARE(h.engine->queue().historySize(), 1);
    }

    void repeatOne_skipStillMovesOn()
    {
        Harness h;
        h.lib.add("A", constant(5000, 0.5f));
        h.lib.add("B", constant(5000, 0.5f));
        EngineConfig c = testConfig();
        c.repeat = RepeatMode::One;
        h.start(c);
        h.queue({"A", "B"});
        h.engine->play();
        QVERIFY(h.engine->skip().ok());
        QCOMPARE(h.current(), QStringLiteral("B"));
    }

    void repeatAll_wrapsToFirst()
    {
        Harness h;
        h.lib.add("A", constant(1000, 0.5f));
        h.lib.add("B", constant(1000, 0.5f));
        h.start(testConfig());
        h.queue({"A", "B"});
        h.engine->setRepeatMode(RepeatMode::All);
        h.engine->play();
        h.run(3000);
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->state(), PlaybackEngine::Playing);
    }

    void cycleRepeat_followsOrder()
    {
        Harness h;
        h.start(testConfig());
        h.engine->cycleRepeat();
        QCOMPARE(h.engine->queue().repeatMode(), RepeatMode::All);
        h.engine->cycleRepeat();
        QCOMPARE(h.engine->queue().repeatMode(), RepeatMode::One);
        h.engine->cycleRepeat();
        QCOMPARE(h.engine->queue().repeatMode(), RepeatMode::Off);
    }

    void cycleRepeat_appliesToPlayback()
    {
        Harness h;
        h.lib.add("A", constant(2000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();

        QSignalSpy queueSpy(h.engine.get(), &PlaybackEngine::queueChanged);
        QSignalSpy exhaustedSpy(h.engine.get(), &PlaybackEngine::queueExhausted);
        h.engine->cycleRepeat();
        QCOMPARE(queueSpy.count(), 1);

        h.run(3000);
        QCOMPARE(exhaustedSpy.count(), 0);
        QCOMPARE(h.engine->state(), PlaybackEngine::Playing);
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));
    }

    // ── Skip / previous ──────────────────────────────────────────
    void skip_midTransition_isHardCut()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.lib.add("C", constant(10000, 0.2f));
        h.start(testConfig(2000));
        h.queue({"A", "B", "C"});
        h.engine->play();
        h.run(9000);
        QVERIFY(h.engine->isTransitioning());

        QVERIFY(h.engine->skip().ok());
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(0));

        h.run(500);
        QVERIFY(near(h.sampleAt(9000), 0.4f));
        QCOMPARE(h.engine->positionFrames(), int64_t(500));
    }

    void skip_rapidSequence()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.lib.add("B", constant(10000, 0.5f));
        h.lib.add("C", constant(10000, 0.5f));
        h.start(testConfig(2000));
        h.queue({"A", "B", "C"});
        h.engine->play();

        QVERIFY(h.engine->skip().ok());
        QVERIFY(h.engine->skip().ok());
        QCOMPARE(h.current(), QStringLiteral("C"));
        QCOMPARE(h.engine->queue().history(), QVector<int>({0, 1}));
        QCOMPARE(h.engine->skip().error, PlaybackError::EndOfQueue);
        QCOMPARE(h.current(), QStringLiteral("C"));
    }

    void previous_restoresPriorTrack()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.lib.add("B", constant(10000, 0.5f));
        h.start(testConfig());
        h.queue({"A", "B"});
        h.engine->play();
        h.engine->skip();
        h.run(2000);

        QVERIFY(h.engine->previous().ok());
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->positionFrames(), int64_t(0));
        QCOMPARE(h.engine->queue().historySize(), 0);
    }

    void previous_emptyHistory_restartsCurrent()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.lib.add("B", constant(10000, 0.5f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();
        h.run(9000);
        QVERIFY(h.engine->isTransitioning());

        QVERIFY(h.engine->previous().ok());
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->queue().currentIndex(), 0);
        QCOMPARE(h.engine->positionFrames(), int64_t(0));
    }

    void playIndex_jumps()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.lib.add("B", constant(10000, 0.5f));
        h.lib.add("C", constant(10000, 0.5f));
        h.start(testConfig());
        h.queue({"A", "B", "C"});

        QVERIFY(h.engine->playIndex(2).ok());
        QCOMPARE(h.engine->state(), PlaybackEngine::Playing);
        QCOMPARE(h.current(), QStringLiteral("C"));
        QCOMPARE(h.engine->playIndex(3).error, PlaybackError::InvalidIndex);
    }

    // ── Seek ─────────────────────────────────────────────────────
    void seek_clampsBeyondDuration()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();

        QVERIFY(h.engine->seekTo(2.5).ok());
        QCOMPARE(h.engine->positionFrames(), int64_t(2500));
        QVERIFY(h.engine->seekToFrame(50000).ok());
        QCOMPARE(h.engine->positionFrames(), int64_t(10000));
    }

    void seek_unknownDuration_fails()
    {
        Harness h;
        FakeDecoder::Script s = constant(10000, 0.5f);
        s.reportedFrames = 0;
        h.lib.add("A", s);
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();
        QCOMPARE(h.engine->seekToFrame(500).error, PlaybackError::UnknownDuration);
    }

    void seek_withoutStream_fails()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        QCOMPARE(h.engine->seekToFrame(500).error, PlaybackError::NoActiveStream);
    }

    void seek_midTransition_abortsAndKeepsCurrent()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();
        h.run(9000);
        QVERIFY(h.engine->isTransitioning());

        QSignalSpy xfSpy(h.engine.get(), &PlaybackEngine::transitioningChanged);
        QVERIFY(h.engine->seekToFrame(1000).ok());
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(xfSpy.count(), 1);
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));

        h.run(500);
        QVERIFY(near(h.sampleAt(9200), 0.8f));
    }

    // ── Decode errors ────────────────────────────────────────────
    void decodeError_onPrepare_skipsCandidate()
    {
        Harness h;
        h.lib.add("A", constant(2000, 0.5f));
        FakeDecoder::Script bad;
        bad.failOpen = true;
        h.lib.add("B", bad);
        h.lib.add("C", constant(2000, 0.5f));
        h.start(testConfig());
        h.queue({"A", "B", "C"});

        QSignalSpy errSpy(h.engine.get(), &PlaybackEngine::decodeError);
        h.engine->play();
        QCOMPARE(errSpy.count(), 1);
        QCOMPARE(errSpy.at(0).at(0).value<Track>().id, QStringLiteral("B"));

        h.run(3000);
        QCOMPARE(h.current(), QStringLiteral("C"));
        QCOMPARE(h.engine->queue().history(), QVector<int>({0}));
        QCOMPARE(errSpy.count(), 1);
    }

    void decodeError_onIncomingDuringTransition_staysOnOutgoing()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        FakeDecoder::Script b = constant(10000, 0.4f);
        b.failAtFrame = 1000;
        h.lib.add("B", b);
        h.lib.add("C", constant(10000, 0.2f));
        h.start(testConfig(2000));
        h.queue({"A", "B", "C"});

        QSignalSpy errSpy(h.engine.get(), &PlaybackEngine::decodeError);
        h.engine->play();
        h.run(9000);
        QVERIFY(h.engine->isTransitioning());

        h.run(1000);
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(errSpy.count(), 1);
        QCOMPARE(errSpy.at(0).at(0).value<Track>().id, QStringLiteral("B"));
        // Outgoing carried on at full gain
        QVERIFY(near(h.sampleAt(9500), 0.8f));

        h.run(1000);
        QCOMPARE(h.current(), QStringLiteral("C"));
        QVERIFY(near(h.sampleAt(10000), 0.2f));
        QCOMPARE(h.engine->queue().history(), QVector<int>({0}));
    }

    void decodeError_midStream_switchesToPrepared()
    {
        Harness h;
        // B is opened 2 s before A's end, so A fails with B ready
        FakeDecoder::Script a = constant(5000, 0.8f);
        a.failAtFrame = 3500;
        h.lib.add("A", a);
        h.lib.add("B", constant(5000, 0.4f));
        h.start(testConfig());
        h.queue({"A", "B"});

        QSignalSpy errSpy(h.engine.get(), &PlaybackEngine::decodeError);
        h.engine->play();
        h.run(4000);
        QCOMPARE(errSpy.count(), 1);
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(500));
        QVERIFY(near(h.sampleAt(3499), 0.8f));
        QVERIFY(near(h.sampleAt(3600), 0.4f));
    }

    void decodeError_soleStream_stops()
    {
        Harness h;
        FakeDecoder::Script a = constant(5000, 0.8f);
        a.failAtFrame = 500;
        h.lib.add("A", a);
        h.start(testConfig());
        h.queue({"A"});

        QSignalSpy errSpy(h.engine.get(), &PlaybackEngine::decodeError);
        QSignalSpy exhaustedSpy(h.engine.get(), &PlaybackEngine::queueExhausted);
        h.engine->play();
        h.run(1000);
        QCOMPARE(errSpy.count(), 1);
        QCOMPARE(exhaustedSpy.count(), 1);
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
    }

    void decodeError_everyTrack_reportsFailure()
    {
        Harness h;
        FakeDecoder::Script bad;
        bad.failOpen = true;
        h.lib.add("A", bad);
        h.lib.add("B", bad);
        h.lib.add("C", bad);
        h.start(testConfig());
        h.queue({"A", "B", "C"});
        h.engine->setRepeatMode(RepeatMode::All);

        QSignalSpy errSpy(h.engine.get(), &PlaybackEngine::decodeError);
        QSignalSpy failSpy(h.engine.get(), &PlaybackEngine::errorOccurred);
        PlaybackResult r = h.engine->play();
        QCOMPARE(r.error, PlaybackError::DecodeFailed);
        QCOMPARE(failSpy.count(), 1);
        QCOMPARE(errSpy.count(), 4);
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
    }

    // ── Queue edits ──────────────────────────────────────────────
    void remove_current_playsNext()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.lib.add("B", constant(10000, 0.5f));
        h.lib.add("C", constant(10000, 0.5f));
        h.start(testConfig());
        h.queue({"A", "B", "C"});
        h.engine->play();
        h.run(3000);

        QSignalSpy queueSpy(h.engine.get(), &PlaybackEngine::queueChanged);
        QVERIFY(h.engine->removeFromQueue(0).ok());
        QCOMPARE(queueSpy.count(), 1);
        QCOMPARE(h.engine->queue().size(), 2);
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(0));
        QCOMPARE(h.engine->state(), PlaybackEngine::Playing);
    }

    void remove_currentMidTransition_finishesOnIncoming()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();
        h.run(9000);
        QVERIFY(h.engine->isTransitioning());

        QVERIFY(h.engine->removeFromQueue(0).ok());
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->positionFrames(), int64_t(1000));

        h.run(1000);
        QVERIFY(near(h.sampleAt(9500), 0.4f));
        QCOMPARE(h.engine->positionFrames(), int64_t(2000));
    }

    void remove_incomingMidTransition_abortsToOutgoing()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.lib.add("C", constant(10000, 0.2f));
        h.start(testConfig(2000));
        h.queue({"A", "B", "C"});
        h.engine->play();
        h.run(9000);
        QVERIFY(h.engine->isTransitioning());

        QVERIFY(h.engine->removeFromQueue(1).ok());
        QVERIFY(!h.engine->isTransitioning());
        QCOMPARE(h.current(), QStringLiteral("A"));
        QCOMPARE(h.engine->positionFrames(), int64_t(9000));

        h.run(1000);
        h.run(1000);
        QCOMPARE(h.current(), QStringLiteral("C"));
    }

    void remove_onlyTrack_stops()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();
        h.run(1000);

        QVERIFY(h.engine->removeFromQueue(0).ok());
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
        QVERIFY(h.engine->queue().isEmpty());
        QVERIFY(!h.engine->isTransitioning());
    }

    void remove_invalidIndex_fails()
    {
        Harness h;
        h.lib.add("A", constant(10000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        QCOMPARE(h.engine->removeFromQueue(4).error, PlaybackError::InvalidIndex);
        QCOMPARE(h.engine->reorderQueue(0, 4).error, PlaybackError::InvalidIndex);
    }

    void reorder_changesWhatPlaysNext()
    {
        Harness h;
        h.lib.add("A", constant(2000, 0.5f));
        h.lib.add("B", constant(2000, 0.5f));
        h.lib.add("C", constant(2000, 0.5f));
        h.start(testConfig());
        h.queue({"A", "B", "C"});
        h.engine->play();

        QVERIFY(h.engine->reorderQueue(2, 1).ok());
        h.run(3000);
        QCOMPARE(h.current(), QStringLiteral("C"));
    }

    void enqueue_extendsPlayback()
    {
        Harness h;
        h.lib.add("A", constant(2000, 0.5f));
        h.lib.add("B", constant(2000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();
        h.engine->enqueue(h.lib.track("B"));
        QCOMPARE(h.engine->queue().size(), 2);
        h.run(3000);
        QCOMPARE(h.current(), QStringLiteral("B"));

        QVERIFY(h.engine->insertAt(0, h.lib.track("A")).ok());
        QCOMPARE(h.engine->insertAt(9, h.lib.track("A")).error, PlaybackError::InvalidIndex);
    }

    void clearQueue_stops()
    {
        Harness h;
        h.lib.add("A", constant(2000, 0.5f));
        h.start(testConfig());
        h.queue({"A"});
        h.engine->play();
        h.engine->clearQueue();
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
        QVERIFY(h.engine->queue().isEmpty());
        QVERIFY(!h.engine->currentTrack());
    }

    // ── Shuffle ──────────────────────────────────────────────────
    void shuffle_playsEveryTrackOnce()
    {
        Harness h;
        const QStringList ids = {"A", "B", "C", "D", "E"};
        for (const QString& id : ids)
            h.lib.add(id, constant(1000, 0.5f));
        h.start(testConfig());
        h.engine->setRandomSeed(99);
        h.queue(ids);
        h.engine->setShuffle(true);

        QSet<QString> played;
        played.insert(h.current());
        QSignalSpy trackSpy(h.engine.get(), &PlaybackEngine::currentTrackChanged);
        QSignalSpy exhaustedSpy(h.engine.get(), &PlaybackEngine::queueExhausted);
        h.engine->play();
        h.run(8000);

        for (const QList<QVariant>& args : trackSpy)
            played.insert(args.at(0).value<Track>().id);
        QCOMPARE(played.size(), 5);
        QCOMPARE(trackSpy.count(), 4);
        QCOMPARE(exhaustedSpy.count(), 1);
    }

    // ── Next-stream preparation ──────────────────────────────────
    void nextTrack_openedOnlyNearEnd()
    {
        // T = 2 s plus 2 s of lookahead and buffering: B opens at A's 6 s mark
        Harness h;
        h.lib.add("A", constant(10000, 0.8f));
        h.lib.add("B", constant(10000, 0.4f));
        h.start(testConfig(2000));
        h.queue({"A", "B"});
        h.engine->play();
        QCOMPARE(h.lib.decodersCreated("A"), 1);
        QCOMPARE(h.lib.decodersCreated("B"), 0);

        h.run(5000);
        QCOMPARE(h.lib.decodersCreated("B"), 0);

        h.run(1000);
        QCOMPARE(h.lib.decodersCreated("B"), 1);

        h.run(4000);
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.lib.decodersCreated("B"), 1);
        QVERIFY(near(h.sampleAt(8000), 0.8f));
        QVERIFY(near(h.sampleAt(9000), 0.6f));
    }

    void nextTrack_unknownLength_openedOnceDecoderIsDone()
    {
        Harness h;
        FakeDecoder::Script a = constant(6000, 0.8f);
        a.reportedFrames = 0;
        h.lib.add("A", a);
        h.lib.add("B", constant(3000, 0.4f));
        EngineConfig c = testConfig();
        c.threadedDecode = true;
        c.lookaheadFrames = 4000;
        h.start(c);
        h.queue({"A", "B"});
        h.engine->play();

        // The lookahead holds 4 s of A; its decoder has not reached the end
        QCOMPARE(h.lib.decodersCreated("B"), 0);

        // Once a block is free the worker reads past the last frame
        h.run(3000);
        QVERIFY(h.pollUntil([&h] { return h.lib.decodersCreated("B") == 1; }));

        h.run(4000);
        QCOMPARE(h.current(), QStringLiteral("B"));
        QVERIFY(near(h.sampleAt(5999), 0.8f));
        QVERIFY(near(h.sampleAt(6000), 0.4f));
    }

    // ── Notifications ────────────────────────────────────────────
    void eventChannel_countsDropsWhenFull()
    {
        EventChannel channel;
        for (int i = 0; i < EventChannel::kCapacity; ++i) {
            EngineEvent e;
            e.value = i;
            QVERIFY(channel.publish(std::move(e)));
        }
        EngineEvent extra;
        QVERIFY(!channel.publish(std::move(extra)));
        QCOMPARE(channel.dropped(), 1);

        std::vector<EngineEvent> events;
        channel.takeAll(events);
        QCOMPARE(int(events.size()), EventChannel::kCapacity);
        QCOMPARE(events.front().value, 0);
        QCOMPARE(events.back().value, EventChannel::kCapacity - 1);
        QVERIFY(channel.isEmpty());
        QCOMPARE(channel.dropped(), 1);
    }

    void droppedNotifications_areLogged()
    {
        // Every candidate fails inside one command: two events per track
        Harness h;
        FakeDecoder::Script bad;
        bad.failOpen = true;
        QStringList ids;
        for (int i = 0; i < 40; ++i) {
            const QString id = QStringLiteral("T%1").arg(i);
            h.lib.add(id, bad);
            ids << id;
        }
        h.start(testConfig());
        h.queue(ids);

        QSignalSpy errSpy(h.engine.get(), &PlaybackEngine::decodeError);
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Event channel full")));
        PlaybackResult r = h.engine->play();
        QCOMPARE(r.error, PlaybackError::EndOfQueue);
        QCOMPARE(h.engine->state(), PlaybackEngine::Stopped);
        QVERIFY(errSpy.count() < 40);
    }

    // ── Preferences ──────────────────────────────────────────────
    void savePreferences_writesModes()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        Settings settings(dir.filePath(QStringLiteral("prefs.ini")));

        Harness h;
        h.start(testConfig());
        h.engine->setCrossfadeDuration(4000);
        h.engine->setCrossfadeCurve(CrossfadeCurve::EqualPower);
        h.engine->setShuffle(true);
        h.engine->cycleRepeat();
        h.engine->setVolume(0.4f);

        QSignalSpy xfSpy(&settings, &Settings::crossfadeChanged);
        h.engine->savePreferences(settings);
        QCOMPARE(xfSpy.count(), 1);
        QCOMPARE(settings.crossfadeDurationMs(), 4000);
        QCOMPARE(settings.crossfadeCurve(), QStringLiteral("equalPower"));
        QVERIFY(settings.shuffleEnabled());
        QCOMPARE(settings.repeatMode(), int(RepeatMode::All));
        QCOMPARE(settings.volume(), 40);

        EngineConfig c = EngineConfig::fromSettings(settings);
        QCOMPARE(c.crossfadeMs, 4000);
        QCOMPARE(c.curve, CrossfadeCurve::EqualPower);
    }

    // ── Threaded decoding ────────────────────────────────────────
    void threadedDecode_gaplessHandover()
    {
        Harness h;
        h.lib.add("A", constant(3000, 0.8f));
        h.lib.add("B", constant(3000, 0.4f));
        EngineConfig c = testConfig();
        c.threadedDecode = true;
        c.lookaheadFrames = 4000;  // whole tracks fit in the lookahead
        h.start(c);
        h.queue({"A", "B"});
        h.engine->play();

        h.run(4000);
        QCOMPARE(h.current(), QStringLiteral("B"));
        QCOMPARE(h.engine->underrunCount(), 0);
        QVERIFY(near(h.sampleAt(2999), 0.8f));
        QVERIFY(near(h.sampleAt(3000), 0.4f));
    }

    void nullOutput_playsToEnd()
    {
        FakeDecoderLibrary lib;
        lib.add("A", constant(300, 0.5f));
        lib.add("B", constant(300, 0.5f));
        EngineConfig c = testConfig();
        c.bufferFrames = 100;
        c.threadedDecode = true;
        c.pollIntervalMs = 10;

        PlaybackEngine engine(std::make_unique<NullAudioOutput>(), lib.factory(), c);
        QSignalSpy exhaustedSpy(&engine, &PlaybackEngine::queueExhausted);
        engine.setQueue({lib.track("A"), lib.track("B")});
        QVERIFY(engine.play().ok());

        QTRY_COMPARE_WITH_TIMEOUT(exhaustedSpy.count(), 1, 10000);
        QCOMPARE(engine.currentTrack()->id, QStringLiteral("B"));
        QCOMPARE(engine.state(), PlaybackEngine::Stopped);
    }
};

QTEST_MAIN(tst_PlaybackEngine)
#include "tst_PlaybackEngine.moc"
