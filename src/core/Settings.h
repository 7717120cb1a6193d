#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

// Persisted preferences (INI). Values are validated on read so a
// hand-edited file can never hand the engine an out-of-range value.
class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // Tests and tools point this at a scratch file
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    QString fileName() const { return m_settings.fileName(); }
    void sync() { m_settings.sync(); }

    // ── Audio ────────────────────────────────────────────────────────
    int volume() const;                 // 0..100
    void setVolume(int vol);

    int sampleRate() const;
    void setSampleRate(int rate);

    int channels() const;
    void setChannels(int channels);

    int bufferFrames() const;
    void setBufferFrames(int frames);

    // ── Transitions ──────────────────────────────────────────────────
    static constexpr int kMaxCrossfadeMs = 12000;

    int crossfadeDurationMs() const;    // 0..kMaxCrossfadeMs, 0 = gapless
    void setCrossfadeDurationMs(int ms);

    // "linear" or "equalPower"
    QString crossfadeCurve() const;
    void setCrossfadeCurve(const QString& curve);

    bool gaplessPlayback() const;
    void setGaplessPlayback(bool enabled);

    // ── Queue ────────────────────────────────────────────────────────
    bool shuffleEnabled() const;
    void setShuffleEnabled(bool enabled);

    int repeatMode() const;             // 0=Off, 1=All, 2=One
    void setRepeatMode(int mode);

    int historyDepth() const;
    void setHistoryDepth(int depth);

    // ── Buffering ────────────────────────────────────────────────────
    int lookaheadMs() const;
    void setLookaheadMs(int ms);

    // "silence" or "repeat"
    QString underrunPolicy() const;
    void setUnderrunPolicy(const QString& policy);

signals:
    void volumeChanged(int volume);
    void crossfadeChanged(int ms);
    void shuffleChanged(bool enabled);
    void repeatChanged(int mode);

private:
    explicit Settings(QObject* parent = nullptr);
    static QString settingsPath();

    QSettings m_settings;
};
