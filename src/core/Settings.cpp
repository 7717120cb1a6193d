#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <algorithm>

// ── Settings INI path ───────────────────────────────────────────────
// <GenericDataLocation>/Segue/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/Segue"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

// ── Constructors ────────────────────────────────────────────────────
Settings::Settings(QObject* parent)
    : Settings(settingsPath(), parent)
{
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Volume ──────────────────────────────────────────────────────────
int Settings::volume() const
{
    return std::clamp(m_settings.value(QStringLiteral("audio/volume"), 75).toInt(), 0, 100);
}

void Settings::setVolume(int vol)
{
    vol = std::clamp(vol, 0, 100);
    m_settings.setValue(QStringLiteral("audio/volume"), vol);
    emit volumeChanged(vol);
}

// ── Output format ───────────────────────────────────────────────────
int Settings::sampleRate() const
{
    int rate = m_settings.value(QStringLiteral("audio/sampleRate"), 44100).toInt();
    return rate > 0 ? rate : 44100;
}

void Settings::setSampleRate(int rate)
{
    if (rate <= 0) rate = 44100;
    m_settings.setValue(QStringLiteral("audio/sampleRate"), rate);
}

int Settings::channels() const
{
    return std::clamp(m_settings.value(QStringLiteral("audio/channels"), 2).toInt(), 1, 8);
}

void Settings::setChannels(int channels)
{
    channels = std::clamp(channels, 1, 8);
    m_settings.setValue(QStringLiteral("audio/channels"), channels);
}

int Settings::bufferFrames() const
{
    int frames = m_settings.value(QStringLiteral("audio/bufferFrames"), 1024).toInt();
    return frames > 0 ? frames : 1024;
}

void Settings::setBufferFrames(int frames)
{
    if (frames <= 0) frames = 1024;
    m_settings.setValue(QStringLiteral("audio/bufferFrames"), frames);
}

// ── Crossfade ───────────────────────────────────────────────────────
int Settings::crossfadeDurationMs() const
{
    int ms = m_settings.value(QStringLiteral("playback/crossfadeDurationMs"), 0).toInt();
    return std::clamp(ms, 0, kMaxCrossfadeMs);
}

void Settings::setCrossfadeDurationMs(int ms)
{
    ms = std::clamp(ms, 0, kMaxCrossfadeMs);
    m_settings.setValue(QStringLiteral("playback/crossfadeDurationMs"), ms);
    qDebug() << "[Settings] Crossfade duration" << ms << "ms";
    emit crossfadeChanged(ms);
}

QString Settings::crossfadeCurve() const
{
    QString curve = m_settings.value(QStringLiteral("playback/crossfadeCurve"),
                                     QStringLiteral("linear")).toString();
    return curve == QStringLiteral("equalPower") ? curve : QStringLiteral("linear");
}

void Settings::setCrossfadeCurve(const QString& curve)
{
    const QString n = curve.trimmed().toLower();
    const bool equalPower = n == QStringLiteral("equalpower") || n == QStringLiteral("equal-power");
    m_settings.setValue(QStringLiteral("playback/crossfadeCurve"),
                        equalPower ? QStringLiteral("equalPower") : QStringLiteral("linear"));
}

// ── Gapless Playback ────────────────────────────────────────────────
bool Settings::gaplessPlayback() const
{
    return m_settings.value(QStringLiteral("playback/gapless"), true).toBool();
}

void Settings::setGaplessPlayback(bool enabled)
{
    m_settings.setValue(QStringLiteral("playback/gapless"), enabled);
}

// ── Shuffle / Repeat ────────────────────────────────────────────────
bool Settings::shuffleEnabled() const
{
    return m_settings.value(QStringLiteral("playback/shuffle"), false).toBool();
}

void Settings::setShuffleEnabled(bool enabled)
{
    m_settings.setValue(QStringLiteral("playback/shuffle"), enabled);
    emit shuffleChanged(enabled);
}

int Settings::repeatMode() const
{
    int mode = m_settings.value(QStringLiteral("playback/repeat"), 0).toInt();
    return (mode >= 0 && mode <= 2) ? mode : 0;
}

void Settings::setRepeatMode(int mode)
{
    if (mode < 0 || mode > 2) mode = 0;
    m_settings.setValue(QStringLiteral("playback/repeat"), mode);
    emit repeatChanged(mode);
}

int Settings::historyDepth() const
{
    return std::max(1, m_settings.value(QStringLiteral("playback/historyDepth"), 100).toInt());
}

void Settings::setHistoryDepth(int depth)
{
    depth = std::max(1, depth);
    m_settings.setValue(QStringLiteral("playback/historyDepth"), depth);
}

// ── Buffering ───────────────────────────────────────────────────────
int Settings::lookaheadMs() const
{
    int ms = m_settings.value(QStringLiteral("playback/lookaheadMs"), 2000).toInt();
    return ms > 0 ? ms : 2000;
}

void Settings::setLookaheadMs(int ms)
{
    if (ms <= 0) ms = 2000;
    m_settings.setValue(QStringLiteral("playback/lookaheadMs"), ms);
}

QString Settings::underrunPolicy() const
{
    QString policy = m_settings.value(QStringLiteral("playback/underrunPolicy"),
                                      QStringLiteral("silence")).toString();
    return policy == QStringLiteral("repeat") ? policy : QStringLiteral("silence");
}

void Settings::setUnderrunPolicy(const QString& policy)
{
    m_settings.setValue(QStringLiteral("playback/underrunPolicy"),
                        policy == QStringLiteral("repeat") ? policy : QStringLiteral("silence"));
}
