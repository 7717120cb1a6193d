#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QMetaType>
#include <QString>
#include <QVector>
#include <cstdint>
#include <memory>

// ── Track ───────────────────────────────────────────────────────────
// Produced by the library scanner / download collaborators and handed
// to the queue. Immutable once enqueued.
struct Track {
    QString id;
    QString title;
    QString artist;
    QString filePath;
    int64_t durationFrames = 0;  // hint at the output rate, 0 = unknown
    int     sampleRate = 0;      // source rate, 0 = unknown
    int     channels = 2;
};

using TrackPtr = std::shared_ptr<const Track>;

inline TrackPtr makeTrack(const QString& id, const QString& filePath,
                          int64_t durationFrames = 0)
{
    auto t = std::make_shared<Track>();
    t->id = id;
    t->title = id;
    t->filePath = filePath;
    t->durationFrames = durationFrames;
    return t;
}

// ── Repeat mode (values match Settings playback/repeat: 0=Off, 1=All, 2=One)
enum class RepeatMode { Off = 0, All = 1, One = 2 };

Q_DECLARE_METATYPE(Track)

#endif // MUSICDATA_H
