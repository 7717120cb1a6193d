#pragma once
#include <QString>

// Failure of a single stream. Carries the offending track's id so the
// error can be surfaced against the right queue entry.
struct DecodeError {
    enum Kind {
        OpenFailed,
        Unsupported,
        ReadFailed,
        SeekFailed,
        UnknownDuration
    };

    Kind    kind = ReadFailed;
    QString message;
    QString trackId;
};

enum class PlaybackError {
    None,
    QueueEmpty,
    EndOfQueue,
    NoActiveStream,
    UnknownDuration,
    InvalidIndex,
    DecodeFailed,
    OutputFailed
};

// Returned by every transport command.
struct PlaybackResult {
    PlaybackError error = PlaybackError::None;
    QString       message;

    bool ok() const { return error == PlaybackError::None; }

    static PlaybackResult success() { return PlaybackResult(); }
    static PlaybackResult failure(PlaybackError e, const QString& msg = QString())
    {
        PlaybackResult r;
        r.error = e;
        r.message = msg;
        return r;
    }
};

inline const char* playbackErrorName(PlaybackError e)
{
    switch (e) {
    case PlaybackError::None:            return "none";
    case PlaybackError::QueueEmpty:      return "queue empty";
    case PlaybackError::EndOfQueue:      return "end of queue";
    case PlaybackError::NoActiveStream:  return "no active stream";
    case PlaybackError::UnknownDuration: return "unknown duration";
    case PlaybackError::InvalidIndex:    return "invalid index";
    case PlaybackError::DecodeFailed:    return "decode failed";
    case PlaybackError::OutputFailed:    return "output unavailable";
    }
    return "unknown";
}
