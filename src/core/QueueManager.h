#pragma once
#include <QHash>
#include <QRandomGenerator>
#include <QVector>
#include "MusicData.h"

// Owns playback order: the authored sequence, the shuffle permutation,
// the repeat mode and the history used by previous().
//
// Every queue position is an entry with a stable id. Current track,
// shuffle order and history refer to entry ids, so mutations re-resolve
// positions by identity instead of by index.
class QueueManager {
public:
    enum AdvanceResult { Advanced, RepeatedOne, EndOfQueue };
    enum RemoveResult { Removed, RemovedCurrent, RemovedCurrentEndOfQueue, InvalidIndex };

    struct Entry {
        quint64  id = 0;
        TrackPtr track;
        explicit operator bool() const { return id != 0; }
    };

    explicit QueueManager(int historyDepth = 100);

    // Queue CRUD
    void setQueue(const QVector<TrackPtr>& tracks);
    void append(const TrackPtr& track);
    void append(const QVector<TrackPtr>& tracks);
    bool insert(int index, const TrackPtr& track);
    RemoveResult remove(int index);
    bool reorder(int fromIndex, int toIndex);
    void clear();

    // Queue access
    QVector<TrackPtr> tracks() const;
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    int currentIndex() const { return indexOfEntry(m_currentId); }
    TrackPtr current() const;
    Entry currentEntry() const;
    Entry entryAt(int index) const;
    int indexOfEntry(quint64 entryId) const;

    // What plays after current. skip steps over that many upcoming
    // candidates (ones that already failed to open).
    TrackPtr peekNext(int skip = 0) const;
    Entry peekNextEntry(int skip = 0) const;

    // Commits peekNext(skip) as current, pushing the prior current onto
    // history. skipForward() is the user-initiated variant: it bypasses
    // RepeatOne.
    AdvanceResult advance(int skip = 0);
    AdvanceResult skipForward(int skip = 0);

    // Pops history into current. Returns false (and changes nothing) when
    // history is empty; the caller restarts the current track instead.
    bool previous();

    bool jumpTo(int index);
    bool jumpToEntry(quint64 entryId);

    // Shuffle
    void setShuffle(bool enabled);
    bool shuffleEnabled() const { return m_shuffle; }
    QVector<int> shuffleOrder() const;  // as queue indices
    void setRandomSeed(quint32 seed) { m_rng.seed(seed); }

    // Repeat
    void setRepeatMode(RepeatMode mode) { m_repeat = mode; }
    RepeatMode repeatMode() const { return m_repeat; }
    void cycleRepeat();

    // History
    QVector<int> history() const;  // oldest first, as queue indices
    int historySize() const { return m_history.size(); }
    int historyDepth() const { return m_historyDepth; }
    void setHistoryDepth(int depth);

private:
    Entry nextEntry(bool honorRepeatOne, int skip) const;
    AdvanceResult commitNext(bool honorRepeatOne, int skip);
    void pushHistory(quint64 entryId);
    void rebuildIndex();
    void rebuildShuffleOrder();
    const QVector<quint64>& nextCycle() const;
    quint64 newEntryId() { return ++m_lastEntryId; }

    QVector<Entry> m_entries;
    QHash<quint64, int> m_indexById;
    quint64 m_currentId = 0;
    quint64 m_lastEntryId = 0;

    bool m_shuffle = false;
    QVector<quint64> m_shuffleOrder;         // permutation of all entry ids
    mutable QVector<quint64> m_nextCycle;    // RepeatAll continuation, built on first query
    mutable QRandomGenerator m_rng{QRandomGenerator::global()->generate()};

    RepeatMode m_repeat = RepeatMode::Off;

    QVector<quint64> m_history;
    int m_historyDepth = 100;
};
