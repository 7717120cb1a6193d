#include "QueueManager.h"
#include <QDebug>
#include <algorithm>

QueueManager::QueueManager(int historyDepth)
    : m_historyDepth(std::max(1, historyDepth))
{
}

// ── CRUD ────────────────────────────────────────────────────────────

void QueueManager::setQueue(const QVector<TrackPtr>& tracks)
{
    m_entries.clear();
    m_history.clear();
    m_nextCycle.clear();
    for (const TrackPtr& t : tracks)
        m_entries.append(Entry{newEntryId(), t});
    rebuildIndex();
    m_currentId = m_entries.isEmpty() ? 0 : m_entries.first().id;
    if (m_shuffle)
        rebuildShuffleOrder();
}

void QueueManager::append(const TrackPtr& track)
{
    insert(m_entries.size(), track);
}

void QueueManager::append(const QVector<TrackPtr>& tracks)
{
    for (const TrackPtr& t : tracks)
        insert(m_entries.size(), t);
}

bool QueueManager::insert(int index, const TrackPtr& track)
{
    if (!track || index < 0 || index > m_entries.size()) return false;

    Entry e{newEntryId(), track};
    m_entries.insert(index, e);
    rebuildIndex();

    if (m_currentId == 0)
        m_currentId = e.id;

    if (m_shuffle) {
        // New entries land somewhere in the unplayed part of the order
        int pos = m_shuffleOrder.indexOf(m_currentId);
        int lo = pos + 1;
        int hi = m_shuffleOrder.size();
        int at = lo + (hi > lo ? int(m_rng.bounded(hi - lo + 1)) : 0);
        if (e.id == m_currentId)
            at = 0;
        m_shuffleOrder.insert(at, e.id);
        m_nextCycle.clear();
    }
    return true;
}

QueueManager::RemoveResult QueueManager::remove(int index)
{
    if (index < 0 || index >= m_entries.size()) return InvalidIndex;

    const quint64 removedId = m_entries[index].id;
    RemoveResult result = Removed;

    if (removedId == m_currentId) {
        Entry succ = nextEntry(false, 0);
        if (succ && succ.id != removedId) {
            if (m_shuffle) {
                int pos = m_shuffleOrder.indexOf(m_currentId);
                if (pos + 1 >= m_shuffleOrder.size())
                    m_shuffleOrder = m_nextCycle;
            }
            m_currentId = succ.id;
            result = RemovedCurrent;
        } else {
            result = RemovedCurrentEndOfQueue;
        }
    }

    m_entries.removeAt(index);
    m_shuffleOrder.removeAll(removedId);
    m_history.removeAll(removedId);
    m_nextCycle.clear();
    rebuildIndex();

    if (result == RemovedCurrentEndOfQueue) {
        // Nothing follows; park on a valid entry so play() can resume
        m_currentId = m_entries.isEmpty()
            ? 0 : m_entries.at(std::min(index, int(m_entries.size()) - 1)).id;
    }
    return result;
}

bool QueueManager::reorder(int fromIndex, int toIndex)
{
    if (fromIndex < 0 || fromIndex >= m_entries.size()) return false;
    if (toIndex < 0 || toIndex >= m_entries.size()) return false;
    if (fromIndex == toIndex) return false;

    m_entries.move(fromIndex, toIndex);
    rebuildIndex();
    // Shuffle order and history hold entry ids; nothing else to fix up
    return true;
}

void QueueManager::clear()
{
    m_entries.clear();
    m_indexById.clear();
    m_shuffleOrder.clear();
    m_nextCycle.clear();
    m_history.clear();
    m_currentId = 0;
}

// ── Access ──────────────────────────────────────────────────────────

QVector<TrackPtr> QueueManager::tracks() const
{
    QVector<TrackPtr> result;
    result.reserve(m_entries.size());
    for (const Entry& e : m_entries)
        result.append(e.track);
    return result;
}

TrackPtr QueueManager::current() const
{
    return currentEntry().track;
}

QueueManager::Entry QueueManager::currentEntry() const
{
    int idx = indexOfEntry(m_currentId);
    return idx >= 0 ? m_entries.at(idx) : Entry();
}

QueueManager::Entry QueueManager::entryAt(int index) const
{
    if (index < 0 || index >= m_entries.size()) return Entry();
    return m_entries.at(index);
}

int QueueManager::indexOfEntry(quint64 entryId) const
{
    if (entryId == 0) return -1;
    return m_indexById.value(entryId, -1);
}

TrackPtr QueueManager::peekNext(int skip) const
{
    return nextEntry(true, skip).track;
}

QueueManager::Entry QueueManager::peekNextEntry(int skip) const
{
    return nextEntry(true, skip);
}

QueueManager::Entry QueueManager::nextEntry(bool honorRepeatOne, int skip) const
{
    if (m_entries.isEmpty() || skip < 0) return Entry();

    if (honorRepeatOne && m_repeat == RepeatMode::One) {
        // The only candidate is the current track itself
        return skip == 0 ? currentEntry() : Entry();
    }

    const int n = m_entries.size();

    if (!m_shuffle) {
        int cur = currentIndex();
        int idx = cur + 1 + skip;
        if (idx < n) return m_entries.at(idx);
        if (m_repeat == RepeatMode::All) {
            idx -= n;
            if (idx < n) return m_entries.at(idx);
        }
        return Entry();
    }

    int pos = m_shuffleOrder.indexOf(m_currentId);
    int idx = pos + 1 + skip;
    if (idx < m_shuffleOrder.size())
        return entryAt(indexOfEntry(m_shuffleOrder.at(idx)));
    if (m_repeat == RepeatMode::All) {
        const QVector<quint64>& cycle = nextCycle();
        idx -= m_shuffleOrder.size();
        if (idx < cycle.size())
            return entryAt(indexOfEntry(cycle.at(idx)));
    }
    return Entry();
}

// ── Navigation ──────────────────────────────────────────────────────

QueueManager::AdvanceResult QueueManager::advance(int skip)
{
    return commitNext(true, skip);
}

QueueManager::AdvanceResult QueueManager::skipForward(int skip)
{
    return commitNext(false, skip);
}

QueueManager::AdvanceResult QueueManager::commitNext(bool honorRepeatOne, int skip)
{
    if (m_entries.isEmpty()) return EndOfQueue;

    if (honorRepeatOne && m_repeat == RepeatMode::One) {
        if (skip != 0) return EndOfQueue;
        pushHistory(m_currentId);
        return RepeatedOne;
    }

    Entry next = nextEntry(false, skip);
    if (!next) return EndOfQueue;

    if (m_shuffle) {
        int pos = m_shuffleOrder.indexOf(m_currentId);
        if (pos + 1 + skip >= m_shuffleOrder.size()) {
            // Crossed into the RepeatAll continuation
            m_shuffleOrder = m_nextCycle;
            qDebug() << "[Shuffle] New cycle:" << m_shuffleOrder.size() << "tracks reshuffled";
        }
    }
    m_nextCycle.clear();

    pushHistory(m_currentId);
    m_currentId = next.id;
    return Advanced;
}

bool QueueManager::previous()
{
    while (!m_history.isEmpty()) {
        quint64 id = m_history.takeLast();
        if (m_indexById.contains(id)) {
            m_currentId = id;
            m_nextCycle.clear();
            return true;
        }
    }
    return false;
}

bool QueueManager::jumpTo(int index)
{
    if (index < 0 || index >= m_entries.size()) return false;

    const quint64 id = m_entries.at(index).id;
    if (id == m_currentId) return true;

    if (m_shuffle) {
        // Continue the shuffle from right after the previous current
        m_shuffleOrder.removeAll(id);
        int pos = m_shuffleOrder.indexOf(m_currentId);
        m_shuffleOrder.insert(pos + 1, id);
    }
    m_nextCycle.clear();

    pushHistory(m_currentId);
    m_currentId = id;
    return true;
}

bool QueueManager::jumpToEntry(quint64 entryId)
{
    return jumpTo(indexOfEntry(entryId));
}

// ── Shuffle ─────────────────────────────────────────────────────────

void QueueManager::setShuffle(bool enabled)
{
    m_shuffle = enabled;
    if (enabled) {
        rebuildShuffleOrder();
    } else {
        m_shuffleOrder.clear();
        m_nextCycle.clear();
    }
}

QVector<int> QueueManager::shuffleOrder() const
{
    QVector<int> result;
    result.reserve(m_shuffleOrder.size());
    for (quint64 id : m_shuffleOrder)
        result.append(indexOfEntry(id));
    return result;
}

void QueueManager::rebuildShuffleOrder()
{
    m_shuffleOrder.clear();
    m_nextCycle.clear();
    for (const Entry& e : m_entries) {
        if (e.id != m_currentId)
            m_shuffleOrder.append(e.id);
    }
    // Fisher-Yates shuffle
    for (int i = m_shuffleOrder.size() - 1; i > 0; --i) {
        int j = int(m_rng.bounded(i + 1));
        std::swap(m_shuffleOrder[i], m_shuffleOrder[j]);
    }
    if (m_currentId != 0)
        m_shuffleOrder.prepend(m_currentId);
}

const QVector<quint64>& QueueManager::nextCycle() const
{
    if (!m_nextCycle.isEmpty() || m_entries.isEmpty())
        return m_nextCycle;

    for (const Entry& e : m_entries)
        m_nextCycle.append(e.id);
    for (int i = m_nextCycle.size() - 1; i > 0; --i) {
        int j = int(m_rng.bounded(i + 1));
        std::swap(m_nextCycle[i], m_nextCycle[j]);
    }
    // Back-to-back prevention: first of new cycle != last of old cycle
    if (m_nextCycle.size() > 1 && m_nextCycle.first() == m_currentId) {
        int swapWith = 1 + int(m_rng.bounded(m_nextCycle.size() - 1));
        std::swap(m_nextCycle[0], m_nextCycle[swapWith]);
    }
    return m_nextCycle;
}

// ── Repeat ──────────────────────────────────────────────────────────

void QueueManager::cycleRepeat()
{
    switch (m_repeat) {
    case RepeatMode::Off: m_repeat = RepeatMode::All; break;
    case RepeatMode::All: m_repeat = RepeatMode::One; break;
    case RepeatMode::One: m_repeat = RepeatMode::Off; break;
    }
}

// ── History ─────────────────────────────────────────────────────────

QVector<int> QueueManager::history() const
{
    QVector<int> result;
    result.reserve(m_history.size());
    for (quint64 id : m_history)
        result.append(indexOfEntry(id));
    return result;
}

void QueueManager::setHistoryDepth(int depth)
{
    m_historyDepth = std::max(1, depth);
    while (m_history.size() > m_historyDepth)
        m_history.removeFirst();
}

void QueueManager::pushHistory(quint64 entryId)
{
    if (entryId == 0) return;
    m_history.append(entryId);
    while (m_history.size() > m_historyDepth)
        m_history.removeFirst();
}

void QueueManager::rebuildIndex()
{
    m_indexById.clear();
    m_indexById.reserve(m_entries.size());
    for (int i = 0; i < m_entries.size(); ++i)
        m_indexById.insert(m_entries.at(i).id, i);
}
