#pragma once

#include <array>
#include <vector>
#include <QString>
#include "../MusicData.h"

// Notification produced on the render or control path and turned into
// Qt signals by PlaybackEngine::poll() on the control thread.
struct EngineEvent {
    enum Type {
        StateChanged,         // value = PlaybackEngine::State
        TransitionStarted,
        TransitionFinished,
        TransitionAborted,
        CurrentTrackChanged,
        DecodeFailed,         // track + message
        QueueChanged,
        QueueExhausted,
        PlaybackFailed        // message
    };

    Type     type = StateChanged;
    int      value = 0;
    TrackPtr track;
    QString  message;
};

// Fixed-capacity FIFO of engine events. Publishing never allocates, so
// the render callback may publish while it holds the session lock.
// Not thread-safe on its own: every access happens under that lock.
class EventChannel {
public:
    static constexpr int kCapacity = 64;

    // Returns false (and counts a drop) when the channel is full.
    bool publish(EngineEvent&& event)
    {
        if (m_count == kCapacity) {
            ++m_dropped;
            return false;
        }
        m_slots[(m_head + m_count) % kCapacity] = std::move(event);
        ++m_count;
        return true;
    }

    // Moves every pending event into out, oldest first. Slots are left
    // empty so the render path never releases a track reference.
    void takeAll(std::vector<EngineEvent>& out)
    {
        for (int i = 0; i < m_count; ++i) {
            EngineEvent& slot = m_slots[(m_head + i) % kCapacity];
            out.push_back(std::move(slot));
            slot = EngineEvent();
        }
        m_head = 0;
        m_count = 0;
    }

    bool isEmpty() const { return m_count == 0; }
    int size() const { return m_count; }
    int dropped() const { return m_dropped; }

private:
    std::array<EngineEvent, kCapacity> m_slots;
    int m_head = 0;
    int m_count = 0;
    int m_dropped = 0;
};
