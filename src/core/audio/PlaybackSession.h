#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "CrossfadeController.h"
#include "DecoderStream.h"
#include "EventChannel.h"

// The mutable runtime state of playback. Owned by PlaybackEngine and
// only touched with its session lock held: by commands and poll() on
// the control thread, by render() on the output thread.
struct PlaybackSession {
    static constexpr int kMaxPendingCommits = 8;
    static constexpr int kRetiredReserve = 8;

    PlaybackSession() { retired.reserve(kRetiredReserve); }

    // Playing stream; null while a transition owns it or nothing plays
    std::unique_ptr<DecoderStream> current;
    // Next queue candidate, opened ahead for gapless / crossfade
    std::unique_ptr<DecoderStream> prepared;
    CrossfadeController crossfade;

    int64_t crossfadeFrames = 0;

    // Upcoming queue candidates that failed and are stepped over
    int skipCount = 0;

    // Stream handovers done by render() that the queue has not seen yet.
    // poll() (or the next command) commits them in order.
    std::array<quint64, kMaxPendingCommits> pendingCommits{};
    int pendingCommitCount = 0;

    bool advancePending = false;   // current ended, nothing prepared
    bool recoveryPending = false;  // current failed

    // Bumped by anything that changes what "next" means; guards
    // streams opened outside the lock.
    quint64 generation = 0;

    // Streams dropped on the render thread; closed by poll()
    std::vector<std::unique_ptr<DecoderStream>> retired;

    EventChannel events;

    DecoderStream* audibleStream() const
    {
        return crossfade.isActive() ? crossfade.outgoing() : current.get();
    }
};
