#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <memory>

#include "cadence/engine/ProgressSnapshot.h"
#include "cadence/song/Song.h"

namespace cadence::engine {

// State of one playback. Owned by PlaybackScheduler and only touched on the scheduling thread.
//
// Musical time is elapsed = accumulatedMs + (now - startClockMs) while Playing, and accumulatedMs
// otherwise. startClockMs may lie in the future during the lead-in; musical time stays at 0 until then.
struct PlaybackSession {
    std::shared_ptr<const song::Song> song;
    PlaybackState state = PlaybackState::Stopped;

    qint64 startClockMs = 0;
    qint64 accumulatedMs = 0;
    qint64 pendingLeadInMs = 0; // lead-in left over when paused before the first note

    int cursorIndex = 0;
    qint64 lastDispatchedElapsedMs = -1;

    QSet<QString> heldKeys;
    QStringList suspendedKeys; // released by pause, pressed again on resume
    int skippedNotes = 0;

    qint64 elapsedAt(qint64 nowMs) const {
        if (state != PlaybackState::Playing) return accumulatedMs;
        return accumulatedMs + qMax<qint64>(0, nowMs - startClockMs);
    }
};

} // namespace cadence::engine
