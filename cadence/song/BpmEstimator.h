#pragma once

#include <QVector>

#include "cadence/song/Note.h"

namespace cadence::song {

// Fixed BPM derivation used when a song does not declare its tempo:
// 60000 / median inter-onset interval of distinct press onsets, rounded to 0.1.
// Fewer than two distinct onsets yields kDefaultBpm (the MIDI default tempo).
struct BpmEstimator final {
    static constexpr double kDefaultBpm = 120.0;

    static double fromNotes(const QVector<Note>& notes);
    static double fromOnsets(QVector<qint64> onsetsMs);
};

} // namespace cadence::song
