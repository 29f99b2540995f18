#include "cadence/engine/ProgressSnapshot.h"

namespace cadence::engine {

const char* playbackStateName(PlaybackState state) {
    switch (state) {
    case PlaybackState::Stopped: return "Stopped";
    case PlaybackState::Playing: return "Playing";
    case PlaybackState::Paused: return "Paused";
    }
    return "?";
}

QString formatClock(qint64 ms) {
    const qint64 totalSec = qMax<qint64>(0, ms) / 1000;
    return QString("%1:%2").arg(totalSec / 60).arg(totalSec % 60, 2, 10, QChar('0'));
}

} // namespace cadence::engine
