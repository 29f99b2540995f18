#pragma once

#include <QString>
#include <QtGlobal>
#include <memory>

namespace cadence::song {
class Song;
}

namespace cadence::engine {

enum class PlaybackState {
    Stopped,
    Playing,
    Paused,
};

const char* playbackStateName(PlaybackState state);

// Immutable view of the scheduler, published once per tick and after every control.
struct ProgressSnapshot {
    PlaybackState state = PlaybackState::Stopped;
    qint64 elapsedMs = 0;
    qint64 durationMs = 0;
    int cursorIndex = 0;
    int noteCount = 0;
    QString songName;
    double bpm = 0.0;

    int skippedNotes = 0;
    quint64 completedSongs = 0;
    std::shared_ptr<const song::Song> lastCompletedSong; // the song that last bumped completedSongs
    quint64 rejectedControls = 0;

    bool hasSong() const { return noteCount > 0 || durationMs > 0 || !songName.isEmpty(); }
    double fraction() const { return durationMs > 0 ? double(elapsedMs) / double(durationMs) : 0.0; }
};

QString formatClock(qint64 ms); // "m:ss"

} // namespace cadence::engine
