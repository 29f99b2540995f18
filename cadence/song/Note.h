#pragma once

#include <QString>
#include <QtGlobal>

namespace cadence::song {

enum class NoteAction {
    Press,
    Release,
};

// One timed key action inside a song.
// key is the symbolic identifier understood by the input layer ("a", "shift+q", "ctrl+e").
struct Note {
    qint64 offsetMs = 0; // from song start, >= 0
    QString key;
    NoteAction action = NoteAction::Press;

    bool isPress() const { return action == NoteAction::Press; }
    bool isRelease() const { return action == NoteAction::Release; }
};

} // namespace cadence::song
