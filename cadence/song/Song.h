#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

#include "cadence/song/Note.h"

namespace cadence::song {

struct SongParseError {
    enum class Kind {
        None,
        Unreadable,
        InvalidDocument,
        MalformedNote,
        NonMonotonicTime,
        OverlappingPress,
        UnmatchedRelease,
        UnterminatedNote,
        InvalidBpm,
    };

    Kind kind = Kind::None;
    int noteIndex = -1; // index in file order, -1 when not note-specific
    QString message;

    bool isError() const { return kind != Kind::None; }
};

QString parseErrorKindName(SongParseError::Kind kind);

enum class BpmSource {
    Declared,
    Derived,
};

// Immutable, validated song. Duration and BPM are computed once when the song is built.
class Song {
public:
    Song() = default;

    // Validates notes (ordering, per-key press/release pairing) and computes derived fields.
    // declaredBpm <= 0 means "not declared": BPM is then derived from press onsets.
    static bool build(const QString& name,
                      double declaredBpm,
                      QVector<Note> notes,
                      Song* out,
                      SongParseError* outError = nullptr);

    const QString& name() const { return m_name; }
    double bpm() const { return m_bpm; }
    BpmSource bpmSource() const { return m_bpmSource; }
    qint64 durationMs() const { return m_durationMs; }
    const QVector<Note>& notes() const { return m_notes; }
    int noteCount() const { return m_notes.size(); }
    bool isEmpty() const { return m_notes.isEmpty(); }

    // Index of the first note with offsetMs >= ms (noteCount() when none).
    int firstNoteAtOrAfter(qint64 ms) const;

private:
    QString m_name;
    double m_bpm = 120.0;
    BpmSource m_bpmSource = BpmSource::Derived;
    qint64 m_durationMs = 0;
    QVector<Note> m_notes;
};

// Song JSON document:
//   {"name": "...", "bpm": 96, "notes": [{"offsetMs": 0, "key": "a", "action": "press"}, ...]}
// fallbackName is used when the document carries no name (usually the file's base name).
bool loadSong(const QByteArray& json,
              const QString& fallbackName,
              Song* out,
              SongParseError* outError = nullptr);

} // namespace cadence::song
