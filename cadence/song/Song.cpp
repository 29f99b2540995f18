#include "cadence/song/Song.h"

#include "cadence/song/BpmEstimator.h"

#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace cadence::song {
namespace {

static bool fail(SongParseError* outError, SongParseError::Kind kind, int noteIndex, const QString& message) {
    if (outError) {
        outError->kind = kind;
        outError->noteIndex = noteIndex;
        outError->message = message;
    }
    return false;
}

static bool readOffset(const QJsonValue& v, qint64* out) {
    if (!v.isDouble()) return false;
    const double d = v.toDouble();
    if (!std::isfinite(d) || d < 0.0 || std::floor(d) != d) return false;
    // 2^63 and above does not fit a qint64.
    if (d >= double(std::numeric_limits<qint64>::max())) return false;
    *out = qint64(d);
    return true;
}

static bool readAction(const QJsonValue& v, NoteAction* out) {
    const QString s = v.toString().trimmed().toLower();
    if (s == "press" || s == "down") {
        *out = NoteAction::Press;
        return true;
    }
    if (s == "release" || s == "up") {
        *out = NoteAction::Release;
        return true;
    }
    return false;
}

} // namespace

QString parseErrorKindName(SongParseError::Kind kind) {
    switch (kind) {
    case SongParseError::Kind::None: return "None";
    case SongParseError::Kind::Unreadable: return "Unreadable";
    case SongParseError::Kind::InvalidDocument: return "InvalidDocument";
    case SongParseError::Kind::MalformedNote: return "MalformedNote";
    case SongParseError::Kind::NonMonotonicTime: return "NonMonotonicTime";
    case SongParseError::Kind::OverlappingPress: return "OverlappingPress";
    case SongParseError::Kind::UnmatchedRelease: return "UnmatchedRelease";
    case SongParseError::Kind::UnterminatedNote: return "UnterminatedNote";
    case SongParseError::Kind::InvalidBpm: return "InvalidBpm";
    }
    return "Unknown";
}

bool Song::build(const QString& name,
                 double declaredBpm,
                 QVector<Note> notes,
                 Song* out,
                 SongParseError* outError) {
    // key -> index of the press currently holding it
    QHash<QString, int> held;
    qint64 lastOffset = 0;

    for (int i = 0; i < notes.size(); ++i) {
        const Note& n = notes[i];
        if (n.offsetMs < 0) {
            return fail(outError, SongParseError::Kind::MalformedNote, i,
                        QString("note %1 has a negative offset").arg(i));
        }
        if (n.key.trimmed().isEmpty()) {
            return fail(outError, SongParseError::Kind::MalformedNote, i,
                        QString("note %1 has an empty key").arg(i));
        }
        if (n.offsetMs < lastOffset) {
            return fail(outError, SongParseError::Kind::NonMonotonicTime, i,
                        QString("note %1 at %2 ms comes after %3 ms").arg(i).arg(n.offsetMs).arg(lastOffset));
        }
        lastOffset = n.offsetMs;

        if (n.isPress()) {
            if (held.contains(n.key)) {
                return fail(outError, SongParseError::Kind::OverlappingPress, i,
                            QString("key '%1' pressed at note %2 while still held since note %3")
                                .arg(n.key).arg(i).arg(held.value(n.key)));
            }
            held.insert(n.key, i);
        } else {
            if (!held.remove(n.key)) {
                return fail(outError, SongParseError::Kind::UnmatchedRelease, i,
                            QString("key '%1' released at note %2 without a press").arg(n.key).arg(i));
            }
        }
    }

    if (!held.isEmpty()) {
        int first = notes.size();
        QString key;
        for (auto it = held.constBegin(); it != held.constEnd(); ++it) {
            if (it.value() < first) {
                first = it.value();
                key = it.key();
            }
        }
        return fail(outError, SongParseError::Kind::UnterminatedNote, first,
                    QString("key '%1' pressed at note %2 is never released").arg(key).arg(first));
    }

    if (!std::isfinite(declaredBpm)) {
        return fail(outError, SongParseError::Kind::InvalidBpm, -1, "declared BPM is not a number");
    }

    Song s;
    s.m_name = name;
    if (declaredBpm > 0.0) {
        s.m_bpm = declaredBpm;
        s.m_bpmSource = BpmSource::Declared;
    } else {
        s.m_bpm = BpmEstimator::fromNotes(notes);
        s.m_bpmSource = BpmSource::Derived;
    }
    s.m_durationMs = notes.isEmpty() ? 0 : notes.last().offsetMs;
    s.m_notes = std::move(notes);

    if (out) *out = std::move(s);
    if (outError) *outError = SongParseError{};
    return true;
}

int Song::firstNoteAtOrAfter(qint64 ms) const {
    const auto it = std::lower_bound(m_notes.cbegin(), m_notes.cend(), ms,
                                     [](const Note& n, qint64 t) { return n.offsetMs < t; });
    return int(it - m_notes.cbegin());
}

bool loadSong(const QByteArray& json,
              const QString& fallbackName,
              Song* out,
              SongParseError* outError) {
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(outError, SongParseError::Kind::InvalidDocument, -1,
                    QString("Invalid song JSON: %1").arg(pe.errorString()));
    }
    const QJsonObject root = doc.object();

    const QJsonValue notesV = root.value("notes");
    if (!notesV.isArray()) {
        return fail(outError, SongParseError::Kind::InvalidDocument, -1, "song has no 'notes' array");
    }

    double declaredBpm = 0.0;
    if (root.contains("bpm") && !root.value("bpm").isNull()) {
        const QJsonValue bpmV = root.value("bpm");
        if (!bpmV.isDouble() || !(bpmV.toDouble() > 0.0)) {
            return fail(outError, SongParseError::Kind::InvalidBpm, -1, "declared BPM must be a positive number");
        }
        declaredBpm = bpmV.toDouble();
    }

    QString name = root.value("name").toString().trimmed();
    if (name.isEmpty()) name = fallbackName;

    const QJsonArray arr = notesV.toArray();
    QVector<Note> notes;
    notes.reserve(arr.size());
    for (int i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).isObject()) {
            return fail(outError, SongParseError::Kind::MalformedNote, i, QString("note %1 is not an object").arg(i));
        }
        const QJsonObject o = arr.at(i).toObject();
        Note n;
        if (!readOffset(o.value("offsetMs"), &n.offsetMs)) {
            return fail(outError, SongParseError::Kind::MalformedNote, i,
                        QString("note %1 needs a non-negative integer 'offsetMs'").arg(i));
        }
        n.key = o.value("key").toString().trimmed().toLower();
        if (!readAction(o.value("action"), &n.action)) {
            return fail(outError, SongParseError::Kind::MalformedNote, i,
                        QString("note %1 has an unknown action '%2'").arg(i).arg(o.value("action").toString()));
        }
        notes.push_back(n);
    }

    return Song::build(name, declaredBpm, std::move(notes), out, outError);
}

} // namespace cadence::song
