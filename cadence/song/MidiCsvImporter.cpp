#include "cadence/song/MidiCsvImporter.h"

#include "cadence/song/TempoMap.h"

#include <QHash>
#include <QList>
#include <QMap>
#include <QStringList>
#include <QVector>
#include <QtGlobal>
#include <algorithm>
#include <climits>
#include <cmath>
#include <utility>

namespace cadence::song {
namespace {

struct CsvRecord {
    int line = 0;
    int track = 0;
    qint64 tick = 0;
    QString type;
    QStringList args;
};

struct PitchEvent {
    qint64 tick = 0;
    int order = 0; // file order, keeps same-tick on/off pairs stable
    int channel = 0;
    int pitch = 0;
    bool on = false;
};

struct ImportedNote {
    qint64 onMs = 0;
    qint64 offMs = 0;
    QString key;
};

static bool fail(SongParseError* outError, SongParseError::Kind kind, const QString& message) {
    if (outError) {
        outError->kind = kind;
        outError->noteIndex = -1;
        outError->message = message;
    }
    return false;
}

static bool parseRecords(const QByteArray& text, QVector<CsvRecord>* out, SongParseError* outError) {
    const QList<QByteArray> lines = text.split('\n');
    for (int i = 0; i < lines.size(); ++i) {
        const QString raw = QString::fromUtf8(lines[i]).trimmed();
        if (raw.isEmpty() || raw.startsWith('#') || raw.startsWith(';')) continue;

        QStringList parts = raw.split(',');
        if (parts.size() < 3) continue;
        for (QString& p : parts) p = p.trimmed();

        CsvRecord r;
        bool okTrack = false;
        bool okTick = false;
        r.line = i + 1;
        r.track = parts[0].toInt(&okTrack);
        r.tick = parts[1].toLongLong(&okTick);
        if (!okTrack || !okTick || r.tick < 0) {
            return fail(outError, SongParseError::Kind::InvalidDocument,
                        QString("midicsv line %1: bad track/tick").arg(r.line));
        }
        r.type = parts[2];
        r.args = parts.mid(3);
        out->push_back(r);
    }
    return true;
}

static qint64 roundMs(double ms) { return qint64(std::llround(ms)); }

} // namespace

bool importMidiCsv(const QByteArray& text,
                   const QString& name,
                   const MidiCsvImportOptions& options,
                   Song* out,
                   SongParseError* outError) {
    QVector<CsvRecord> records;
    if (!parseRecords(text, &records, outError)) return false;

    int division = -1;
    QVector<TempoMap::Change> tempos;
    QVector<PitchEvent> events;
    qint64 lastTick = 0;

    for (const CsvRecord& r : records) {
        lastTick = std::max(lastTick, r.tick);
        if (r.type == "Header") {
            bool ok = false;
            division = r.args.size() >= 3 ? r.args[2].toInt(&ok) : -1;
            if (!ok || division <= 0) {
                return fail(outError, SongParseError::Kind::InvalidDocument,
                            QString("midicsv line %1: bad Header division").arg(r.line));
            }
        } else if (r.type == "Tempo") {
            bool ok = false;
            const qint64 us = r.args.isEmpty() ? 0 : r.args[0].toLongLong(&ok);
            if (ok && us > 0) tempos.push_back(TempoMap::Change{r.tick, us});
        } else if (r.type == "Note_on_c" || r.type == "Note_off_c") {
            if (r.args.size() < 3) {
                return fail(outError, SongParseError::Kind::InvalidDocument,
                            QString("midicsv line %1: note record needs channel, pitch, velocity").arg(r.line));
            }
            bool okC = false, okP = false, okV = false;
            PitchEvent e;
            e.tick = r.tick;
            e.order = events.size();
            e.channel = r.args[0].toInt(&okC);
            e.pitch = r.args[1].toInt(&okP);
            const int velocity = r.args[2].toInt(&okV);
            if (!okC || !okP || !okV) {
                return fail(outError, SongParseError::Kind::InvalidDocument,
                            QString("midicsv line %1: non-numeric note fields").arg(r.line));
            }
            e.on = (r.type == "Note_on_c") && velocity > 0;
            events.push_back(e);
        }
    }

    if (division <= 0) {
        return fail(outError, SongParseError::Kind::InvalidDocument, "midicsv has no Header record with a division");
    }
    const TempoMap tempoMap(division, tempos);

    // Global transpose: highest pitch lands on windowMax.
    int maxPitch = INT_MIN;
    for (const PitchEvent& e : events) maxPitch = std::max(maxPitch, e.pitch);
    const int transpose = events.isEmpty() ? 0 : options.windowMax - maxPitch;

    std::stable_sort(events.begin(), events.end(), [](const PitchEvent& a, const PitchEvent& b) {
        return a.tick < b.tick;
    });

    // Pair note-ons with their note-offs per (channel, pitch).
    QHash<quint32, QVector<qint64>> pendingOn;
    QVector<ImportedNote> imported;
    const auto channelPitchKey = [](int channel, int pitch) {
        return (quint32(channel & 0xFF) << 8) | quint32(pitch & 0xFF);
    };
    const auto emitNote = [&](int pitch, qint64 onTick, qint64 offTick) {
        const int mapped = pitch + transpose;
        if (mapped < options.windowMin || mapped > options.windowMax) return;
        const QString key = options.layout.keyForPitch(mapped);
        if (key.isEmpty()) return;
        imported.push_back(ImportedNote{roundMs(tempoMap.tickToMs(onTick)), roundMs(tempoMap.tickToMs(offTick)), key});
    };

    for (const PitchEvent& e : events) {
        const quint32 k = channelPitchKey(e.channel, e.pitch);
        if (e.on) {
            pendingOn[k].push_back(e.tick);
            continue;
        }
        auto it = pendingOn.find(k);
        if (it == pendingOn.end() || it->isEmpty()) continue; // stray note-off
        const qint64 onTick = it->takeFirst();
        emitNote(e.pitch, onTick, e.tick);
    }
    for (auto it = pendingOn.constBegin(); it != pendingOn.constEnd(); ++it) {
        const int pitch = int(it.key() & 0xFF);
        for (qint64 onTick : it.value()) emitNote(pitch, onTick, lastTick);
    }

    std::stable_sort(imported.begin(), imported.end(), [](const ImportedNote& a, const ImportedNote& b) {
        return a.onMs < b.onMs;
    });

    // Roll chords so the presses of a group come out one after another.
    for (int i = 0; i < imported.size();) {
        const qint64 groupStart = imported[i].onMs;
        int j = i + 1;
        while (j < imported.size() && imported[j].onMs - groupStart <= options.chordWindowMs) ++j;
        if (j - i > 1) {
            for (int k = i; k < j; ++k) {
                imported[k].onMs = groupStart + qint64(k - i) * options.chordRollStepMs;
            }
        }
        i = j;
    }
    for (ImportedNote& n : imported) n.offMs = std::max(n.offMs, n.onMs);
    // Long rolls can run past the start of the next group.
    std::stable_sort(imported.begin(), imported.end(), [](const ImportedNote& a, const ImportedNote& b) {
        return a.onMs < b.onMs;
    });

    // Keep each key monophonic: a note is released no later than the next press of that key.
    QMap<QString, QVector<int>> byKey;
    for (int i = 0; i < imported.size(); ++i) byKey[imported[i].key].push_back(i);

    QVector<Note> notes;
    notes.reserve(imported.size() * 2);
    for (auto it = byKey.constBegin(); it != byKey.constEnd(); ++it) {
        const QVector<int>& idx = it.value();
        for (int n = 0; n < idx.size(); ++n) {
            ImportedNote& cur = imported[idx[n]];
            if (n + 1 < idx.size()) cur.offMs = std::min(cur.offMs, imported[idx[n + 1]].onMs);
            notes.push_back(Note{cur.onMs, cur.key, NoteAction::Press});
            notes.push_back(Note{cur.offMs, cur.key, NoteAction::Release});
        }
    }
    // Per-key sequences are already time-ordered; a stable merge keeps press-before-release within a key.
    std::stable_sort(notes.begin(), notes.end(), [](const Note& a, const Note& b) {
        return a.offsetMs < b.offsetMs;
    });

    return Song::build(name, tempoMap.initialBpm(), std::move(notes), out, outError);
}

} // namespace cadence::song
