#include "cadence/playlist/PlaylistStore.h"

#include "cadence/song/Song.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QSet>
#include <algorithm>
#include <cmath>
#include <limits>

namespace cadence::playlist {
namespace {

static constexpr int kDocumentVersion = 1;

static bool fail(PlaylistError* outError, PlaylistError::Kind kind, const QString& message) {
    if (outError) {
        outError->kind = kind;
        outError->message = message;
    }
    return false;
}

static void clearError(PlaylistError* outError) {
    if (outError) *outError = PlaylistError{};
}

static QJsonObject entryToJson(const PlaylistEntry& e) {
    QJsonObject o;
    o.insert("ref", e.songRef);
    o.insert("name", e.displayName);
    o.insert("durationMs", double(e.durationMs));
    o.insert("bpm", e.bpm);
    return o;
}

// Cached duration; anything that is not a representable non-negative count of ms reads as unknown (0).
static qint64 readDurationMs(const QJsonValue& v) {
    const double d = v.toDouble(0.0);
    if (!std::isfinite(d) || d <= 0.0 || d >= double(std::numeric_limits<qint64>::max())) return 0;
    return qint64(d);
}

static bool entryFromJson(const QJsonValue& v, PlaylistEntry* out) {
    // Older playlists stored bare paths: {"tracks": ["C:/songs/a.mid", ...]}
    if (v.isString()) {
        const QString path = v.toString().trimmed();
        if (path.isEmpty()) return false;
        *out = PlaylistEntry::forPath(path);
        return true;
    }
    if (!v.isObject()) return false;
    const QJsonObject o = v.toObject();
    const QString ref = o.value("ref").toString().trimmed();
    if (ref.isEmpty()) return false;

    PlaylistEntry e = PlaylistEntry::forPath(ref);
    const QString name = o.value("name").toString().trimmed();
    if (!name.isEmpty()) e.displayName = name;
    e.durationMs = readDurationMs(o.value("durationMs"));
    e.bpm = qMax(0.0, o.value("bpm").toDouble(0.0));
    *out = e;
    return true;
}

static int compareEntries(const PlaylistEntry& a, const PlaylistEntry& b, SortColumn column) {
    switch (column) {
    case SortColumn::Canonical:
        return 0;
    case SortColumn::Name:
        return QString::compare(a.displayName, b.displayName, Qt::CaseInsensitive);
    case SortColumn::Duration:
        return (a.durationMs < b.durationMs) ? -1 : (a.durationMs > b.durationMs ? 1 : 0);
    case SortColumn::Bpm:
        return (a.bpm < b.bpm) ? -1 : (a.bpm > b.bpm ? 1 : 0);
    case SortColumn::Ref:
        return QString::compare(a.songRef, b.songRef, Qt::CaseSensitive);
    }
    return 0;
}

} // namespace

PlaylistStore::PlaylistStore(const QString& filePath)
    : m_filePath(filePath) {}

bool PlaylistStore::load(PlaylistError* outError) {
    QFile f(m_filePath);
    if (!f.exists()) {
        m_entries.clear();
        m_dirty = false;
        clearError(outError);
        return true;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        return fail(outError, PlaylistError::Kind::Unreadable,
                    QString("Failed to open playlist '%1': %2").arg(m_filePath, f.errorString()));
    }

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(outError, PlaylistError::Kind::Parse, QString("Invalid playlist JSON: %1").arg(pe.errorString()));
    }
    const QJsonValue tracksV = doc.object().value("tracks");
    if (!tracksV.isArray()) {
        return fail(outError, PlaylistError::Kind::Parse, "Playlist has no 'tracks' array");
    }

    QVector<PlaylistEntry> loaded;
    QSet<QString> seen;
    const QJsonArray tracks = tracksV.toArray();
    for (int i = 0; i < tracks.size(); ++i) {
        PlaylistEntry e;
        if (!entryFromJson(tracks.at(i), &e)) {
            qWarning().noquote() << "PlaylistStore: skipping malformed track" << i << "in" << m_filePath;
            continue;
        }
        if (seen.contains(e.songRef)) {
            qWarning().noquote() << "PlaylistStore: dropping duplicate" << e.songRef;
            continue;
        }
        seen.insert(e.songRef);
        if (e.missing) qWarning().noquote() << "PlaylistStore: missing song file" << e.songRef;
        loaded.push_back(e);
    }

    m_entries = loaded;
    m_dirty = false;
    qInfo().noquote() << QString("PlaylistStore: loaded %1 entries from %2").arg(m_entries.size()).arg(m_filePath);
    clearError(outError);
    return true;
}

bool PlaylistStore::writeOnce(QString* outMessage) const {
    const QFileInfo fi(m_filePath);
    if (!QDir().mkpath(fi.absolutePath())) {
        if (outMessage) *outMessage = QString("cannot create directory '%1'").arg(fi.absolutePath());
        return false;
    }

    QJsonArray tracks;
    for (const PlaylistEntry& e : m_entries) tracks.append(entryToJson(e));
    QJsonObject root;
    root.insert("version", kDocumentVersion);
    root.insert("tracks", tracks);

    // QSaveFile writes to a temporary file and renames it over the target on commit().
    QSaveFile out(m_filePath);
    if (!out.open(QIODevice::WriteOnly)) {
        if (outMessage) *outMessage = out.errorString();
        return false;
    }
    const QByteArray bytes = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (out.write(bytes) != bytes.size()) {
        if (outMessage) *outMessage = out.errorString();
        out.cancelWriting();
        return false;
    }
    if (!out.commit()) {
        if (outMessage) *outMessage = out.errorString();
        return false;
    }
    return true;
}

bool PlaylistStore::persist(PlaylistError* outError) {
    QString message;
    if (writeOnce(&message)) {
        m_dirty = false;
        clearError(outError);
        return true;
    }
    qWarning().noquote() << "PlaylistStore: write failed, retrying:" << message;
    if (writeOnce(&message)) {
        m_dirty = false;
        clearError(outError);
        return true;
    }

    m_dirty = true;
    qWarning().noquote() << "PlaylistStore: could not save" << m_filePath << "-" << message;
    return fail(outError, PlaylistError::Kind::Persistence,
                QString("Could not save playlist '%1': %2").arg(m_filePath, message));
}

bool PlaylistStore::persistAfterChange(PlaylistError* outError) {
    m_dirty = true;
    return persist(outError);
}

bool PlaylistStore::add(const PlaylistEntry& entry, PlaylistError* outError) {
    if (entry.songRef.trimmed().isEmpty()) {
        return fail(outError, PlaylistError::Kind::UnknownRef, "Cannot add an entry without a song reference");
    }
    PlaylistEntry e = entry;
    const QFileInfo fi(e.songRef);
    e.songRef = fi.absoluteFilePath();
    e.missing = !fi.exists();
    if (e.displayName.trimmed().isEmpty()) e.displayName = fi.completeBaseName();

    if (indexOf(e.songRef) >= 0) {
        return fail(outError, PlaylistError::Kind::Duplicate, QString("'%1' is already in the playlist").arg(e.songRef));
    }
    m_entries.push_back(e);
    return persistAfterChange(outError);
}

bool PlaylistStore::remove(const QString& songRef, PlaylistError* outError) {
    const int idx = indexOf(songRef);
    if (idx < 0) {
        return fail(outError, PlaylistError::Kind::UnknownRef, QString("'%1' is not in the playlist").arg(songRef));
    }
    m_entries.removeAt(idx);
    return persistAfterChange(outError);
}

bool PlaylistStore::moveTo(const QString& songRef, int newIndex, PlaylistError* outError) {
    const int idx = indexOf(songRef);
    if (idx < 0) {
        return fail(outError, PlaylistError::Kind::UnknownRef, QString("'%1' is not in the playlist").arg(songRef));
    }
    const int target = qBound(0, newIndex, int(m_entries.size()) - 1);
    if (target == idx) {
        clearError(outError);
        return true;
    }
    m_entries.move(idx, target);
    return persistAfterChange(outError);
}

bool PlaylistStore::refresh(const QString& songRef, const song::Song& song, PlaylistError* outError) {
    const int idx = indexOf(songRef);
    if (idx < 0) {
        return fail(outError, PlaylistError::Kind::UnknownRef, QString("'%1' is not in the playlist").arg(songRef));
    }
    PlaylistEntry& e = m_entries[idx];
    const QString name = song.name().isEmpty() ? e.displayName : song.name();
    const bool changed = e.displayName != name || e.durationMs != song.durationMs()
        || !qFuzzyCompare(1.0 + e.bpm, 1.0 + song.bpm()) || e.missing;
    e.displayName = name;
    e.durationMs = song.durationMs();
    e.bpm = song.bpm();
    e.missing = false;
    if (!changed) {
        clearError(outError);
        return true;
    }
    return persistAfterChange(outError);
}

void PlaylistStore::refreshAvailability() {
    for (PlaylistEntry& e : m_entries) e.missing = !QFileInfo::exists(e.songRef);
}

QVector<PlaylistEntry> PlaylistStore::sortedView(SortColumn column, SortDirection direction) const {
    QVector<PlaylistEntry> view = m_entries;
    if (column == SortColumn::Canonical) {
        if (direction == SortDirection::Descending) std::reverse(view.begin(), view.end());
        return view;
    }
    // Stable: equal keys keep canonical order in both directions.
    std::stable_sort(view.begin(), view.end(), [column, direction](const PlaylistEntry& a, const PlaylistEntry& b) {
        const int c = compareEntries(a, b, column);
        return direction == SortDirection::Ascending ? c < 0 : c > 0;
    });
    return view;
}

int PlaylistStore::indexOf(const QString& songRef) const {
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].songRef == songRef) return i;
    }
    // Callers may hand us a relative path.
    const QString abs = QFileInfo(songRef).absoluteFilePath();
    if (abs == songRef) return -1;
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].songRef == abs) return i;
    }
    return -1;
}

const PlaylistEntry* PlaylistStore::entry(const QString& songRef) const {
    const int idx = indexOf(songRef);
    return idx >= 0 ? &m_entries[idx] : nullptr;
}

const PlaylistEntry* PlaylistStore::entryAfter(const QString& songRef) const {
    const int idx = indexOf(songRef);
    if (idx < 0 || idx + 1 >= m_entries.size()) return nullptr;
    return &m_entries[idx + 1];
}

const PlaylistEntry* PlaylistStore::entryBefore(const QString& songRef) const {
    const int idx = indexOf(songRef);
    if (idx <= 0) return nullptr;
    return &m_entries[idx - 1];
}

} // namespace cadence::playlist
