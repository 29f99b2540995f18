#pragma once

#include <QString>
#include <QVector>

#include "cadence/playlist/PlaylistEntry.h"

namespace cadence::song {
class Song;
}

namespace cadence::playlist {

struct PlaylistError {
    enum class Kind {
        None,
        Unreadable,
        Parse,
        Persistence,
        Duplicate,
        UnknownRef,
    };

    Kind kind = Kind::None;
    QString message;

    bool isError() const { return kind != Kind::None; }
};

// Canonical, persisted playlist.
//
// Every structural change (add/remove/moveTo/refresh) is written back immediately with an atomic
// replace, so an abnormal exit never loses the ordering. When a write fails twice the change stays
// in memory, the store is marked dirty and the call reports a Persistence error.
//
// Sorting never touches canonical order: sortedView() returns a reordered copy.
class PlaylistStore {
public:
    explicit PlaylistStore(const QString& filePath);

    const QString& filePath() const { return m_filePath; }

    // Replaces the in-memory playlist with the persisted one. A missing file is an empty playlist.
    bool load(PlaylistError* outError = nullptr);
    bool persist(PlaylistError* outError = nullptr);

    bool add(const PlaylistEntry& entry, PlaylistError* outError = nullptr);
    bool remove(const QString& songRef, PlaylistError* outError = nullptr);
    bool moveTo(const QString& songRef, int newIndex, PlaylistError* outError = nullptr);

    // Updates cached metadata after a song was (re)loaded; persists only when something changed.
    bool refresh(const QString& songRef, const song::Song& song, PlaylistError* outError = nullptr);
    // Re-checks the missing flag of every entry against the filesystem.
    void refreshAvailability();

    QVector<PlaylistEntry> sortedView(SortColumn column, SortDirection direction) const;

    const QVector<PlaylistEntry>& entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    bool isDirty() const { return m_dirty; }

    int indexOf(const QString& songRef) const;
    const PlaylistEntry* entry(const QString& songRef) const;
    // Canonical neighbours; nullptr at either end or for an unknown ref.
    const PlaylistEntry* entryAfter(const QString& songRef) const;
    const PlaylistEntry* entryBefore(const QString& songRef) const;

private:
    bool writeOnce(QString* outMessage) const;
    bool persistAfterChange(PlaylistError* outError);

    QString m_filePath;
    QVector<PlaylistEntry> m_entries;
    bool m_dirty = false;
};

} // namespace cadence::playlist
