#pragma once

#include <QString>
#include <QtGlobal>

namespace cadence::song {
class Song;
}

namespace cadence::playlist {

struct PlaylistEntry {
    QString songRef; // absolute path of the song file; unique within a playlist
    QString displayName;
    qint64 durationMs = 0;
    double bpm = 0.0; // 0 until the song has been loaded once

    // Derived on load: the referenced file no longer exists. Kept in place so the user's ordering survives.
    bool missing = false;

    static PlaylistEntry forPath(const QString& path);
    static PlaylistEntry fromSong(const QString& path, const song::Song& song);
};

enum class SortColumn {
    Canonical,
    Name,
    Duration,
    Bpm,
    Ref,
};

enum class SortDirection {
    Ascending,
    Descending,
};

bool sortColumnFromName(const QString& name, SortColumn* out);
QString sortColumnName(SortColumn column);

} // namespace cadence::playlist
