#include "cadence/playlist/PlaylistEntry.h"

#include "cadence/song/Song.h"

#include <QFileInfo>

namespace cadence::playlist {

PlaylistEntry PlaylistEntry::forPath(const QString& path) {
    const QFileInfo fi(path);
    PlaylistEntry e;
    e.songRef = fi.absoluteFilePath();
    e.displayName = fi.completeBaseName();
    e.missing = !fi.exists();
    return e;
}

PlaylistEntry PlaylistEntry::fromSong(const QString& path, const song::Song& song) {
    PlaylistEntry e = forPath(path);
    if (!song.name().isEmpty()) e.displayName = song.name();
    e.durationMs = song.durationMs();
    e.bpm = song.bpm();
    return e;
}

bool sortColumnFromName(const QString& name, SortColumn* out) {
    const QString n = name.trimmed().toLower();
    SortColumn c;
    if (n == "canonical" || n == "order" || n == "#") c = SortColumn::Canonical;
    else if (n == "name" || n == "title") c = SortColumn::Name;
    else if (n == "duration" || n == "length") c = SortColumn::Duration;
    else if (n == "bpm" || n == "tempo") c = SortColumn::Bpm;
    else if (n == "ref" || n == "path" || n == "file") c = SortColumn::Ref;
    else return false;
    if (out) *out = c;
    return true;
}

QString sortColumnName(SortColumn column) {
    switch (column) {
    case SortColumn::Canonical: return "canonical";
    case SortColumn::Name: return "name";
    case SortColumn::Duration: return "duration";
    case SortColumn::Bpm: return "bpm";
    case SortColumn::Ref: return "ref";
    }
    return {};
}

} // namespace cadence::playlist
