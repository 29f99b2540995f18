#include "cadence/song/SongLoader.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <utility>

namespace cadence::song {

bool loadSongFile(const QString& path,
                  const MidiCsvImportOptions& csvOptions,
                  Song* out,
                  SongParseError* outError) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (outError) {
            outError->kind = SongParseError::Kind::Unreadable;
            outError->noteIndex = -1;
            outError->message = QString("Failed to open song '%1': %2").arg(path, f.errorString());
        }
        return false;
    }
    const QByteArray bytes = f.readAll();
    const QFileInfo fi(path);
    const QString baseName = fi.completeBaseName();

    if (fi.suffix().compare("csv", Qt::CaseInsensitive) == 0) {
        return importMidiCsv(bytes, baseName, csvOptions, out, outError);
    }
    return loadSong(bytes, baseName, out, outError);
}

SongCache::SongCache(MidiCsvImportOptions csvOptions)
    : m_csvOptions(std::move(csvOptions)) {}

std::shared_ptr<const Song> SongCache::load(const QString& path, SongParseError* outError) {
    if (auto hit = cached(path)) return hit;

    Song song;
    SongParseError err;
    if (!loadSongFile(path, m_csvOptions, &song, &err)) {
        qWarning().noquote() << "SongCache: rejected" << path << "-"
                             << parseErrorKindName(err.kind) << err.message;
        if (outError) *outError = err;
        return nullptr;
    }

    auto shared = std::make_shared<const Song>(std::move(song));
    m_songs.insert(path, shared);
    qInfo().noquote() << QString("SongCache: loaded %1 (%2 notes, %3 ms, %4 bpm)")
                             .arg(shared->name())
                             .arg(shared->noteCount())
                             .arg(shared->durationMs())
                             .arg(shared->bpm());
    return shared;
}

std::shared_ptr<const Song> SongCache::cached(const QString& path) const {
    return m_songs.value(path);
}

QString SongCache::pathOf(const Song* song) const {
    if (!song) return QString();
    for (auto it = m_songs.cbegin(); it != m_songs.cend(); ++it) {
        if (it.value().get() == song) return it.key();
    }
    return QString();
}

} // namespace cadence::song
