#pragma once

#include <QHash>
#include <QString>
#include <memory>

#include "cadence/song/MidiCsvImporter.h"
#include "cadence/song/Song.h"

namespace cadence::song {

// Loads a song file, choosing the parser by suffix (.json song documents, .csv midicsv dumps).
bool loadSongFile(const QString& path,
                  const MidiCsvImportOptions& csvOptions,
                  Song* out,
                  SongParseError* outError = nullptr);

// Parsed songs keyed by file path. Failures are not cached so a fixed file loads on the next try.
class SongCache {
public:
    explicit SongCache(MidiCsvImportOptions csvOptions = {});

    std::shared_ptr<const Song> load(const QString& path, SongParseError* outError = nullptr);
    std::shared_ptr<const Song> cached(const QString& path) const;
    // Path the given cached song was loaded from; empty when it is not (or no longer) cached.
    QString pathOf(const Song* song) const;

    void evict(const QString& path) { m_songs.remove(path); }
    int size() const { return m_songs.size(); }

private:
    MidiCsvImportOptions m_csvOptions;
    QHash<QString, std::shared_ptr<const Song>> m_songs;
};

} // namespace cadence::song
