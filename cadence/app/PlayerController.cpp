#include "cadence/app/PlayerController.h"

#include "cadence/input/KeyDispatcher.h"

#include <QDebug>
#include <QFileInfo>
#include <utility>

namespace cadence::app {

namespace {
static engine::PlaybackScheduler::Options schedulerOptions(const PlayerSettings& s) {
    engine::PlaybackScheduler::Options o;
    o.leadInMs = s.leadInMs;
    return o;
}
} // namespace

PlayerController::PlayerController(const PlayerSettings& settings,
                                   std::unique_ptr<input::KeyDispatcher> dispatcher,
                                   QObject* parent)
    : QObject(parent),
      m_settings(settings),
      m_dispatcher(std::move(dispatcher)),
      m_scheduler(&m_clock, m_dispatcher.get(), schedulerOptions(settings)),
      m_thread(&m_scheduler, settings.tickIntervalMs),
      m_playlist(settings.resolvedPlaylistPath()),
      m_songs(settings.csvImportOptions()) {
    connect(&m_pollTimer, &QTimer::timeout, this, &PlayerController::pollProgress);

    m_gapTimer.setSingleShot(true);
    connect(&m_gapTimer, &QTimer::timeout, this, &PlayerController::advancePlaylist);

    m_completedSeen = m_scheduler.progress()->completedSongs;
}

PlayerController::~PlayerController() {
    shutdown();
}

void PlayerController::start() {
    playlist::PlaylistError err;
    if (!m_playlist.load(&err)) reportPlaylistError(err);
    emit playlistChanged();

    m_thread.start();
    m_pollTimer.start(m_settings.pollIntervalMs);
}

void PlayerController::shutdown() {
    m_pollTimer.stop();
    m_gapTimer.stop();
    if (m_thread.isRunning()) {
        m_thread.stop();
        // The loop has exited; release anything still held from this thread.
        m_scheduler.stop();
    }
}

QVector<playlist::PlaylistEntry> PlayerController::sortedPlaylist() const {
    return m_playlist.sortedView(m_sortColumn, m_sortDirection);
}

void PlayerController::play() {
    m_gapTimer.stop();
    const auto p = m_scheduler.progress();
    if (p->state == engine::PlaybackState::Playing) return;

    if (m_currentRef.isEmpty()) {
        if (!playFromIndex(0, +1)) emit errorOccurred("Nothing to play: the playlist has no loadable song");
        return;
    }
    m_scheduler.requestPlay();
}

void PlayerController::pause() {
    m_scheduler.requestPause();
}

void PlayerController::togglePause() {
    m_scheduler.requestTogglePause();
}

bool PlayerController::toggleOne(const QString& name) {
    const QString n = name.trimmed().toLower();
    if (n == "pause") {
        togglePause();
        return true;
    }
    if (n == "playlist") {
        setPlaylistMode(!m_playlistMode);
        return true;
    }
    qWarning().noquote() << "PlayerController: unknown toggle" << name;
    return false;
}

void PlayerController::stop() {
    m_gapTimer.stop();
    m_scheduler.requestStop();
}

void PlayerController::seek(qint64 targetMs) {
    m_scheduler.requestSeek(targetMs);
}

void PlayerController::selectSortColumn(playlist::SortColumn column, playlist::SortDirection direction) {
    if (column == m_sortColumn && direction == m_sortDirection) return;
    m_sortColumn = column;
    m_sortDirection = direction;
    emit playlistChanged();
}

bool PlayerController::selectSong(const QString& songRef) {
    const playlist::PlaylistEntry* entry = m_playlist.entry(songRef);
    if (!entry) {
        emit errorOccurred(QString("'%1' is not in the playlist").arg(songRef));
        return false;
    }
    const QString ref = entry->songRef;

    song::SongParseError perr;
    const std::shared_ptr<const song::Song> song = m_songs.load(ref, &perr);
    if (!song) {
        emit errorOccurred(QString("Cannot load '%1': %2").arg(entry->displayName, perr.message));
        return false;
    }

    playlist::PlaylistError err;
    if (!m_playlist.refresh(ref, *song, &err)) reportPlaylistError(err);

    m_gapTimer.stop();
    // Stop first so the new song never overlaps a running session.
    m_scheduler.requestStop();
    m_scheduler.requestLoad(song);

    m_currentRef = ref;
    m_currentSong = song;
    const playlist::PlaylistEntry* refreshed = m_playlist.entry(ref);
    emit currentSongChanged(ref, refreshed ? refreshed->displayName : song->name());
    emit playlistChanged();
    return true;
}

int PlayerController::addSongs(const QStringList& paths) {
    int added = 0;
    for (const QString& path : paths) {
        const QString ref = QFileInfo(path).absoluteFilePath();
        if (m_playlist.indexOf(ref) >= 0) {
            qInfo().noquote() << "PlayerController: already in playlist:" << ref;
            continue;
        }

        song::SongParseError perr;
        const std::shared_ptr<const song::Song> song = m_songs.load(ref, &perr);
        if (!song) {
            emit errorOccurred(QString("Skipped '%1': %2").arg(path, perr.message));
            continue;
        }

        playlist::PlaylistError err;
        if (!m_playlist.add(playlist::PlaylistEntry::fromSong(ref, *song), &err)) {
            reportPlaylistError(err);
            // A persistence failure keeps the entry in memory.
            if (err.kind != playlist::PlaylistError::Kind::Persistence) continue;
        }
        ++added;
    }
    if (added > 0) emit playlistChanged();
    return added;
}

bool PlayerController::removeSong(const QString& songRef) {
    const playlist::PlaylistEntry* entry = m_playlist.entry(songRef);
    if (!entry) {
        emit errorOccurred(QString("'%1' is not in the playlist").arg(songRef));
        return false;
    }
    const QString ref = entry->songRef;
    if (ref == m_currentRef) {
        stop();
        m_currentRef.clear();
        m_currentSong.reset();
        emit currentSongChanged(QString(), QString());
    }

    playlist::PlaylistError err;
    const bool ok = m_playlist.remove(ref, &err);
    if (!ok) reportPlaylistError(err);
    m_songs.evict(ref);
    emit playlistChanged();
    return ok || err.kind == playlist::PlaylistError::Kind::Persistence;
}

bool PlayerController::moveSong(const QString& songRef, int newIndex) {
    playlist::PlaylistError err;
    const bool ok = m_playlist.moveTo(songRef, newIndex, &err);
    if (!ok) reportPlaylistError(err);
    emit playlistChanged();
    return ok;
}

bool PlayerController::next() {
    const int idx = m_playlist.indexOf(m_currentRef);
    return playFromIndex(idx < 0 ? 0 : idx + 1, +1);
}

bool PlayerController::previous() {
    const int idx = m_playlist.indexOf(m_currentRef);
    if (idx <= 0) return false;
    return playFromIndex(idx - 1, -1);
}

void PlayerController::setPlaylistMode(bool enabled) {
    if (m_playlistMode == enabled) return;
    m_playlistMode = enabled;
    if (!enabled) m_gapTimer.stop();
    qInfo().noquote() << "PlayerController: playlist mode" << (enabled ? "on" : "off");
    emit playlistModeChanged(enabled);
}

bool PlayerController::playFromIndex(int startIndex, int step) {
    const QVector<playlist::PlaylistEntry>& entries = m_playlist.entries();
    for (int i = startIndex; i >= 0 && i < entries.size(); i += step) {
        const playlist::PlaylistEntry e = entries[i];
        if (e.missing) {
            qWarning().noquote() << "PlayerController: skipping missing song" << e.songRef;
            continue;
        }
        if (!selectSong(e.songRef)) continue;
        m_scheduler.requestPlay();
        return true;
    }
    return false;
}

void PlayerController::pollProgress() {
    const std::shared_ptr<const engine::ProgressSnapshot> p = m_scheduler.progress();
    if (p == m_lastProgress) return;
    m_lastProgress = p;
    emit progressChanged(*p);

    if (p->completedSongs > m_completedSeen) {
        m_completedSeen = p->completedSongs;
        const std::shared_ptr<const song::Song>& finished = p->lastCompletedSong;
        if (!finished || finished != m_currentSong) {
            // Another song was selected before this completion was seen; it is not the one that ended.
            const QString ref = m_songs.pathOf(finished.get());
            qInfo().noquote() << "PlayerController: finished song was already replaced" << ref;
            if (!ref.isEmpty()) emit songCompleted(ref);
            return;
        }
        emit songCompleted(m_currentRef);
        // A replay started before this poll keeps playing; no gap.
        if (m_playlistMode && p->state == engine::PlaybackState::Stopped) {
            qInfo().noquote() << "PlayerController: next song in" << m_settings.playlistGapMs << "ms";
            m_gapTimer.start(m_settings.playlistGapMs);
        }
    }
}

void PlayerController::advancePlaylist() {
    if (!m_playlistMode) return;
    if (!next()) {
        qInfo().noquote() << "PlayerController: end of playlist";
        setPlaylistMode(false);
    }
}

void PlayerController::reportPlaylistError(const playlist::PlaylistError& err) {
    qWarning().noquote() << "PlayerController:" << err.message;
    emit errorOccurred(err.message);
}

} // namespace cadence::app
