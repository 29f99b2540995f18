#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>
#include <memory>

#include "cadence/app/PlayerSettings.h"
#include "cadence/engine/PlaybackClock.h"
#include "cadence/engine/PlaybackScheduler.h"
#include "cadence/engine/ProgressSnapshot.h"
#include "cadence/engine/SchedulerThread.h"
#include "cadence/playlist/PlaylistStore.h"
#include "cadence/song/SongLoader.h"

namespace cadence::input {
class KeyDispatcher;
}

namespace cadence::app {

// UI-thread facade over the playlist, song cache and playback engine.
//
// Controls are posted to the scheduler and take effect on its next tick. Progress is polled from the
// scheduler's published snapshot and re-emitted as signals; nothing here blocks on the loop thread.
class PlayerController : public QObject {
    Q_OBJECT

public:
    PlayerController(const PlayerSettings& settings,
                     std::unique_ptr<input::KeyDispatcher> dispatcher,
                     QObject* parent = nullptr);
    ~PlayerController() override;

    // Loads the persisted playlist and starts the scheduling loop. A broken playlist file is reported
    // and replaced by an empty one; playback still works.
    void start();
    void shutdown();

    const playlist::PlaylistStore& playlist() const { return m_playlist; }
    QVector<playlist::PlaylistEntry> sortedPlaylist() const;
    playlist::SortColumn sortColumn() const { return m_sortColumn; }
    playlist::SortDirection sortDirection() const { return m_sortDirection; }

    QString currentSongRef() const { return m_currentRef; }
    std::shared_ptr<const engine::ProgressSnapshot> progress() const { return m_scheduler.progress(); }
    bool isPlaylistMode() const { return m_playlistMode; }

public slots:
    void play();
    void pause();
    void togglePause();
    // Named toggles for hotkey bindings: "pause", "playlist".
    bool toggleOne(const QString& name);
    void stop();
    void seek(qint64 targetMs);

    void selectSortColumn(cadence::playlist::SortColumn column, cadence::playlist::SortDirection direction);
    bool selectSong(const QString& songRef);
    int addSongs(const QStringList& paths);
    bool removeSong(const QString& songRef);
    bool moveSong(const QString& songRef, int newIndex);

    bool next();
    bool previous();
    void setPlaylistMode(bool enabled);

signals:
    void progressChanged(const cadence::engine::ProgressSnapshot& progress);
    void songCompleted(const QString& songRef);
    void currentSongChanged(const QString& songRef, const QString& displayName);
    void playlistChanged();
    void playlistModeChanged(bool enabled);
    void errorOccurred(const QString& message);

private slots:
    void pollProgress();
    void advancePlaylist();

private:
    bool playFromIndex(int startIndex, int step);
    void reportPlaylistError(const playlist::PlaylistError& err);

    PlayerSettings m_settings;
    std::unique_ptr<input::KeyDispatcher> m_dispatcher;
    engine::SteadyPlaybackClock m_clock;
    engine::PlaybackScheduler m_scheduler;
    engine::SchedulerThread m_thread;

    playlist::PlaylistStore m_playlist;
    song::SongCache m_songs;

    playlist::SortColumn m_sortColumn = playlist::SortColumn::Canonical;
    playlist::SortDirection m_sortDirection = playlist::SortDirection::Ascending;

    QString m_currentRef;
    std::shared_ptr<const song::Song> m_currentSong;
    bool m_playlistMode = false;

    QTimer m_pollTimer;
    QTimer m_gapTimer;
    std::shared_ptr<const engine::ProgressSnapshot> m_lastProgress;
    quint64 m_completedSeen = 0;
};

} // namespace cadence::app
