#pragma once

#include <QString>
#include <QtGlobal>
#include <memory>

#include "cadence/engine/ControlQueue.h"
#include "cadence/engine/PlaybackClock.h"
#include "cadence/engine/PlaybackSession.h"
#include "cadence/engine/ProgressSnapshot.h"

namespace cadence::input {
class KeyDispatcher;
}

namespace cadence::engine {

struct PlaybackError {
    enum class Kind {
        None,
        InvalidState,
    };

    Kind kind = Kind::None;
    QString message;

    bool isError() const { return kind != Kind::None; }
};

// Turns a loaded song into timed key actions.
//
// Threading: post()/request*() and progress() may be called from any thread. Everything else,
// including tick() and the direct control methods, runs on the scheduling thread (or in tests,
// on the only thread). A rejected control has no side effect beyond the rejection counter.
class PlaybackScheduler {
public:
    struct Options {
        qint64 leadInMs = 0; // silence before the first note of a fresh play
    };

    PlaybackScheduler(PlaybackClock* clock, input::KeyDispatcher* dispatcher);
    PlaybackScheduler(PlaybackClock* clock, input::KeyDispatcher* dispatcher, Options options);

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    // --- Any thread ---
    void post(ControlSignal signal);
    void requestLoad(std::shared_ptr<const song::Song> song);
    void requestPlay() { post({ControlSignal::Kind::Play, nullptr, 0}); }
    void requestPause() { post({ControlSignal::Kind::Pause, nullptr, 0}); }
    void requestTogglePause() { post({ControlSignal::Kind::TogglePause, nullptr, 0}); }
    void requestSeek(qint64 targetMs) { post({ControlSignal::Kind::Seek, nullptr, targetMs}); }
    void requestStop() { post({ControlSignal::Kind::Stop, nullptr, 0}); }

    std::shared_ptr<const ProgressSnapshot> progress() const;
    ControlQueue& controlQueue() { return m_controls; }

    // --- Scheduling thread ---
    // Drains queued controls, then dispatches every note due at the current clock reading.
    void tick();
    // Milliseconds until the next note is due; -1 when nothing is pending (not playing).
    qint64 msUntilNextDue() const;

    bool load(std::shared_ptr<const song::Song> song, PlaybackError* outError = nullptr);
    bool play(PlaybackError* outError = nullptr);
    bool pause(PlaybackError* outError = nullptr);
    bool togglePause(PlaybackError* outError = nullptr);
    bool seek(qint64 targetMs, PlaybackError* outError = nullptr);
    void stop();

    PlaybackState state() const;
    int heldKeyCount() const { return m_session ? m_session->heldKeys.size() : 0; }

private:
    void applyControl(const ControlSignal& signal);
    bool reject(PlaybackError* outError, const QString& message);

    void dispatchDue(qint64 nowMs);
    bool dispatchKey(const QString& key, bool press);
    void releaseHeldKeys();
    void finishSong();
    void publish();

    PlaybackClock* m_clock = nullptr;               // not owned
    input::KeyDispatcher* m_dispatcher = nullptr;   // not owned
    Options m_options;

    ControlQueue m_controls;

    std::shared_ptr<const song::Song> m_song; // survives stop() so play() can restart
    std::unique_ptr<PlaybackSession> m_session;

    int m_lastSkippedNotes = 0;
    quint64 m_completedSongs = 0;
    std::shared_ptr<const song::Song> m_lastCompletedSong;
    quint64 m_rejectedControls = 0;

    std::shared_ptr<const ProgressSnapshot> m_progress; // std::atomic_load/atomic_store only
};

} // namespace cadence::engine
