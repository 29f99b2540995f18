#include "cadence/engine/PlaybackScheduler.h"

#include "cadence/input/KeyDispatcher.h"

#include <QDebug>
#include <algorithm>
#include <utility>

namespace cadence::engine {

PlaybackScheduler::PlaybackScheduler(PlaybackClock* clock, input::KeyDispatcher* dispatcher)
    : PlaybackScheduler(clock, dispatcher, Options{}) {}

PlaybackScheduler::PlaybackScheduler(PlaybackClock* clock, input::KeyDispatcher* dispatcher, Options options)
    : m_clock(clock), m_dispatcher(dispatcher), m_options(options) {
    m_options.leadInMs = qMax<qint64>(0, m_options.leadInMs);
    publish();
}

void PlaybackScheduler::post(ControlSignal signal) {
    m_controls.push(std::move(signal));
}

void PlaybackScheduler::requestLoad(std::shared_ptr<const song::Song> song) {
    ControlSignal s;
    s.kind = ControlSignal::Kind::Load;
    s.song = std::move(song);
    post(std::move(s));
}

std::shared_ptr<const ProgressSnapshot> PlaybackScheduler::progress() const {
    return std::atomic_load(&m_progress);
}

PlaybackState PlaybackScheduler::state() const {
    return m_session ? m_session->state : PlaybackState::Stopped;
}

void PlaybackScheduler::tick() {
    for (const ControlSignal& s : m_controls.drain()) applyControl(s);

    if (m_session && m_session->state == PlaybackState::Playing) {
        dispatchDue(m_clock->nowMs());
    }
    publish();
}

qint64 PlaybackScheduler::msUntilNextDue() const {
    if (!m_session || m_session->state != PlaybackState::Playing) return -1;
    if (!m_controls.isEmpty()) return 0;

    const qint64 now = m_clock->nowMs();
    // During the lead-in the musical clock is frozen at 0 until startClockMs.
    const qint64 leadIn = qMax<qint64>(0, m_session->startClockMs - now);

    const auto& notes = m_session->song->notes();
    if (m_session->cursorIndex >= notes.size()) return leadIn;

    const qint64 due = notes[m_session->cursorIndex].offsetMs;
    return qMax<qint64>(0, due - m_session->elapsedAt(now)) + leadIn;
}

void PlaybackScheduler::applyControl(const ControlSignal& signal) {
    PlaybackError err;
    bool ok = true;
    switch (signal.kind) {
    case ControlSignal::Kind::Load: ok = load(signal.song, &err); break;
    case ControlSignal::Kind::Play: ok = play(&err); break;
    case ControlSignal::Kind::Pause: ok = pause(&err); break;
    case ControlSignal::Kind::TogglePause: ok = togglePause(&err); break;
    case ControlSignal::Kind::Seek: ok = seek(signal.targetMs, &err); break;
    case ControlSignal::Kind::Stop: stop(); break;
    }
    if (!ok) {
        qDebug().noquote() << "Scheduler: queued" << controlSignalName(signal.kind) << "dropped";
    }
}

bool PlaybackScheduler::reject(PlaybackError* outError, const QString& message) {
    ++m_rejectedControls;
    qWarning().noquote() << "Scheduler: rejected -" << message;
    if (outError) {
        outError->kind = PlaybackError::Kind::InvalidState;
        outError->message = message;
    }
    publish();
    return false;
}

bool PlaybackScheduler::load(std::shared_ptr<const song::Song> song, PlaybackError* outError) {
    if (state() != PlaybackState::Stopped) {
        return reject(outError, QString("load while %1").arg(playbackStateName(state())));
    }
    if (!song) return reject(outError, "load without a song");

    m_song = std::move(song);
    m_session = std::make_unique<PlaybackSession>();
    m_session->song = m_song;
    m_lastSkippedNotes = 0;
    qInfo().noquote() << QString("Scheduler: loaded '%1' (%2 notes, %3)")
                             .arg(m_song->name())
                             .arg(m_song->noteCount())
                             .arg(formatClock(m_song->durationMs()));
    publish();
    return true;
}

bool PlaybackScheduler::play(PlaybackError* outError) {
    const qint64 now = m_clock->nowMs();
    const PlaybackState st = state();

    if (st == PlaybackState::Playing) return reject(outError, "play while Playing");

    if (st == PlaybackState::Paused) {
        PlaybackSession& s = *m_session;
        s.startClockMs = now + s.pendingLeadInMs;
        s.pendingLeadInMs = 0;
        s.state = PlaybackState::Playing;
        // Restore what the pause took away before anything later in the song goes out.
        for (const QString& key : s.suspendedKeys) {
            if (dispatchKey(key, true)) s.heldKeys.insert(key);
        }
        s.suspendedKeys.clear();
        qInfo().noquote() << "Scheduler: resumed at" << formatClock(s.accumulatedMs);
        publish();
        return true;
    }

    if (!m_song) return reject(outError, "play with no song loaded");

    // Fresh run from the top: a session left by load() is reused, anything else is replaced.
    if (!m_session) {
        m_session = std::make_unique<PlaybackSession>();
        m_session->song = m_song;
    }
    PlaybackSession& s = *m_session;
    s.state = PlaybackState::Playing;
    s.startClockMs = now + m_options.leadInMs;
    s.accumulatedMs = 0;
    s.pendingLeadInMs = 0;
    s.cursorIndex = 0;
    s.lastDispatchedElapsedMs = -1;
    s.skippedNotes = 0;
    qInfo().noquote() << QString("Scheduler: playing '%1' (lead-in %2 ms)").arg(m_song->name()).arg(m_options.leadInMs);
    publish();
    return true;
}

bool PlaybackScheduler::pause(PlaybackError* outError) {
    if (state() != PlaybackState::Playing) {
        return reject(outError, QString("pause while %1").arg(playbackStateName(state())));
    }
    const qint64 now = m_clock->nowMs();
    PlaybackSession& s = *m_session;
    s.accumulatedMs = s.elapsedAt(now);
    s.pendingLeadInMs = qMax<qint64>(0, s.startClockMs - now);
    s.state = PlaybackState::Paused;

    QStringList held = s.heldKeys.values();
    std::sort(held.begin(), held.end());
    for (const QString& key : held) dispatchKey(key, false);
    s.heldKeys.clear();
    s.suspendedKeys = held;

    qInfo().noquote() << "Scheduler: paused at" << formatClock(s.accumulatedMs);
    publish();
    return true;
}

bool PlaybackScheduler::togglePause(PlaybackError* outError) {
    switch (state()) {
    case PlaybackState::Playing: return pause(outError);
    case PlaybackState::Paused: return play(outError);
    case PlaybackState::Stopped: break;
    }
    return reject(outError, "toggle pause while Stopped");
}

bool PlaybackScheduler::seek(qint64 targetMs, PlaybackError* outError) {
    const PlaybackState st = state();
    if (st == PlaybackState::Stopped) return reject(outError, "seek while Stopped");

    PlaybackSession& s = *m_session;
    const qint64 target = qBound<qint64>(0, targetMs, s.song->durationMs());

    releaseHeldKeys();
    s.suspendedKeys.clear();
    s.accumulatedMs = target;
    s.pendingLeadInMs = 0;
    if (st == PlaybackState::Playing) s.startClockMs = m_clock->nowMs();
    s.cursorIndex = s.song->firstNoteAtOrAfter(target);
    s.lastDispatchedElapsedMs = target;

    qInfo().noquote() << "Scheduler: seek to" << formatClock(target) << "cursor" << s.cursorIndex;
    publish();
    return true;
}

void PlaybackScheduler::stop() {
    if (!m_session) return;
    releaseHeldKeys();
    m_lastSkippedNotes = m_session->skippedNotes;
    const bool wasActive = m_session->state != PlaybackState::Stopped;
    m_session.reset();
    if (wasActive) qInfo().noquote() << "Scheduler: stopped";
    publish();
}

void PlaybackScheduler::dispatchDue(qint64 nowMs) {
    PlaybackSession& s = *m_session;
    if (nowMs < s.startClockMs) return; // still in the lead-in

    const auto& notes = s.song->notes();
    const qint64 elapsed = s.elapsedAt(nowMs);

    // Catch-up batch: everything whose time has come goes out in order, however late we woke.
    while (s.cursorIndex < notes.size() && notes[s.cursorIndex].offsetMs <= elapsed) {
        const song::Note& n = notes[s.cursorIndex];
        ++s.cursorIndex;
        if (n.isPress()) {
            if (s.heldKeys.contains(n.key)) continue;
            if (dispatchKey(n.key, true)) s.heldKeys.insert(n.key);
            else ++s.skippedNotes;
        } else {
            if (!s.heldKeys.remove(n.key)) continue;
            if (!dispatchKey(n.key, false)) ++s.skippedNotes;
        }
    }
    s.lastDispatchedElapsedMs = elapsed;

    if (s.cursorIndex >= notes.size()) finishSong();
}

bool PlaybackScheduler::dispatchKey(const QString& key, bool press) {
    if (!m_dispatcher) return false;
    input::DispatchError err;
    if (m_dispatcher->dispatch(key, press ? input::KeyAction::Press : input::KeyAction::Release, &err)) return true;
    qWarning().noquote() << "Scheduler:" << (press ? "press" : "release") << key << "failed -"
                         << input::dispatchErrorKindName(err.kind) << err.message;
    return false;
}

void PlaybackScheduler::releaseHeldKeys() {
    if (!m_session) return;
    QStringList held = m_session->heldKeys.values();
    std::sort(held.begin(), held.end());
    for (const QString& key : held) dispatchKey(key, false);
    m_session->heldKeys.clear();
}

void PlaybackScheduler::finishSong() {
    releaseHeldKeys();
    m_lastSkippedNotes = m_session->skippedNotes;
    m_session.reset();
    ++m_completedSongs;
    m_lastCompletedSong = m_song;
    qInfo().noquote() << QString("Scheduler: finished '%1' (%2 skipped)").arg(m_song->name()).arg(m_lastSkippedNotes);
}

void PlaybackScheduler::publish() {
    auto p = std::make_shared<ProgressSnapshot>();
    p->state = state();
    if (m_song) {
        p->durationMs = m_song->durationMs();
        p->noteCount = m_song->noteCount();
        p->songName = m_song->name();
        p->bpm = m_song->bpm();
    }
    if (m_session) {
        const qint64 elapsed = m_session->elapsedAt(m_clock->nowMs());
        p->elapsedMs = qBound<qint64>(0, elapsed, p->durationMs);
        p->cursorIndex = m_session->cursorIndex;
        p->skippedNotes = m_session->skippedNotes;
    } else {
        p->skippedNotes = m_lastSkippedNotes;
    }
    p->completedSongs = m_completedSongs;
    p->lastCompletedSong = m_lastCompletedSong;
    p->rejectedControls = m_rejectedControls;
    std::atomic_store(&m_progress, std::shared_ptr<const ProgressSnapshot>(std::move(p)));
}

} // namespace cadence::engine
