#pragma once

#include <QtGlobal>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

namespace cadence::song {
class Song;
}

namespace cadence::engine {

struct ControlSignal {
    enum class Kind {
        Load,
        Play,
        Pause,
        TogglePause,
        Seek,
        Stop,
    };

    Kind kind = Kind::Stop;
    std::shared_ptr<const song::Song> song; // Load only
    qint64 targetMs = 0;                    // Seek only
};

const char* controlSignalName(ControlSignal::Kind kind);

// Mutex-guarded FIFO between the controller (UI thread) and the scheduling loop.
// The loop drains it at the start of a tick, so a signal never lands inside a dispatch batch.
class ControlQueue {
public:
    void push(ControlSignal signal);
    std::vector<ControlSignal> drain();
    bool isEmpty() const;

    // Blocks until a signal is queued, wake() is called or timeoutMs elapses.
    void waitFor(qint64 timeoutMs);
    void wake();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::queue<ControlSignal> m_signals;
    bool m_woken = false;
};

} // namespace cadence::engine
