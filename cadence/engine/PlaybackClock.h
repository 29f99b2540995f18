#pragma once

#include <QElapsedTimer>

namespace cadence::engine {

// Monotonic time base for the scheduler. Every fire time is derived from nowMs(), never from
// accumulated tick deltas.
class PlaybackClock {
public:
    virtual ~PlaybackClock() = default;
    virtual qint64 nowMs() const = 0;
};

// Production clock (QElapsedTimer: monotonic where the platform offers it).
class SteadyPlaybackClock final : public PlaybackClock {
public:
    SteadyPlaybackClock() { m_timer.start(); }
    qint64 nowMs() const override { return m_timer.elapsed(); }

private:
    QElapsedTimer m_timer;
};

} // namespace cadence::engine
