#pragma once

#include <atomic>
#include <thread>

namespace cadence::engine {

class PlaybackScheduler;

// Drives PlaybackScheduler::tick() on a dedicated std::thread.
// The loop sleeps until the next note is due or the tick interval elapses, whichever is sooner;
// a posted control wakes it immediately.
class SchedulerThread {
public:
    SchedulerThread(PlaybackScheduler* scheduler, int tickIntervalMs);
    ~SchedulerThread();

    SchedulerThread(const SchedulerThread&) = delete;
    SchedulerThread& operator=(const SchedulerThread&) = delete;

    void start();
    void stop(); // joins
    bool isRunning() const { return m_isRunning.load(); }

private:
    void workerLoop();

    PlaybackScheduler* m_scheduler = nullptr; // not owned
    int m_tickIntervalMs = 5;
    std::thread m_workerThread;
    std::atomic<bool> m_isRunning{false};
};

} // namespace cadence::engine
