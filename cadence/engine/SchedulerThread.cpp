#include "cadence/engine/SchedulerThread.h"

#include "cadence/engine/PlaybackScheduler.h"

#include <QDebug>

namespace cadence::engine {

SchedulerThread::SchedulerThread(PlaybackScheduler* scheduler, int tickIntervalMs)
    : m_scheduler(scheduler), m_tickIntervalMs(qMax(1, tickIntervalMs)) {}

SchedulerThread::~SchedulerThread() {
    stop();
}

void SchedulerThread::start() {
    if (m_isRunning.exchange(true)) return;
    m_workerThread = std::thread(&SchedulerThread::workerLoop, this);
    qInfo().noquote() << "SchedulerThread: started, tick" << m_tickIntervalMs << "ms";
}

void SchedulerThread::stop() {
    if (!m_isRunning.exchange(false)) return;
    m_scheduler->controlQueue().wake();
    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }
    qInfo().noquote() << "SchedulerThread: stopped";
}

void SchedulerThread::workerLoop() {
    while (m_isRunning) {
        m_scheduler->tick();

        const qint64 due = m_scheduler->msUntilNextDue();
        const qint64 wait = (due < 0) ? m_tickIntervalMs : qMin<qint64>(due, m_tickIntervalMs);
        if (wait > 0 && m_isRunning) m_scheduler->controlQueue().waitFor(wait);
    }
}

} // namespace cadence::engine
