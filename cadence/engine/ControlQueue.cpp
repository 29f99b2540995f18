#include "cadence/engine/ControlQueue.h"

#include <chrono>
#include <utility>

namespace cadence::engine {

const char* controlSignalName(ControlSignal::Kind kind) {
    switch (kind) {
    case ControlSignal::Kind::Load: return "load";
    case ControlSignal::Kind::Play: return "play";
    case ControlSignal::Kind::Pause: return "pause";
    case ControlSignal::Kind::TogglePause: return "togglePause";
    case ControlSignal::Kind::Seek: return "seek";
    case ControlSignal::Kind::Stop: return "stop";
    }
    return "?";
}

void ControlQueue::push(ControlSignal signal) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_signals.push(std::move(signal));
    m_condition.notify_one();
}

std::vector<ControlSignal> ControlQueue::drain() {
    std::vector<ControlSignal> out;
    std::lock_guard<std::mutex> lock(m_mutex);
    out.reserve(m_signals.size());
    while (!m_signals.empty()) {
        out.push_back(std::move(m_signals.front()));
        m_signals.pop();
    }
    return out;
}

bool ControlQueue::isEmpty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_signals.empty();
}

void ControlQueue::waitFor(qint64 timeoutMs) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait_for(lock, std::chrono::milliseconds(qMax<qint64>(0, timeoutMs)),
                         [this] { return !m_signals.empty() || m_woken; });
    m_woken = false;
}

void ControlQueue::wake() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_woken = true;
    m_condition.notify_one();
}

} // namespace cadence::engine
