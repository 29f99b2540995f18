#include "cadence/input/LoggingKeyDispatcher.h"

#include "cadence/input/KeyCombo.h"

#include <QDebug>

namespace cadence::input {

LoggingKeyDispatcher::LoggingKeyDispatcher() {
    m_timer.start();
}

bool LoggingKeyDispatcher::dispatch(const QString& key, KeyAction action, DispatchError* outError) {
    if (action == KeyAction::Release) {
        if (!m_held.remove(key)) return true;
    } else {
        if (m_held.contains(key)) return true;
        if (!parseKeyCombo(key, nullptr, outError)) return false;
        m_held.insert(key);
    }
    qInfo().noquote() << QString("DryRun: %1 %2 @%3ms")
                             .arg(action == KeyAction::Press ? "press  " : "release")
                             .arg(key)
                             .arg(m_timer.elapsed());
    return true;
}

} // namespace cadence::input
