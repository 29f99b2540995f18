#pragma once

#include <QElapsedTimer>
#include <QSet>

#include "cadence/input/KeyDispatcher.h"

namespace cadence::input {

// Dry-run sink: validates each key and logs the action instead of injecting it.
class LoggingKeyDispatcher final : public KeyDispatcher {
public:
    LoggingKeyDispatcher();

    bool dispatch(const QString& key, KeyAction action, DispatchError* outError = nullptr) override;

    int heldCount() const { return m_held.size(); }

private:
    QElapsedTimer m_timer;
    QSet<QString> m_held;
};

} // namespace cadence::input
