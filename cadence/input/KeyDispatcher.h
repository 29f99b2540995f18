#pragma once

#include <QString>

namespace cadence::input {

enum class KeyAction {
    Press,
    Release,
};

struct DispatchError {
    enum class Kind {
        None,
        UnknownKey,
        Timeout,
        DeviceUnavailable,
        WriteFailed,
    };

    Kind kind = Kind::None;
    QString message;

    bool isError() const { return kind != Kind::None; }
};

QString dispatchErrorKindName(DispatchError::Kind kind);

// Sink for simulated key actions.
//
// Implementations must treat the release of a key that is not currently held as a successful no-op.
// dispatch() is only ever called from the scheduler thread.
class KeyDispatcher {
public:
    virtual ~KeyDispatcher() = default;

    virtual bool dispatch(const QString& key, KeyAction action, DispatchError* outError = nullptr) = 0;
};

} // namespace cadence::input
