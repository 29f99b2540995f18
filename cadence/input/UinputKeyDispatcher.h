#pragma once

#include <QHash>
#include <QSet>
#include <QString>
#include <QVector>
#include <functional>

#include "cadence/input/KeyDispatcher.h"

namespace cadence::input {

// Virtual keyboard backed by /dev/uinput.
//
// Modifiers are reference counted across held combos: "shift+q" and "shift+w" held together keep
// shift down until both are released. A press that fails partway lifts whatever it already put
// down, so a failed combo never leaves a modifier latched.
class UinputKeyDispatcher final : public KeyDispatcher {
public:
    // Writes one input event (type, code, value). Returns false and fills outError on failure.
    using EventWriter = std::function<bool(int type, int code, int value, DispatchError* outError)>;

    explicit UinputKeyDispatcher(int writeTimeoutMs = 20, QString devicePath = "/dev/uinput");
    // Sends events through `writer` instead of a uinput device. The dispatcher starts open.
    explicit UinputKeyDispatcher(EventWriter writer);
    ~UinputKeyDispatcher() override;

    UinputKeyDispatcher(const UinputKeyDispatcher&) = delete;
    UinputKeyDispatcher& operator=(const UinputKeyDispatcher&) = delete;

    bool open(DispatchError* outError = nullptr);
    void close();
    bool isOpen() const { return m_fd >= 0 || bool(m_writer); }

    bool dispatch(const QString& key, KeyAction action, DispatchError* outError = nullptr) override;

private:
    bool emitEvent(int type, int code, int value, DispatchError* outError);
    bool sync(DispatchError* outError);
    bool liftKey(int code, DispatchError* outError);
    bool dropModifiers(const QVector<int>& modifiers, DispatchError* outError);
    void abandonPress(const QString& key, int code, bool codeDown, const QVector<int>& counted);
    void releaseAll();

    int m_fd = -1;
    int m_writeTimeoutMs = 20;
    QString m_devicePath;
    EventWriter m_writer;

    QSet<QString> m_held;
    QHash<int, int> m_modifierRefs;
    // Codes whose key-up write failed; retried by close().
    QSet<int> m_unreleased;
};

} // namespace cadence::input
