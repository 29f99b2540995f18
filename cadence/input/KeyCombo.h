#pragma once

#include <QString>
#include <QVector>

#include "cadence/input/KeyDispatcher.h"

namespace cadence::input {

// A symbolic key such as "a", "shift+q" or "ctrl+e" resolved to Linux input event codes.
struct KeyCombo {
    QVector<int> modifiers; // KEY_LEFTSHIFT / KEY_LEFTCTRL / KEY_LEFTALT, in press order
    int code = 0;
};

bool parseKeyCombo(const QString& key, KeyCombo* out, DispatchError* outError = nullptr);

// Every code parseKeyCombo() can produce; a virtual device must enable all of them.
QVector<int> supportedKeyCodes();

} // namespace cadence::input
