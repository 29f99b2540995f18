#include "cadence/input/KeyCombo.h"

#include <QHash>
#include <QStringList>
#include <linux/input-event-codes.h>

namespace cadence::input {
namespace {

static const QHash<QString, int>& keyTable() {
    static const QHash<QString, int> table = {
        {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E}, {"f", KEY_F},
        {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J}, {"k", KEY_K}, {"l", KEY_L},
        {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O}, {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R},
        {"s", KEY_S}, {"t", KEY_T}, {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X},
        {"y", KEY_Y}, {"z", KEY_Z},
        {"0", KEY_0}, {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4},
        {"5", KEY_5}, {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9},
        {"space", KEY_SPACE}, {"enter", KEY_ENTER}, {"tab", KEY_TAB}, {"esc", KEY_ESC},
        {"minus", KEY_MINUS}, {"-", KEY_MINUS}, {"equal", KEY_EQUAL}, {"=", KEY_EQUAL},
        {"comma", KEY_COMMA}, {",", KEY_COMMA}, {"dot", KEY_DOT}, {".", KEY_DOT},
        {"slash", KEY_SLASH}, {"/", KEY_SLASH}, {"semicolon", KEY_SEMICOLON}, {";", KEY_SEMICOLON},
        {"f1", KEY_F1}, {"f2", KEY_F2}, {"f3", KEY_F3}, {"f4", KEY_F4}, {"f5", KEY_F5}, {"f6", KEY_F6},
        {"f7", KEY_F7}, {"f8", KEY_F8}, {"f9", KEY_F9}, {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
    };
    return table;
}

static int modifierCode(const QString& name) {
    if (name == "shift") return KEY_LEFTSHIFT;
    if (name == "ctrl" || name == "control") return KEY_LEFTCTRL;
    if (name == "alt") return KEY_LEFTALT;
    return 0;
}

static bool unknownKey(DispatchError* outError, const QString& key, const QString& why) {
    if (outError) {
        outError->kind = DispatchError::Kind::UnknownKey;
        outError->message = QString("Unknown key '%1': %2").arg(key, why);
    }
    return false;
}

} // namespace

QString dispatchErrorKindName(DispatchError::Kind kind) {
    switch (kind) {
    case DispatchError::Kind::None: return "None";
    case DispatchError::Kind::UnknownKey: return "UnknownKey";
    case DispatchError::Kind::Timeout: return "Timeout";
    case DispatchError::Kind::DeviceUnavailable: return "DeviceUnavailable";
    case DispatchError::Kind::WriteFailed: return "WriteFailed";
    }
    return "Unknown";
}

bool parseKeyCombo(const QString& key, KeyCombo* out, DispatchError* outError) {
    const QString k = key.trimmed().toLower();
    if (k.isEmpty()) return unknownKey(outError, key, "empty");

    const QStringList parts = k.split('+');
    KeyCombo combo;
    for (int i = 0; i < parts.size() - 1; ++i) {
        const int mod = modifierCode(parts[i].trimmed());
        if (mod == 0) return unknownKey(outError, key, QString("'%1' is not a modifier").arg(parts[i]));
        if (!combo.modifiers.contains(mod)) combo.modifiers.push_back(mod);
    }
    const QString base = parts.last().trimmed();
    const auto it = keyTable().constFind(base);
    if (it == keyTable().constEnd()) return unknownKey(outError, key, QString("no key named '%1'").arg(base));
    combo.code = it.value();

    if (out) *out = combo;
    return true;
}

QVector<int> supportedKeyCodes() {
    QVector<int> codes{KEY_LEFTSHIFT, KEY_LEFTCTRL, KEY_LEFTALT};
    for (auto it = keyTable().constBegin(); it != keyTable().constEnd(); ++it) {
        if (!codes.contains(it.value())) codes.push_back(it.value());
    }
    return codes;
}

} // namespace cadence::input
