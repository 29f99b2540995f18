#include "cadence/input/UinputKeyDispatcher.h"

#include "cadence/input/KeyCombo.h"

#include <QDebug>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/uinput.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>

namespace cadence::input {
namespace {

static bool fail(DispatchError* outError, DispatchError::Kind kind, const QString& message) {
    if (outError) {
        outError->kind = kind;
        outError->message = message;
    }
    return false;
}

static QString errnoText() { return QString::fromLocal8Bit(std::strerror(errno)); }

} // namespace

UinputKeyDispatcher::UinputKeyDispatcher(int writeTimeoutMs, QString devicePath)
    : m_writeTimeoutMs(writeTimeoutMs), m_devicePath(std::move(devicePath)) {}

UinputKeyDispatcher::UinputKeyDispatcher(EventWriter writer)
    : m_writer(std::move(writer)) {}

UinputKeyDispatcher::~UinputKeyDispatcher() {
    close();
}

bool UinputKeyDispatcher::open(DispatchError* outError) {
    if (isOpen()) return true;

    const QByteArray path = m_devicePath.toLocal8Bit();
    const int fd = ::open(path.constData(), O_WRONLY | O_NONBLOCK);
    if (fd < 0) {
        return fail(outError, DispatchError::Kind::DeviceUnavailable,
                    QString("Cannot open %1: %2").arg(m_devicePath, errnoText()));
    }

    bool ok = ::ioctl(fd, UI_SET_EVBIT, EV_KEY) == 0 && ::ioctl(fd, UI_SET_EVBIT, EV_SYN) == 0;
    for (int code : supportedKeyCodes()) {
        if (!ok) break;
        ok = ::ioctl(fd, UI_SET_KEYBIT, code) == 0;
    }

    uinput_setup setup;
    std::memset(&setup, 0, sizeof(setup));
    setup.id.bustype = BUS_VIRTUAL;
    setup.id.vendor = 0x1d6b;
    setup.id.product = 0x0104;
    std::strncpy(setup.name, "Cadence virtual keyboard", UINPUT_MAX_NAME_SIZE - 1);

    ok = ok && ::ioctl(fd, UI_DEV_SETUP, &setup) == 0 && ::ioctl(fd, UI_DEV_CREATE) == 0;
    if (!ok) {
        const QString why = errnoText();
        ::close(fd);
        return fail(outError, DispatchError::Kind::DeviceUnavailable,
                    QString("Cannot create uinput device: %1").arg(why));
    }

    m_fd = fd;
    qInfo().noquote() << "UinputKeyDispatcher: virtual keyboard created on" << m_devicePath;
    return true;
}

void UinputKeyDispatcher::close() {
    if (!isOpen()) return;
    releaseAll();
    m_writer = nullptr;
    if (m_fd < 0) return;
    ::ioctl(m_fd, UI_DEV_DESTROY);
    ::close(m_fd);
    m_fd = -1;
}

bool UinputKeyDispatcher::emitEvent(int type, int code, int value, DispatchError* outError) {
    if (m_writer) return m_writer(type, code, value, outError);

    input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = static_cast<__u16>(type);
    ev.code = static_cast<__u16>(code);
    ev.value = value;

    pollfd pfd{m_fd, POLLOUT, 0};
    const int ready = ::poll(&pfd, 1, m_writeTimeoutMs);
    if (ready == 0) {
        return fail(outError, DispatchError::Kind::Timeout,
                    QString("uinput not writable within %1 ms").arg(m_writeTimeoutMs));
    }
    if (ready < 0 || (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
        return fail(outError, DispatchError::Kind::WriteFailed, QString("poll failed: %1").arg(errnoText()));
    }

    const ssize_t n = ::write(m_fd, &ev, sizeof(ev));
    if (n != ssize_t(sizeof(ev))) {
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return fail(outError, DispatchError::Kind::Timeout, "uinput write would block");
        }
        return fail(outError, DispatchError::Kind::WriteFailed, QString("write failed: %1").arg(errnoText()));
    }
    return true;
}

bool UinputKeyDispatcher::sync(DispatchError* outError) {
    return emitEvent(EV_SYN, SYN_REPORT, 0, outError);
}

bool UinputKeyDispatcher::liftKey(int code, DispatchError* outError) {
    if (emitEvent(EV_KEY, code, 0, outError)) {
        m_unreleased.remove(code);
        return true;
    }
    m_unreleased.insert(code);
    return false;
}

// Releases one reference per modifier, last pressed first; lifts a modifier when its count reaches 0.
bool UinputKeyDispatcher::dropModifiers(const QVector<int>& modifiers, DispatchError* outError) {
    bool ok = true;
    for (int i = modifiers.size() - 1; i >= 0; --i) {
        const int mod = modifiers[i];
        const int refs = m_modifierRefs.value(mod) - 1;
        if (refs > 0) {
            m_modifierRefs[mod] = refs;
            continue;
        }
        m_modifierRefs.remove(mod);
        // Keep going after a failure so every remaining modifier still gets its key-up.
        if (!liftKey(mod, ok ? outError : nullptr)) ok = false;
    }
    return ok;
}

void UinputKeyDispatcher::abandonPress(const QString& key, int code, bool codeDown, const QVector<int>& counted) {
    bool ok = true;
    if (codeDown && !liftKey(code, nullptr)) ok = false;
    if (!dropModifiers(counted, nullptr)) ok = false;
    if (!sync(nullptr)) ok = false;
    if (!ok) qWarning().noquote() << "UinputKeyDispatcher: could not undo partial press of" << key;
}

bool UinputKeyDispatcher::dispatch(const QString& key, KeyAction action, DispatchError* outError) {
    if (action == KeyAction::Release && !m_held.contains(key)) return true;
    if (!isOpen()) {
        return fail(outError, DispatchError::Kind::DeviceUnavailable, "uinput device is not open");
    }

    KeyCombo combo;
    if (!parseKeyCombo(key, &combo, outError)) return false;

    if (action == KeyAction::Press) {
        if (m_held.contains(key)) return true;
        QVector<int> counted;
        for (int mod : combo.modifiers) {
            if (m_modifierRefs.value(mod) == 0 && !emitEvent(EV_KEY, mod, 1, outError)) {
                abandonPress(key, combo.code, false, counted);
                return false;
            }
            m_modifierRefs[mod] += 1;
            counted.push_back(mod);
        }
        if (!emitEvent(EV_KEY, combo.code, 1, outError)) {
            abandonPress(key, combo.code, false, counted);
            return false;
        }
        if (!sync(outError)) {
            // The key-down may already have reached the device.
            abandonPress(key, combo.code, true, counted);
            return false;
        }
        m_held.insert(key);
        return true;
    }

    m_held.remove(key);
    bool ok = liftKey(combo.code, outError);
    if (!dropModifiers(combo.modifiers, ok ? outError : nullptr)) ok = false;
    if (!sync(ok ? outError : nullptr)) ok = false;
    return ok;
}

void UinputKeyDispatcher::releaseAll() {
    const QSet<QString> held = m_held;
    for (const QString& key : held) {
        DispatchError err;
        if (!dispatch(key, KeyAction::Release, &err)) {
            qWarning().noquote() << "UinputKeyDispatcher: release of" << key << "failed:" << err.message;
        }
    }
    m_held.clear();

    // Anything still counted or left down by a failed key-up gets one more key-up.
    QSet<int> leftover = m_unreleased;
    for (auto it = m_modifierRefs.cbegin(); it != m_modifierRefs.cend(); ++it) {
        if (it.value() > 0) leftover.insert(it.key());
    }
    m_modifierRefs.clear();
    if (leftover.isEmpty()) return;

    bool ok = true;
    for (int code : leftover) {
        if (!liftKey(code, nullptr)) ok = false;
    }
    if (!sync(nullptr)) ok = false;
    if (!ok) qWarning().noquote() << "UinputKeyDispatcher: some keys could not be lifted on close";
    m_unreleased.clear();
}

} // namespace cadence::input
