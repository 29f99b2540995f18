#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QTextStream>

#include "cadence/engine/ProgressSnapshot.h"

class QSocketNotifier;

namespace cadence::app {

class PlayerController;

// Line-oriented control surface on stdin/stdout:
//   play | pause | stop | seek <ms> | next | prev | select <n> | sort <column> [asc|desc]
//   list | add <path> | remove <n> | move <n> <pos> | playlist on|off | help | quit
// Indices are 1-based and refer to the list as last printed (current sort order).
class OperatorConsole : public QObject {
    Q_OBJECT

public:
    explicit OperatorConsole(PlayerController* controller, QObject* parent = nullptr);

    // Starts reading stdin; quitRequested() fires on "quit" or end of input.
    void start();

    // Executes one command line. Returns false for unknown or malformed commands.
    bool execute(const QString& line);

signals:
    void quitRequested();

private slots:
    void onStdinReadable();
    void onProgress(const cadence::engine::ProgressSnapshot& progress);

private:
    QString refAt(const QString& indexArg);
    void printList();
    void printHelp();

    PlayerController* m_controller = nullptr; // not owned
    QSocketNotifier* m_notifier = nullptr;
    QByteArray m_pending;
    QTextStream m_out;

    engine::PlaybackState m_lastState = engine::PlaybackState::Stopped;
    qint64 m_lastPrintedSecond = -1;
};

} // namespace cadence::app
