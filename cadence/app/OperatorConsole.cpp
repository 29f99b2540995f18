#include "cadence/app/OperatorConsole.h"

#include "cadence/app/PlayerController.h"

#include <QSocketNotifier>
#include <QStringList>
#include <cstdio>
#include <unistd.h>

namespace cadence::app {

OperatorConsole::OperatorConsole(PlayerController* controller, QObject* parent)
    : QObject(parent), m_controller(controller), m_out(stdout) {
    connect(m_controller, &PlayerController::progressChanged, this, &OperatorConsole::onProgress);
    connect(m_controller, &PlayerController::errorOccurred, this, [this](const QString& message) {
        m_out << "error: " << message << Qt::endl;
    });
    connect(m_controller, &PlayerController::currentSongChanged, this,
            [this](const QString&, const QString& name) {
                if (!name.isEmpty()) m_out << "selected: " << name << Qt::endl;
            });
    connect(m_controller, &PlayerController::songCompleted, this, [this](const QString&) {
        m_out << "finished" << Qt::endl;
    });
    connect(m_controller, &PlayerController::playlistModeChanged, this, [this](bool on) {
        m_out << "playlist mode " << (on ? "on" : "off") << Qt::endl;
    });
}

void OperatorConsole::start() {
    m_notifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &OperatorConsole::onStdinReadable);
    printHelp();
}

void OperatorConsole::onStdinReadable() {
    char buf[1024];
    const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
        m_notifier->setEnabled(false);
        if (!m_pending.trimmed().isEmpty()) execute(QString::fromLocal8Bit(m_pending));
        m_pending.clear();
        emit quitRequested();
        return;
    }
    m_pending.append(buf, int(n));

    int nl;
    while ((nl = m_pending.indexOf('\n')) >= 0) {
        const QString line = QString::fromLocal8Bit(m_pending.left(nl));
        m_pending.remove(0, nl + 1);
        execute(line);
    }
}

bool OperatorConsole::execute(const QString& line) {
    const QStringList args = line.trimmed().split(' ', Qt::SkipEmptyParts);
    if (args.isEmpty()) return true;
    const QString cmd = args[0].toLower();

    if (cmd == "play") m_controller->play();
    else if (cmd == "pause") m_controller->togglePause();
    else if (cmd == "stop") m_controller->stop();
    else if (cmd == "next") {
        if (!m_controller->next()) m_out << "no next song" << Qt::endl;
    } else if (cmd == "prev") {
        if (!m_controller->previous()) m_out << "no previous song" << Qt::endl;
    } else if (cmd == "seek" && args.size() == 2) {
        bool ok = false;
        const qint64 ms = args[1].toLongLong(&ok);
        if (!ok) return false;
        m_controller->seek(ms);
    } else if (cmd == "select" && args.size() == 2) {
        const QString ref = refAt(args[1]);
        if (ref.isEmpty()) return false;
        m_controller->selectSong(ref);
    } else if (cmd == "remove" && args.size() == 2) {
        const QString ref = refAt(args[1]);
        if (ref.isEmpty()) return false;
        m_controller->removeSong(ref);
    } else if (cmd == "move" && args.size() == 3) {
        const QString ref = refAt(args[1]);
        bool ok = false;
        const int pos = args[2].toInt(&ok);
        if (ref.isEmpty() || !ok) return false;
        m_controller->moveSong(ref, pos - 1);
    } else if (cmd == "add" && args.size() >= 2) {
        const QString path = line.trimmed().mid(args[0].size()).trimmed();
        m_out << "added " << m_controller->addSongs({path}) << Qt::endl;
    } else if (cmd == "sort" && (args.size() == 2 || args.size() == 3)) {
        playlist::SortColumn column;
        if (!playlist::sortColumnFromName(args[1], &column)) return false;
        const bool desc = args.size() == 3 && args[2].toLower().startsWith("desc");
        m_controller->selectSortColumn(column, desc ? playlist::SortDirection::Descending
                                                    : playlist::SortDirection::Ascending);
        printList();
    } else if (cmd == "list") printList();
    else if (cmd == "playlist" && args.size() == 2) m_controller->setPlaylistMode(args[1].toLower() == "on");
    else if (cmd == "help") printHelp();
    else if (cmd == "quit" || cmd == "exit") emit quitRequested();
    else {
        m_out << "unknown command: " << line.trimmed() << " (try 'help')" << Qt::endl;
        return false;
    }
    return true;
}

QString OperatorConsole::refAt(const QString& indexArg) {
    bool ok = false;
    const int index = indexArg.toInt(&ok) - 1;
    const QVector<playlist::PlaylistEntry> view = m_controller->sortedPlaylist();
    if (!ok || index < 0 || index >= view.size()) {
        m_out << "no entry " << indexArg << Qt::endl;
        return {};
    }
    return view[index].songRef;
}

void OperatorConsole::printList() {
    const QVector<playlist::PlaylistEntry> view = m_controller->sortedPlaylist();
    m_out << "playlist (" << playlist::sortColumnName(m_controller->sortColumn())
          << (m_controller->sortDirection() == playlist::SortDirection::Descending ? ", desc" : "") << "):"
          << Qt::endl;
    for (int i = 0; i < view.size(); ++i) {
        const playlist::PlaylistEntry& e = view[i];
        m_out << QString("%1%2. %3  %4  %5 bpm%6")
                     .arg(e.songRef == m_controller->currentSongRef() ? "* " : "  ")
                     .arg(i + 1, 2)
                     .arg(e.displayName)
                     .arg(engine::formatClock(e.durationMs))
                     .arg(e.bpm, 0, 'f', 1)
                     .arg(e.missing ? "  [missing]" : "")
              << Qt::endl;
    }
    if (view.isEmpty()) m_out << "  (empty)" << Qt::endl;
}

void OperatorConsole::printHelp() {
    m_out << "commands: play, pause, stop, seek <ms>, next, prev, select <n>, sort <column> [asc|desc],"
          << Qt::endl
          << "          list, add <path>, remove <n>, move <n> <pos>, playlist on|off, help, quit" << Qt::endl;
}

void OperatorConsole::onProgress(const engine::ProgressSnapshot& progress) {
    const qint64 second = progress.elapsedMs / 1000;
    if (progress.state == m_lastState && (progress.state != engine::PlaybackState::Playing || second == m_lastPrintedSecond)) {
        return;
    }
    m_lastState = progress.state;
    m_lastPrintedSecond = second;
    if (!progress.hasSong()) {
        m_out << QString("[%1] no song loaded").arg(engine::playbackStateName(progress.state)) << Qt::endl;
        return;
    }
    m_out << QString("[%1] %2  %3 / %4 (%5%)  %6 bpm")
                 .arg(engine::playbackStateName(progress.state))
                 .arg(progress.songName)
                 .arg(engine::formatClock(progress.elapsedMs))
                 .arg(engine::formatClock(progress.durationMs))
                 .arg(int(progress.fraction() * 100.0))
                 .arg(progress.bpm, 0, 'f', 1);
    if (progress.skippedNotes > 0) m_out << QString("  (%1 skipped)").arg(progress.skippedNotes);
    m_out << Qt::endl;
}

} // namespace cadence::app
