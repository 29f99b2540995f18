#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSettings>
#include <memory>

#include "cadence/app/OperatorConsole.h"
#include "cadence/app/PlayerController.h"
#include "cadence/app/PlayerSettings.h"
#include "cadence/input/LoggingKeyDispatcher.h"
#include "cadence/input/UinputKeyDispatcher.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Cadence");
    QCoreApplication::setApplicationName("cadence");

    QCommandLineParser parser;
    parser.setApplicationDescription("Plays songs into a game instrument as timed key presses.");
    parser.addHelpOption();
    QCommandLineOption playlistOpt("playlist", "Playlist file (JSON).", "file");
    QCommandLineOption configOpt("config", "Settings file (INI).", "file");
    QCommandLineOption dryRunOpt("dry-run", "Log key actions instead of injecting them.");
    parser.addOption(playlistOpt);
    parser.addOption(configOpt);
    parser.addOption(dryRunOpt);
    parser.addPositionalArgument("songs", "Song files to add to the playlist.", "[songs...]");
    parser.process(app);

    std::unique_ptr<QSettings> settingsStore = parser.isSet(configOpt)
        ? std::make_unique<QSettings>(parser.value(configOpt), QSettings::IniFormat)
        : std::make_unique<QSettings>();
    cadence::app::PlayerSettings settings = cadence::app::loadPlayerSettings(*settingsStore);
    if (parser.isSet(playlistOpt)) settings.playlistPath = parser.value(playlistOpt);
    // Write back so a fresh install gets a file with every knob in it.
    cadence::app::savePlayerSettings(*settingsStore, settings);

    std::unique_ptr<cadence::input::KeyDispatcher> dispatcher;
    if (parser.isSet(dryRunOpt)) {
        dispatcher = std::make_unique<cadence::input::LoggingKeyDispatcher>();
    } else {
        auto uinput = std::make_unique<cadence::input::UinputKeyDispatcher>(settings.dispatchTimeoutMs);
        cadence::input::DispatchError err;
        if (!uinput->open(&err)) {
            // Keep running: every dispatch is then counted as skipped and the console still works.
            qWarning().noquote() << "Cadence:" << err.message << "- key actions will be skipped (try --dry-run)";
        }
        dispatcher = std::move(uinput);
    }

    cadence::app::PlayerController controller(settings, std::move(dispatcher));
    cadence::app::OperatorConsole console(&controller);
    QObject::connect(&console, &cadence::app::OperatorConsole::quitRequested, &app, &QCoreApplication::quit);
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &controller, &cadence::app::PlayerController::shutdown);

    controller.start();
    const QStringList songs = parser.positionalArguments();
    if (!songs.isEmpty()) controller.addSongs(songs);
    console.start();

    return app.exec();
}
