#pragma once

#include <QString>

class QSettings;

namespace cadence::song {
struct MidiCsvImportOptions;
}

namespace cadence::app {

// Operator-tunable settings. Persisted via QSettings; every value is clamped on load.
struct PlayerSettings {
    int tickIntervalMs = 5;       // upper bound on the scheduler's sleep
    int dispatchTimeoutMs = 20;   // per uinput write
    int leadInMs = 2000;          // silence before the first note (time to focus the game window)
    int playlistGapMs = 5000;     // pause between songs in playlist mode
    int pollIntervalMs = 33;      // progress polling on the UI thread
    int windowMinPitch = 48;      // MIDI-CSV import window
    int windowMaxPitch = 83;
    QString playlistPath;         // empty: <AppDataLocation>/playlist.json

    QString resolvedPlaylistPath() const;
    song::MidiCsvImportOptions csvImportOptions() const;
};

PlayerSettings defaultPlayerSettings();
PlayerSettings loadPlayerSettings(QSettings& settings, const QString& prefix = "player");
void savePlayerSettings(QSettings& settings, const PlayerSettings& s, const QString& prefix = "player");

} // namespace cadence::app
