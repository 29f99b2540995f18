#include "cadence/app/PlayerSettings.h"

#include "cadence/song/MidiCsvImporter.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>

namespace cadence::app {
namespace {

static int clampInt(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }

static int readInt(QSettings& s, const QString& k, int def) { return s.value(k, def).toInt(); }
static QString readS(QSettings& s, const QString& k, const QString& def) { return s.value(k, def).toString(); }

} // namespace

PlayerSettings defaultPlayerSettings() {
    return PlayerSettings{};
}

QString PlayerSettings::resolvedPlaylistPath() const {
    if (!playlistPath.trimmed().isEmpty()) return playlistPath;
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dir.isEmpty() ? QDir::currentPath() : dir).filePath("playlist.json");
}

song::MidiCsvImportOptions PlayerSettings::csvImportOptions() const {
    song::MidiCsvImportOptions o;
    o.windowMin = windowMinPitch;
    o.windowMax = windowMaxPitch;
    o.layout.basePitch = windowMaxPitch - 35;
    return o;
}

PlayerSettings loadPlayerSettings(QSettings& settings, const QString& prefix) {
    PlayerSettings p = defaultPlayerSettings();
    const QString base = prefix;

    p.tickIntervalMs = clampInt(readInt(settings, base + "/tickIntervalMs", p.tickIntervalMs), 1, 50);
    p.dispatchTimeoutMs = clampInt(readInt(settings, base + "/dispatchTimeoutMs", p.dispatchTimeoutMs), 1, 1000);
    p.leadInMs = clampInt(readInt(settings, base + "/leadInMs", p.leadInMs), 0, 30000);
    p.playlistGapMs = clampInt(readInt(settings, base + "/playlistGapMs", p.playlistGapMs), 0, 60000);
    p.pollIntervalMs = clampInt(readInt(settings, base + "/pollIntervalMs", p.pollIntervalMs), 10, 1000);

    // The key layout spans 36 semitones ending at windowMaxPitch; the window may only narrow it.
    p.windowMaxPitch = clampInt(readInt(settings, base + "/windowMaxPitch", p.windowMaxPitch), 35, 127);
    p.windowMinPitch = clampInt(readInt(settings, base + "/windowMinPitch", p.windowMinPitch),
                                p.windowMaxPitch - 35, p.windowMaxPitch);

    p.playlistPath = readS(settings, base + "/playlistPath", p.playlistPath).trimmed();
    return p;
}

void savePlayerSettings(QSettings& settings, const PlayerSettings& s, const QString& prefix) {
    const QString base = prefix;
    settings.setValue(base + "/tickIntervalMs", s.tickIntervalMs);
    settings.setValue(base + "/dispatchTimeoutMs", s.dispatchTimeoutMs);
    settings.setValue(base + "/leadInMs", s.leadInMs);
    settings.setValue(base + "/playlistGapMs", s.playlistGapMs);
    settings.setValue(base + "/pollIntervalMs", s.pollIntervalMs);
    settings.setValue(base + "/windowMinPitch", s.windowMinPitch);
    settings.setValue(base + "/windowMaxPitch", s.windowMaxPitch);
    settings.setValue(base + "/playlistPath", s.playlistPath);
}

} // namespace cadence::app
