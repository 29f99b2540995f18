#include "cadence/song/BpmEstimator.h"
#include "cadence/song/KeyLayout.h"
#include "cadence/song/MidiCsvImporter.h"
#include "cadence/song/Song.h"
#include "cadence/song/SongLoader.h"
#include "cadence/song/TempoMap.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QtGlobal>
#include <cmath>

using cadence::song::BpmEstimator;
using cadence::song::BpmSource;
using cadence::song::KeyLayout;
using cadence::song::MidiCsvImportOptions;
using cadence::song::Note;
using cadence::song::NoteAction;
using cadence::song::Song;
using cadence::song::SongCache;
using cadence::song::SongParseError;
using cadence::song::TempoMap;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(qint64 a, qint64 b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectNear(double a, double b, double eps, const QString& msg) {
    expect(std::fabs(a - b) <= eps, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static SongParseError::Kind parseKind(const char* json) {
    Song s;
    SongParseError err;
    if (cadence::song::loadSong(QByteArray(json), "x", &s, &err)) return SongParseError::Kind::None;
    return err.kind;
}

static bool writeFile(const QString& path, const QByteArray& bytes) {
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
    return f.write(bytes) == bytes.size();
}

} // namespace

static void testLoadValidSong() {
    const QByteArray json = R"({
        "name": "Moonlit Lake", "bpm": 96,
        "notes": [
            {"offsetMs": 0,   "key": "A",       "action": "press"},
            {"offsetMs": 0,   "key": "shift+q", "action": "down"},
            {"offsetMs": 200, "key": "a",       "action": "release"},
            {"offsetMs": 350, "key": "shift+q", "action": "up"}
        ]})";
    Song s;
    SongParseError err;
    expect(cadence::song::loadSong(json, "fallback", &s, &err), "valid song loads: " + err.message);
    expectStrEq(s.name(), "Moonlit Lake", "name from document");
    expectNear(s.bpm(), 96.0, 1e-9, "declared BPM wins");
    expect(s.bpmSource() == BpmSource::Declared, "BPM source is Declared");
    expectEq(s.durationMs(), 350, "duration is the final release offset");
    expectEq(s.noteCount(), 4, "note count");
    expectStrEq(s.notes()[0].key, "a", "keys are lower-cased");
    expect(s.notes()[1].isPress() && s.notes()[3].isRelease(), "down/up aliases");

    Song unnamed;
    expect(cadence::song::loadSong(R"({"notes": []})", "my_song", &unnamed), "empty song loads");
    expectStrEq(unnamed.name(), "my_song", "name falls back to the file name");
    expectEq(unnamed.durationMs(), 0, "empty song has zero duration");
    expectNear(unnamed.bpm(), BpmEstimator::kDefaultBpm, 1e-9, "empty song gets the default BPM");
    expect(unnamed.bpmSource() == BpmSource::Derived, "undeclared BPM is Derived");
}

static void testParseErrors() {
    using K = SongParseError::Kind;
    expect(parseKind("not json") == K::InvalidDocument, "garbage is InvalidDocument");
    expect(parseKind("[1,2]") == K::InvalidDocument, "array root is InvalidDocument");
    expect(parseKind(R"({"name": "x"})") == K::InvalidDocument, "missing notes is InvalidDocument");
    expect(parseKind(R"({"notes": [{"offsetMs": -5, "key": "a", "action": "press"}]})") == K::MalformedNote,
           "negative offset is MalformedNote");
    expect(parseKind(R"({"notes": [{"offsetMs": 1.5, "key": "a", "action": "press"}]})") == K::MalformedNote,
           "fractional offset is MalformedNote");
    expect(parseKind(R"({"notes": [{"offsetMs": 1e20, "key": "a", "action": "press"}]})") == K::MalformedNote,
           "offset beyond the 64-bit range is MalformedNote");
    expect(parseKind(R"({"notes": [{"offsetMs": 9223372036854775808, "key": "a", "action": "press"}]})")
               == K::MalformedNote,
           "offset of 2^63 is MalformedNote");
    expect(parseKind(R"({"notes": [{"offsetMs": 0, "key": "", "action": "press"}]})") == K::MalformedNote,
           "empty key is MalformedNote");
    expect(parseKind(R"({"notes": [{"offsetMs": 0, "key": "a", "action": "tap"}]})") == K::MalformedNote,
           "unknown action is MalformedNote");
    expect(parseKind(R"({"notes": [{"offsetMs": 100, "key": "a", "action": "press"},
                                   {"offsetMs": 50, "key": "a", "action": "release"}]})") == K::NonMonotonicTime,
           "regressing offset is NonMonotonicTime");
    expect(parseKind(R"({"notes": [{"offsetMs": 0, "key": "a", "action": "press"},
                                   {"offsetMs": 10, "key": "a", "action": "press"},
                                   {"offsetMs": 20, "key": "a", "action": "release"}]})") == K::OverlappingPress,
           "press of a held key is OverlappingPress");
    expect(parseKind(R"({"notes": [{"offsetMs": 0, "key": "a", "action": "release"}]})") == K::UnmatchedRelease,
           "release without press is UnmatchedRelease");
    expect(parseKind(R"({"notes": [{"offsetMs": 0, "key": "a", "action": "press"}]})") == K::UnterminatedNote,
           "press without release is UnterminatedNote");
    expect(parseKind(R"({"bpm": 0, "notes": []})") == K::InvalidBpm, "zero BPM is InvalidBpm");
    expect(parseKind(R"({"bpm": "fast", "notes": []})") == K::InvalidBpm, "non-numeric BPM is InvalidBpm");

    Song s;
    SongParseError err;
    cadence::song::loadSong(R"({"notes": [{"offsetMs": 0, "key": "a", "action": "press"},
                                          {"offsetMs": 5, "key": "b", "action": "release"}]})",
                            "x", &s, &err);
    expectEq(err.noteIndex, 1, "error carries the offending note index");
    expect(!err.message.isEmpty(), "error carries a message");
}

static void testBpmDerivation() {
    expectNear(BpmEstimator::fromOnsets({0, 400, 800, 1200}), 150.0, 1e-9, "steady 400ms onsets -> 150 BPM");
    expectNear(BpmEstimator::fromOnsets({0, 0, 500, 500, 1000}), 120.0, 1e-9, "chord onsets count once");
    expectNear(BpmEstimator::fromOnsets({0, 700}), 85.7, 1e-9, "rounded to 0.1");
    expectNear(BpmEstimator::fromOnsets({0, 300, 600, 2000}), 200.0, 1e-9, "median ignores an outlier gap");
    expectNear(BpmEstimator::fromOnsets({250}), BpmEstimator::kDefaultBpm, 1e-9, "single onset -> default");

    Song s;
    expect(Song::build("d", 0.0,
                       {{0, "a", NoteAction::Press}, {100, "a", NoteAction::Release},
                        {500, "a", NoteAction::Press}, {600, "a", NoteAction::Release}},
                       &s),
           "build undeclared song");
    expectNear(s.bpm(), 120.0, 1e-9, "derived from presses only");
}

static void testCursorLookup() {
    Song s;
    expect(Song::build("c", 100.0,
                       {{0, "a", NoteAction::Press}, {200, "a", NoteAction::Release},
                        {500, "b", NoteAction::Press}, {600, "b", NoteAction::Release}},
                       &s),
           "build lookup song");
    expectEq(s.firstNoteAtOrAfter(0), 0, "at 0");
    expectEq(s.firstNoteAtOrAfter(1), 1, "just after the first note");
    expectEq(s.firstNoteAtOrAfter(500), 2, "exactly on a note");
    expectEq(s.firstNoteAtOrAfter(601), 4, "past the end");
}

static void testTempoMapAndLayout() {
    const TempoMap constant(480, {});
    expectNear(constant.tickToMs(480), 500.0, 1e-9, "default tempo: one quarter is 500ms");
    expectNear(constant.initialBpm(), 120.0, 1e-9, "default tempo is 120 BPM");

    const TempoMap changing(480, {{960, 250000}, {0, 600000}});
    expectNear(changing.tickToMs(960), 1200.0, 1e-9, "two quarters at 600000us");
    expectNear(changing.tickToMs(1440), 1450.0, 1e-9, "then one quarter at 250000us");
    expectNear(changing.initialBpm(), 100.0, 1e-9, "initial BPM from the first tempo");

    const KeyLayout layout;
    expectStrEq(layout.keyForPitch(48), "z", "low do");
    expectStrEq(layout.keyForPitch(49), "shift+z", "sharp uses shift");
    expectStrEq(layout.keyForPitch(51), "ctrl+c", "flat mi uses ctrl");
    expectStrEq(layout.keyForPitch(60), "a", "middle do");
    expectStrEq(layout.keyForPitch(70), "ctrl+j", "flat ti uses ctrl");
    expectStrEq(layout.keyForPitch(83), "u", "high ti");
    expect(layout.keyForPitch(47).isEmpty() && layout.keyForPitch(84).isEmpty(), "outside the window is unmapped");
}

static void testMidiCsvImport() {
    const QByteArray csv =
        "0, 0, Header, 1, 1, 480\n"
        "# comment\n"
        "1, 0, Start_track\n"
        "1, 0, Tempo, 500000\n"
        "1, 0, Note_on_c, 0, 72, 90\n"
        "1, 240, Note_off_c, 0, 72, 0\n"
        "1, 480, Note_on_c, 0, 74, 90\n"
        "1, 960, Note_on_c, 0, 74, 0\n"
        "1, 960, Note_on_c, 0, 20, 90\n"
        "1, 1000, Note_off_c, 0, 20, 0\n"
        "1, 1000, End_track\n";
    Song s;
    SongParseError err;
    expect(cadence::song::importMidiCsv(csv, "tune", MidiCsvImportOptions{}, &s, &err), "midicsv imports: " + err.message);
    // Highest pitch 74 moves to 83 (+9): 72 -> 81 "y", 74 -> 83 "u"; 20 -> 29 falls out of the window.
    expectEq(s.noteCount(), 4, "two notes in the window, one dropped");
    if (s.noteCount() == 4) {
        expectStrEq(s.notes()[0].key, "y", "first key");
        expectEq(s.notes()[1].offsetMs, 250, "note-off at tick 240");
        expectStrEq(s.notes()[2].key, "u", "second key");
        expectEq(s.notes()[2].offsetMs, 500, "second press at tick 480");
        expect(s.notes()[3].isRelease(), "velocity-0 note-on releases");
    }
    expectEq(s.durationMs(), 1000, "duration");
    expectNear(s.bpm(), 120.0, 1e-9, "tempo becomes the declared BPM");
    expect(s.bpmSource() == BpmSource::Declared, "imported BPM is Declared");

    const QByteArray chord =
        "0, 0, Header, 1, 1, 480\n"
        "1, 0, Note_on_c, 0, 79, 90\n"
        "1, 0, Note_on_c, 0, 83, 90\n"
        "1, 480, Note_off_c, 0, 79, 0\n"
        "1, 480, Note_off_c, 0, 83, 0\n";
    Song rolled;
    expect(cadence::song::importMidiCsv(chord, "chord", MidiCsvImportOptions{}, &rolled, &err), "chord imports");
    if (rolled.noteCount() == 4) {
        expectStrEq(rolled.notes()[0].key, "t", "chord: lower note first");
        expectEq(rolled.notes()[0].offsetMs, 0, "chord: first press on time");
        expectStrEq(rolled.notes()[1].key, "u", "chord: upper note second");
        expectEq(rolled.notes()[1].offsetMs, 5, "chord: second press rolled by 5ms");
    } else {
        expect(false, "chord: expected 4 notes");
    }

    Song repeated;
    const QByteArray overlap =
        "0, 0, Header, 1, 1, 480\n"
        "1, 0, Note_on_c, 0, 60, 90\n"
        "1, 0, Note_on_c, 1, 60, 90\n"
        "1, 960, Note_off_c, 0, 60, 0\n";
    expect(cadence::song::importMidiCsv(overlap, "o", MidiCsvImportOptions{}, &repeated, &err),
           "overlapping same-key notes are clipped into a valid song: " + err.message);

    Song none;
    expect(!cadence::song::importMidiCsv("1, 0, Note_on_c, 0, 60, 90\n", "h", MidiCsvImportOptions{}, &none, &err),
           "missing Header is rejected");
    expect(err.kind == SongParseError::Kind::InvalidDocument, "missing Header is InvalidDocument");
}

static void testSongFilesAndCache() {
    QTemporaryDir dir;
    expect(dir.isValid(), "temp dir");
    const QString good = dir.filePath("good.json");
    const QString bad = dir.filePath("bad.json");
    expect(writeFile(good, R"({"notes": [{"offsetMs": 0, "key": "a", "action": "press"},
                                         {"offsetMs": 10, "key": "a", "action": "release"}]})"),
           "write good song");
    expect(writeFile(bad, "{"), "write bad song");

    Song s;
    SongParseError err;
    expect(!cadence::song::loadSongFile(dir.filePath("absent.json"), MidiCsvImportOptions{}, &s, &err),
           "absent file fails");
    expect(err.kind == SongParseError::Kind::Unreadable, "absent file is Unreadable");

    SongCache cache;
    const auto first = cache.load(good);
    const auto second = cache.load(good);
    expect(first != nullptr, "cache loads a good song");
    expect(first == second, "second load is served from the cache");
    expectStrEq(first ? first->name() : QString(), "good", "name from the file's base name");

    expect(cache.load(bad, &err) == nullptr, "bad song is rejected");
    expect(err.kind == SongParseError::Kind::InvalidDocument, "bad song error kind");
    expect(cache.cached(bad) == nullptr, "failures are not cached");

    // A repaired file loads on the next try.
    expect(writeFile(bad, R"({"notes": []})"), "repair bad song");
    expect(cache.load(bad) != nullptr, "repaired song loads");
    expectEq(cache.size(), 2, "two songs cached");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testLoadValidSong();
    testParseErrors();
    testBpmDerivation();
    testCursorLookup();
    testTempoMapAndLayout();
    testMidiCsvImport();
    testSongFilesAndCache();

    if (g_failures == 0) {
        qInfo("SongModelTests: PASS");
        return 0;
    }

    qWarning("SongModelTests: FAIL (%d failures)", g_failures);
    return 1;
}
