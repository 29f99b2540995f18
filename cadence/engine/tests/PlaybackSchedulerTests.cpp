#include "cadence/engine/PlaybackClock.h"
#include "cadence/engine/PlaybackScheduler.h"
#include "cadence/input/KeyDispatcher.h"
#include "cadence/song/Song.h"

#include <QCoreApplication>
#include <QVector>
#include <QtGlobal>
#include <memory>

using cadence::engine::PlaybackClock;
using cadence::engine::PlaybackError;
using cadence::engine::PlaybackScheduler;
using cadence::engine::PlaybackState;
using cadence::input::DispatchError;
using cadence::input::KeyAction;
using cadence::input::KeyDispatcher;
using cadence::song::Note;
using cadence::song::NoteAction;
using cadence::song::Song;

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

class ManualClock final : public PlaybackClock {
public:
    qint64 nowMs() const override { return m_now; }
    void set(qint64 ms) { m_now = ms; }
    void advance(qint64 ms) { m_now += ms; }

private:
    qint64 m_now = 0;
};

struct Action {
    qint64 atMs;
    QString key;
    KeyAction action;
};

class RecordingDispatcher final : public KeyDispatcher {
public:
    explicit RecordingDispatcher(const ManualClock* clock) : m_clock(clock) {}

    bool dispatch(const QString& key, KeyAction action, DispatchError* outError) override {
        if (failKeys.contains(key)) {
            if (outError) {
                outError->kind = DispatchError::Kind::Timeout;
                outError->message = "simulated timeout";
            }
            return false;
        }
        actions.push_back({m_clock->nowMs(), key, action});
        return true;
    }

    int count(const QString& key, KeyAction action) const {
        int n = 0;
        for (const Action& a : actions) {
            if (a.key == key && a.action == action) ++n;
        }
        return n;
    }

    QVector<Action> actions;
    QStringList failKeys;

private:
    const ManualClock* m_clock = nullptr;
};

static std::shared_ptr<const Song> makeSong(const QVector<Note>& notes, double bpm = 100.0) {
    Song s;
    cadence::song::SongParseError err;
    const bool ok = Song::build("test", bpm, notes, &s, &err);
    expect(ok, "test song builds: " + err.message);
    return std::make_shared<const Song>(s);
}

// (0ms A press) (200ms A release) (500ms B press) (600ms B release)
static std::shared_ptr<const Song> threeNoteSong() {
    return makeSong({
        {0, "a", NoteAction::Press},
        {200, "a", NoteAction::Release},
        {500, "b", NoteAction::Press},
        {600, "b", NoteAction::Release},
    });
}

// Ticks every stepMs until the clock reaches untilMs (inclusive).
static void runUntil(PlaybackScheduler& s, ManualClock& clock, qint64 untilMs, qint64 stepMs = 5) {
    while (clock.nowMs() < untilMs) {
        clock.advance(qMin(stepMs, untilMs - clock.nowMs()));
        s.tick();
    }
}

static qint64 elapsedNow(const PlaybackScheduler& s) {
    return s.progress()->elapsedMs;
}

} // namespace

static void testThreeNoteScenario() {
    ManualClock clock;
    clock.set(1000);
    RecordingDispatcher out(&clock);
    PlaybackScheduler s(&clock, &out);

    const auto song = threeNoteSong();
    expectEq(song->durationMs(), 600, "3-note song duration");

    expect(s.load(song), "load from Stopped");
    expect(s.play(), "play from Stopped");
    s.tick();
    runUntil(s, clock, 1700, 5);

    expectEq(out.actions.size(), 4, "3-note song dispatches exactly 4 actions");
    if (out.actions.size() == 4) {
        const qint64 expected[4] = {1000, 1200, 1500, 1600};
        for (int i = 0; i < 4; ++i) {
            const qint64 late = out.actions[i].atMs - expected[i];
            expect(late >= 0 && late <= 5, QString("action %1 within one tick of %2ms (late %3)").arg(i).arg(expected[i] - 1000).arg(late));
        }
        expect(out.actions[0].key == "a" && out.actions[0].action == KeyAction::Press, "first action is A press");
        expect(out.actions[1].key == "a" && out.actions[1].action == KeyAction::Release, "second action is A release");
        expect(out.actions[2].key == "b" && out.actions[2].action == KeyAction::Press, "third action is B press");
        expect(out.actions[3].key == "b" && out.actions[3].action == KeyAction::Release, "fourth action is B release");
    }

    const auto p = s.progress();
    expect(p->state == PlaybackState::Stopped, "song end moves to Stopped");
    expectEq(qint64(p->completedSongs), 1, "completion counter bumped once");
    expect(p->lastCompletedSong == song, "snapshot names the finished song");
    expectEq(p->durationMs, 600, "snapshot reports duration 600ms");
    expectEq(s.heldKeyCount(), 0, "no key held after song end");
}

static void testPauseDoesNotAdvanceMusicalTime() {
    ManualClock clock;
    RecordingDispatcher out(&clock);
    PlaybackScheduler s(&clock, &out);

    expect(s.load(threeNoteSong()), "load");
    expect(s.play(), "play");
    s.tick();
    runUntil(s, clock, 300, 10);

    s.requestTogglePause();
    s.tick();
    expect(s.state() == PlaybackState::Paused, "togglePause from Playing pauses");
    const qint64 pauseInstant = clock.nowMs();
    const qint64 before = elapsedNow(s);
    expectEq(before, 300, "elapsed at pause instant");

    // Five seconds of wall time with the loop still ticking.
    runUntil(s, clock, pauseInstant + 5000, 50);
    expectEq(out.count("b", KeyAction::Press), 0, "nothing dispatched while paused");
    expectEq(elapsedNow(s), before, "elapsed frozen while paused");

    s.requestTogglePause();
    s.tick();
    expect(s.state() == PlaybackState::Playing, "togglePause from Paused resumes");
    const qint64 resumeInstant = clock.nowMs();
    expectEq(elapsedNow(s), before, "elapsed after resume equals elapsed before pause");

    runUntil(s, clock, resumeInstant + 400, 1);
    qint64 bPressAt = -1;
    for (const Action& a : out.actions) {
        if (a.key == "b" && a.action == KeyAction::Press) bPressAt = a.atMs;
    }
    expectEq(bPressAt, resumeInstant + 200, "B press lands 200ms of playing time after the pause");
}

static void testPauseReleasesAndRepressesHeldKeys() {
    ManualClock clock;
    RecordingDispatcher out(&clock);
    PlaybackScheduler s(&clock, &out);

    expect(s.load(makeSong({{0, "a", NoteAction::Press}, {400, "a", NoteAction::Release}, {450, "c", NoteAction::Press}, {500, "c", NoteAction::Release}})), "load");
    expect(s.play(), "play");
    runUntil(s, clock, 100, 10);
    expectEq(s.heldKeyCount(), 1, "A held before pause");

    expect(s.pause(), "pause while Playing");
    expectEq(s.heldKeyCount(), 0, "pause releases held keys");
    expectEq(out.count("a", KeyAction::Release), 1, "A released by pause");

    clock.advance(1000);
    expect(s.play(), "play resumes from Paused");
    expectEq(out.count("a", KeyAction::Press), 2, "A pressed again on resume");
    expectEq(s.heldKeyCount(), 1, "A held again after resume");

    runUntil(s, clock, clock.nowMs() + 500, 10);
    expectEq(out.count("a", KeyAction::Release), 2, "A released at its own note-off");
    expectEq(out.count("c", KeyAction::Press), 1, "later notes still play");
    expect(out.actions.size() >= 3 && out.actions[2].key == "a" && out.actions[2].action == KeyAction::Press,
           "re-press happens before any later note");
}

static void testLoadThenStopLeavesNothingHeld() {
    ManualClock clock;
    RecordingDispatcher out(&clock);
    PlaybackScheduler s(&clock, &out);

    expect(s.load(threeNoteSong()), "load");
    s.stop();
    s.tick();
    expectEq(s.heldKeyCount(), 0, "load + stop: nothing held");
    expectEq(out.actions.size(), 0, "load + stop: nothing dispatched");

    // Stop mid-note releases the key.
    expect(s.play(), "play after stop restarts the kept song");
    runUntil(s, clock, 100, 10);
    expectEq(s.heldKeyCount(), 1, "A held at 100ms");
    s.requestStop();
    s.tick();
    expectEq(s.heldKeyCount(), 0, "stop force-releases");
    expectEq(out.count("a", KeyAction::Release), 1, "A released by stop");
    expect(s.state() == PlaybackState::Stopped, "stop moves to Stopped");
    expectEq(elapsedNow(s), 0, "stopped elapsed is 0");
}

static void testSeek() {
    ManualClock clock;
    RecordingDispatcher out(&clock);
    PlaybackScheduler s(&clock, &out);

    expect(s.load(threeNoteSong()), "load");
    expect(s.play(), "play");
    runUntil(s, clock, 100, 10);
    expectEq(s.heldKeyCount(), 1, "A held before seek");

    s.requestSeek(450);
    s.tick();
    expectEq(out.count("a", KeyAction::Release), 1, "seek force-releases A before the next dispatch");
    expectEq(s.heldKeyCount(), 0, "nothing held right after seek");
    const qint64 afterSeek = elapsedNow(s);
    expect(afterSeek >= 450 && afterSeek <= 455, QString("elapsed within one tick of the seek target (%1)").arg(afterSeek));

    runUntil(s, clock, clock.nowMs() + 200, 5);
    expectEq(out.count("b", KeyAction::Press), 1, "B plays after seeking before it");

    // Seeking past the end clamps to the duration and finishes the song.
    PlaybackScheduler s2(&clock, &out);
    expect(s2.load(threeNoteSong()), "load s2");
    expect(s2.play(), "play s2");
    expect(s2.seek(99999), "seek beyond the end is clamped");
    expectEq(elapsedNow(s2), 600, "clamped to duration");
    s2.tick();
    expect(s2.state() == PlaybackState::Stopped, "clamped seek then completes");

    // Seek while paused stays paused and moves the cursor.
    PlaybackScheduler s3(&clock, &out);
    expect(s3.load(threeNoteSong()), "load s3");
    expect(s3.play(), "play s3");
    expect(s3.pause(), "pause s3");
    expect(s3.seek(-50), "seek while paused");
    expect(s3.state() == PlaybackState::Paused, "still paused after seek");
    expectEq(elapsedNow(s3), 0, "negative target clamps to 0");
}

static void testRejectedControls() {
    ManualClock clock;
    RecordingDispatcher out(&clock);
    PlaybackScheduler s(&clock, &out);

    PlaybackError err;
    expect(!s.seek(100, &err), "seek while Stopped is rejected");
    expect(err.kind == PlaybackError::Kind::InvalidState, "rejection is InvalidState");
    expect(!s.play(), "play with no song is rejected");
    expect(!s.pause(), "pause while Stopped is rejected");
    expectEq(qint64(s.progress()->rejectedControls), 3, "rejections are counted");

    expect(s.load(threeNoteSong()), "load");
    expect(s.play(), "play");
    expect(!s.load(threeNoteSong()), "load while Playing is rejected");
    expect(!s.play(), "play while Playing is rejected");
    expect(s.state() == PlaybackState::Playing, "rejected controls have no side effect");
    expectEq(out.actions.size(), 0, "no dispatch from rejected controls");

    // Queued controls are applied at the next tick, in order.
    s.requestStop();
    expect(s.state() == PlaybackState::Playing, "queued stop not applied before tick");
    s.requestLoad(threeNoteSong());
    s.requestPlay();
    s.tick();
    expect(s.state() == PlaybackState::Playing, "stop, load, play applied in order");
}

static void testCatchUpBatchAndLeadIn() {
    ManualClock clock;
    RecordingDispatcher out(&clock);
    PlaybackScheduler::Options o;
    o.leadInMs = 2000;
    PlaybackScheduler s(&clock, &out, o);

    expect(s.load(threeNoteSong()), "load");
    expect(s.play(), "play with lead-in");
    expectEq(s.msUntilNextDue(), 2000, "first note due after the lead-in");
    clock.set(1999);
    s.tick();
    expectEq(out.actions.size(), 0, "nothing during the lead-in");
    expectEq(elapsedNow(s), 0, "musical time frozen during the lead-in");

    // A late wake-up dispatches everything due, in order, in one batch.
    clock.set(2000 + 700);
    s.tick();
    expectEq(out.actions.size(), 4, "catch-up batch dispatches all due notes");
    if (out.actions.size() == 4) {
        expect(out.actions[0].key == "a" && out.actions[3].key == "b", "catch-up keeps note order");
    }
    expect(s.state() == PlaybackState::Stopped, "batch reaching the end completes the song");
}

static void testDispatchFailureIsSkipped() {
    ManualClock clock;
    RecordingDispatcher out(&clock);
    out.failKeys << "b";
    PlaybackScheduler s(&clock, &out);

    expect(s.load(threeNoteSong()), "load");
    expect(s.play(), "play");
    runUntil(s, clock, 700, 10);
    const auto p = s.progress();
    expectEq(p->skippedNotes, 1, "failed press counted as skipped");
    expectEq(out.count("a", KeyAction::Release), 1, "playback continued past the failure");
    expectEq(qint64(p->completedSongs), 1, "song still completes");
}

static void testNoDriftOverLongSong() {
    QVector<Note> notes;
    for (int i = 0; i < 600; ++i) {
        notes.push_back({qint64(i) * 100, "a", NoteAction::Press});
        notes.push_back({qint64(i) * 100 + 50, "a", NoteAction::Release});
    }
    ManualClock clock;
    RecordingDispatcher out(&clock);
    PlaybackScheduler s(&clock, &out);
    expect(s.load(makeSong(notes)), "load long song");
    expect(s.play(), "play long song");

    // Irregular wake-ups: 3, 7, 3, 7... ms.
    int step = 3;
    while (s.state() == PlaybackState::Playing && clock.nowMs() < 70000) {
        clock.advance(step);
        step = (step == 3) ? 7 : 3;
        s.tick();
    }

    expectEq(out.actions.size(), notes.size(), "every note dispatched");
    qint64 worst = 0;
    for (int i = 0; i < out.actions.size() && i < notes.size(); ++i) {
        worst = qMax(worst, out.actions[i].atMs - notes[i].offsetMs);
    }
    expect(worst <= 7, QString("lateness bounded by the tick, no drift after 60s (worst %1ms)").arg(worst));
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testThreeNoteScenario();
    testPauseDoesNotAdvanceMusicalTime();
    testPauseReleasesAndRepressesHeldKeys();
    testLoadThenStopLeavesNothingHeld();
    testSeek();
    testRejectedControls();
    testCatchUpBatchAndLeadIn();
    testDispatchFailureIsSkipped();
    testNoDriftOverLongSong();

    if (g_failures == 0) {
        qInfo("PlaybackSchedulerTests: PASS");
        return 0;
    }

    qWarning("PlaybackSchedulerTests: FAIL (%d failures)", g_failures);
    return 1;
}
