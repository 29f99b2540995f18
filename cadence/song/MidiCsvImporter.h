#pragma once

#include <QByteArray>
#include <QString>

#include "cadence/song/KeyLayout.h"
#include "cadence/song/Song.h"

namespace cadence::song {

struct MidiCsvImportOptions {
    // Playable pitch window. The highest pitch of the piece is transposed onto windowMax,
    // everything else shifts by the same amount and notes leaving the window are dropped.
    int windowMin = 48;
    int windowMax = 83;

    // Presses closer than chordWindowMs to the first press of a group are rolled
    // chordRollStepMs apart so a monophonic instrument can voice them.
    int chordWindowMs = 20;
    int chordRollStepMs = 5;

    KeyLayout layout;
};

// Imports a midicsv text dump ("track, tick, type, args...") into a validated Song.
bool importMidiCsv(const QByteArray& text,
                   const QString& name,
                   const MidiCsvImportOptions& options,
                   Song* out,
                   SongParseError* outError = nullptr);

} // namespace cadence::song
