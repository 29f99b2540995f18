#include "cadence/song/KeyLayout.h"

namespace cadence::song {
namespace {

// Natural-degree letters per row, indexed by scale degree (do re mi fa so la ti).
static const char* const kLowRow[7] = {"z", "x", "c", "v", "b", "n", "m"};
static const char* const kMidRow[7] = {"a", "s", "d", "f", "g", "h", "j"};
static const char* const kHighRow[7] = {"q", "w", "e", "r", "t", "y", "u"};

struct Degree {
    int index;          // 0..6
    const char* prefix; // "", "shift+", "ctrl+"
};

// Semitone within the octave -> how to reach it on the instrument.
static const Degree kSemitones[12] = {
    {0, ""},       // do
    {0, "shift+"}, // do#
    {1, ""},       // re
    {2, "ctrl+"},  // mi flat
    {2, ""},       // mi
    {3, ""},       // fa
    {3, "shift+"}, // fa#
    {4, ""},       // so
    {4, "shift+"}, // so#
    {5, ""},       // la
    {6, "ctrl+"},  // ti flat
    {6, ""},       // ti
};

} // namespace

QString KeyLayout::keyForPitch(int pitch) const {
    if (!contains(pitch)) return {};
    const int rel = pitch - basePitch;
    const int octave = rel / 12;
    const Degree& d = kSemitones[rel % 12];

    const char* const* row = (octave == 0) ? kLowRow : (octave == 1 ? kMidRow : kHighRow);
    return QString::fromLatin1(d.prefix) + QString::fromLatin1(row[d.index]);
}

} // namespace cadence::song
