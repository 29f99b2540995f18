#pragma once

#include <QString>

namespace cadence::song {

// Three-octave instrument key layout.
//   base+0..11  -> z x c v b n m row (low)
//   base+12..23 -> a s d f g h j row (medium)
//   base+24..35 -> q w e r t y u row (high)
// Sharps use "shift+", the flat third and flat seventh use "ctrl+".
struct KeyLayout {
    int basePitch = 48;

    int lowestPitch() const { return basePitch; }
    int highestPitch() const { return basePitch + 35; }
    bool contains(int pitch) const { return pitch >= lowestPitch() && pitch <= highestPitch(); }

    // Empty string when the pitch is outside the playable window.
    QString keyForPitch(int pitch) const;
};

} // namespace cadence::song
