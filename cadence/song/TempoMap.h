#pragma once

#include <QVector>
#include <QtGlobal>

namespace cadence::song {

// Piecewise-constant MIDI tempo map (tick domain -> milliseconds).
class TempoMap {
public:
    static constexpr qint64 kDefaultUsPerQuarter = 500000; // 120 BPM

    struct Change {
        qint64 tick = 0;
        qint64 usPerQuarter = kDefaultUsPerQuarter;
    };

    TempoMap() = default;
    TempoMap(int division, QVector<Change> changes);

    double tickToMs(qint64 tick) const;
    double initialBpm() const;

private:
    int m_division = 480;
    QVector<Change> m_changes; // sorted by tick, first change at tick 0
};

} // namespace cadence::song
