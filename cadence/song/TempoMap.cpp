#include "cadence/song/TempoMap.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace cadence::song {

TempoMap::TempoMap(int division, QVector<Change> changes)
    : m_division(qMax(1, division)), m_changes(std::move(changes)) {
    std::stable_sort(m_changes.begin(), m_changes.end(),
                     [](const Change& a, const Change& b) { return a.tick < b.tick; });
    m_changes.erase(std::remove_if(m_changes.begin(), m_changes.end(),
                                   [](const Change& c) { return c.usPerQuarter <= 0 || c.tick < 0; }),
                    m_changes.end());
    if (m_changes.isEmpty() || m_changes.first().tick > 0) {
        m_changes.prepend(Change{0, kDefaultUsPerQuarter});
    }
}

double TempoMap::tickToMs(qint64 tick) const {
    if (tick <= 0) return 0.0;

    double ms = 0.0;
    for (int i = 0; i < m_changes.size(); ++i) {
        const qint64 segStart = m_changes[i].tick;
        if (tick <= segStart) break;
        const qint64 segEnd = (i + 1 < m_changes.size()) ? std::min(m_changes[i + 1].tick, tick) : tick;
        const double usPerTick = double(m_changes[i].usPerQuarter) / double(m_division);
        ms += double(segEnd - segStart) * usPerTick / 1000.0;
        if (segEnd == tick) break;
    }
    return ms;
}

double TempoMap::initialBpm() const {
    const qint64 us = m_changes.isEmpty() ? kDefaultUsPerQuarter : m_changes.first().usPerQuarter;
    return std::round((60000000.0 / double(us)) * 10.0) / 10.0;
}

} // namespace cadence::song
