#include "cadence/song/BpmEstimator.h"

#include <QtGlobal>
#include <algorithm>
#include <cmath>
#include <utility>

namespace cadence::song {

double BpmEstimator::fromNotes(const QVector<Note>& notes) {
    QVector<qint64> onsets;
    onsets.reserve(notes.size() / 2 + 1);
    for (const Note& n : notes) {
        if (n.isPress()) onsets.push_back(n.offsetMs);
    }
    return fromOnsets(std::move(onsets));
}

double BpmEstimator::fromOnsets(QVector<qint64> onsetsMs) {
    std::sort(onsetsMs.begin(), onsetsMs.end());
    onsetsMs.erase(std::unique(onsetsMs.begin(), onsetsMs.end()), onsetsMs.end());
    if (onsetsMs.size() < 2) return kDefaultBpm;

    QVector<qint64> intervals;
    intervals.reserve(onsetsMs.size() - 1);
    for (int i = 1; i < onsetsMs.size(); ++i) {
        intervals.push_back(onsetsMs[i] - onsetsMs[i - 1]);
    }
    std::sort(intervals.begin(), intervals.end());

    const int mid = intervals.size() / 2;
    const double median = (intervals.size() % 2 == 1)
        ? double(intervals[mid])
        : (double(intervals[mid - 1]) + double(intervals[mid])) / 2.0;
    if (median <= 0.0) return kDefaultBpm;

    return std::round((60000.0 / median) * 10.0) / 10.0;
}

} // namespace cadence::song
