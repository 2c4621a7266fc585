#ifndef DAE_VISION_EVENTSEGMENTER_H
#define DAE_VISION_EVENTSEGMENTER_H

#include <vector>
#include "../core/AnalysisTypes.h"

namespace dae::vision {

/**
 * @brief One sampled value of a boolean per-frame condition.
 */
struct SignalSample {
    double timestamp = 0.0;
    bool flag = false;
};

/** @brief Ordered per-frame condition (attention, high sway, ...). */
using BooleanSignal = std::vector<SignalSample>;

/**
 * @brief Returns the signal with every flag negated.
 */
BooleanSignal invert(const BooleanSignal& signal);

/**
 * @brief Extracts maximal runs of true flags lasting at least minDurationSec.
 *
 * A run's duration is last_true_ts - first_true_ts. Span bounds are rounded to
 * milliseconds and carry HH:MM:SS.ss copies. Output is ordered and non-overlapping.
 */
std::vector<core::EventSpan> segmentEvents(const BooleanSignal& signal, double minDurationSec);

} // namespace dae::vision

#endif // DAE_VISION_EVENTSEGMENTER_H
