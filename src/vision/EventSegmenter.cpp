#include "../../include/vision/EventSegmenter.h"
#include "../../include/core/MathUtils.h"
#include <optional>

namespace dae::vision {

BooleanSignal invert(const BooleanSignal& signal) {
    BooleanSignal out;
    out.reserve(signal.size());
    for (const auto& s : signal) {
        out.push_back({s.timestamp, !s.flag});
    }
    return out;
}

std::vector<core::EventSpan> segmentEvents(const BooleanSignal& signal, double minDurationSec) {
    std::vector<core::EventSpan> events;
    std::optional<double> runStart;
    double lastTrue = 0.0;

    auto closeRun = [&]() {
        if (runStart && lastTrue - *runStart >= minDurationSec) {
            core::EventSpan span;
            span.start = core::roundTo(*runStart, 3);
            span.end = core::roundTo(lastTrue, 3);
            span.startHms = core::formatClock(span.start);
            span.endHms = core::formatClock(span.end);
            events.push_back(std::move(span));
        }
        runStart.reset();
    };

    for (const auto& sample : signal) {
        if (sample.flag) {
            if (!runStart) runStart = sample.timestamp;
            lastTrue = sample.timestamp;
        } else {
            closeRun();
        }
    }
    closeRun();
    return events;
}

} // namespace dae::vision
