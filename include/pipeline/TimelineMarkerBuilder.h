#ifndef DAE_PIPELINE_TIMELINEMARKERBUILDER_H
#define DAE_PIPELINE_TIMELINEMARKERBUILDER_H

#include <string>
#include <vector>
#include "../core/AnalysisTypes.h"

namespace dae::pipeline {

/**
 * @brief Turns the session metrics into timestamped coaching markers.
 *
 * Markers are placed at fixed fractions of the session duration (30s when
 * unknown), except volume and silence markers, which sit on their first
 * example when one exists. The list is never empty: without any finding a
 * single "overall" info marker is emitted at the midpoint. Output is sorted
 * by time, keeping insertion order on ties.
 */
class TimelineMarkerBuilder {
public:
    static constexpr double kFallbackDurationSec = 30.0;
    static constexpr size_t kMaxFillerMarkers = 3;

    static std::vector<core::TimelineMarker> build(const core::SessionMetrics& metrics);

private:
    static void add(std::vector<core::TimelineMarker>& markers, double second, const std::string& category,
                    core::Severity severity, const std::string& message);
};

/**
 * @brief Short ordered advice list covering pace, fillers, stutters, pitch, volume and pauses.
 */
std::vector<std::string> composeSummaryFeedback(const core::SessionMetrics& metrics);

} // namespace dae::pipeline

#endif // DAE_PIPELINE_TIMELINEMARKERBUILDER_H
