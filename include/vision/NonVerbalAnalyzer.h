#ifndef DAE_VISION_NONVERBALANALYZER_H
#define DAE_VISION_NONVERBALANALYZER_H

#include <string>
#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AnalysisTypes.h"
#include "AttentionEstimator.h"
#include "GestureEnergyEstimator.h"
#include "ILandmarkProvider.h"
#include "PostureStabilityEstimator.h"

namespace dae::vision {

struct EventConfig {
    double minGazeAwaySec = 2.0;
    double minSwaySec = 2.0;
    double highSeverityAfterSec = 4.0;
};

/**
 * @brief Non-verbal metrics plus the notes explaining why they may be empty.
 */
struct NonVerbalReport {
    core::NonVerbalMetrics metrics;
    std::vector<std::string> notes;
};

/**
 * @brief Runs the gesture, attention and posture estimators over one landmark
 *        stream and fuses their spans into a single event list.
 *
 * Configuration: {"Gesture": {...}, "Attention": {...}, "Posture": {...},
 * "Events": {"minGazeAwaySec", "minSwaySec", "highSeverityAfterSec"}}.
 */
class NonVerbalAnalyzer : public core::IAnalyzer {
public:
    std::string getName() const override { return "NonVerbal"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override;

    /**
     * @brief Computes metrics from already extracted frames.
     */
    core::NonVerbalMetrics analyze(const std::vector<LandmarkFrame>& frames) const;

    /**
     * @brief Extracts landmarks through the provider and analyzes them.
     *
     * The caller is expected to have checked provider.capability(). A failed
     * extraction yields the default metrics shape and a note instead of throwing.
     */
    NonVerbalReport analyzeVideo(ILandmarkProvider& provider,
                                 const std::string& videoPath,
                                 int targetFps) const;

    /**
     * @brief Orders gaze-away, sway and gesture advisories by timestamp.
     */
    std::vector<core::NonVerbalEvent> buildEvents(const std::vector<core::EventSpan>& gazeAway,
                                                  const std::vector<core::EventSpan>& sway,
                                                  core::Level activityLevel) const;

private:
    GestureEnergyEstimator m_gesture;
    AttentionEstimator m_attention;
    PostureStabilityEstimator m_posture;
    EventConfig m_events;
};

} // namespace dae::vision

#endif // DAE_VISION_NONVERBALANALYZER_H
