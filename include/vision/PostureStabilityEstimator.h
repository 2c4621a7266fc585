#ifndef DAE_VISION_POSTURESTABILITYESTIMATOR_H
#define DAE_VISION_POSTURESTABILITYESTIMATOR_H

#include <optional>
#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AnalysisTypes.h"
#include "EventSegmenter.h"
#include "Landmarks.h"

namespace dae::vision {

struct PostureConfig {
    double stabilityScale = 80.0;
    double swayEventThreshold = 0.02;  ///< Per-transition sway flagged as "high".
    double unstableBelow = 4.0;
    double moderateBelow = 7.0;
};

struct PostureResult {
    BooleanSignal highSway;
    size_t poseSamples = 0;
    size_t transitions = 0;
    double swayScore = 0.0;
    double postureStability = 0.0;
    core::PostureLevel postureLevel = core::PostureLevel::Unknown;
};

/**
 * @brief Shoulder-midpoint drift between consecutive pose detections.
 */
class PostureStabilityEstimator : public core::IAnalyzer {
public:
    std::string getName() const override { return "Posture"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override { m_config = PostureConfig{}; }

    /**
     * @brief Midpoint of the two shoulder landmarks, if both are present.
     */
    static std::optional<Point2> midShoulder(const std::vector<Point2>& pose);

    PostureResult analyze(const std::vector<LandmarkFrame>& frames) const;

private:
    PostureConfig m_config;
};

} // namespace dae::vision

#endif // DAE_VISION_POSTURESTABILITYESTIMATOR_H
