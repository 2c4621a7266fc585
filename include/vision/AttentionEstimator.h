#ifndef DAE_VISION_ATTENTIONESTIMATOR_H
#define DAE_VISION_ATTENTIONESTIMATOR_H

#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AnalysisTypes.h"
#include "EventSegmenter.h"
#include "Landmarks.h"

namespace dae::vision {

struct AttentionConfig {
    double maxYawRatio = 0.35;    ///< |nose.x - eye_mid.x| / inter-eye distance.
    double maxPitchRatio = 0.85;  ///< |nose.y - eye_mid.y| / eye-to-mouth distance.
    double lowBelow = 4.0;
    double moderateBelow = 7.0;
};

struct AttentionResult {
    BooleanSignal attentive;      ///< One sample per face-tracked frame.
    size_t faceSamples = 0;       ///< Frames where a face was actually detected.
    size_t attentiveFrames = 0;
    double eyeContactPct = 0.0;
    double eyeContactScore = 0.0;
    core::Level eyeContactLevel = core::Level::Unknown;
};

/**
 * @brief Geometric head-orientation proxy for "looking at the camera".
 *
 * Frames where the face model ran but found no face count as not attentive.
 */
class AttentionEstimator : public core::IAnalyzer {
public:
    std::string getName() const override { return "Attention"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override { m_config = AttentionConfig{}; }

    /**
     * @brief Attention verdict for one detected face.
     *
     * A face mesh missing any of the eye/nose/mouth reference points is
     * given the benefit of the doubt.
     */
    bool isAttentive(const std::vector<Point2>& face) const;

    AttentionResult analyze(const std::vector<LandmarkFrame>& frames) const;

private:
    AttentionConfig m_config;
};

} // namespace dae::vision

#endif // DAE_VISION_ATTENTIONESTIMATOR_H
