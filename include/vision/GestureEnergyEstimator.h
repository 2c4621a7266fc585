#ifndef DAE_VISION_GESTUREENERGYESTIMATOR_H
#define DAE_VISION_GESTUREENERGYESTIMATOR_H

#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AnalysisTypes.h"
#include "Landmarks.h"

namespace dae::vision {

struct GestureConfig {
    /** @brief Multiplier from mean landmark velocity to the 0-10 energy score. */
    double energyScale = 30.0;
    double lowBelow = 2.5;
    double moderateBelow = 6.5;
};

struct GestureResult {
    double avgVelocity = 0.0;
    double gestureEnergy = 0.0;
    core::Level activityLevel = core::Level::Unknown;
    size_t transitions = 0;
};

/**
 * @brief Turns consecutive hand-landmark vectors into a bounded energy score.
 *
 * Frame velocity is the mean absolute per-coordinate difference between two
 * hand vectors. A frame with no detected hand (absent or all-zero vector) does
 * not break the chain: the next detection is compared with the last one seen.
 */
class GestureEnergyEstimator : public core::IAnalyzer {
public:
    std::string getName() const override { return "Gesture"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override { m_config = GestureConfig{}; }

    GestureResult analyze(const std::vector<LandmarkFrame>& frames) const;

    /**
     * @brief Mean absolute difference over the common prefix of a and b.
     */
    static double frameVelocity(const std::vector<double>& a, const std::vector<double>& b);

    /**
     * @brief "unknown" without moving transitions, otherwise low/moderate/high by energy.
     */
    core::Level classify(double gestureEnergy, size_t transitions) const;

private:
    GestureConfig m_config;
};

} // namespace dae::vision

#endif // DAE_VISION_GESTUREENERGYESTIMATOR_H
