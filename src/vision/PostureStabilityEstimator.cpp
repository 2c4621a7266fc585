#include "../../include/vision/PostureStabilityEstimator.h"
#include "../../include/core/MathUtils.h"
#include <cmath>

namespace dae::vision {

bool PostureStabilityEstimator::initialize(const nlohmann::json& config) {
    if (config.contains("stabilityScale")) m_config.stabilityScale = config["stabilityScale"].get<double>();
    if (config.contains("swayEventThreshold")) m_config.swayEventThreshold = config["swayEventThreshold"].get<double>();
    if (config.contains("unstableBelow")) m_config.unstableBelow = config["unstableBelow"].get<double>();
    if (config.contains("moderateBelow")) m_config.moderateBelow = config["moderateBelow"].get<double>();
    return m_config.stabilityScale > 0.0 && m_config.swayEventThreshold > 0.0;
}

std::optional<Point2> PostureStabilityEstimator::midShoulder(const std::vector<Point2>& pose) {
    if (pose.size() <= kPoseRightShoulder) return std::nullopt;
    const Point2& l = pose[kPoseLeftShoulder];
    const Point2& r = pose[kPoseRightShoulder];
    return Point2{(l.x + r.x) / 2.0, (l.y + r.y) / 2.0};
}

PostureResult PostureStabilityEstimator::analyze(const std::vector<LandmarkFrame>& frames) const {
    PostureResult result;
    std::vector<double> sways;
    std::optional<Point2> previous;

    for (const auto& frame : frames) {
        if (!frame.poseTracked || !frame.pose) continue;
        const auto current = midShoulder(*frame.pose);
        if (!current) continue;
        ++result.poseSamples;

        if (previous) {
            const double dx = current->x - previous->x;
            const double dy = current->y - previous->y;
            const double sway = std::sqrt(dx * dx + dy * dy);
            sways.push_back(sway);
            result.highSway.push_back({frame.timestamp, sway >= m_config.swayEventThreshold});
        }
        previous = current;
    }

    result.transitions = sways.size();
    if (result.poseSamples <= 1) return result;

    const double swayScore = core::mean(sways);
    const double stability = core::clampValue(10.0 - swayScore * m_config.stabilityScale, 0.0, 10.0);
    result.swayScore = core::roundTo(swayScore, 6);
    result.postureStability = core::roundTo(stability, 3);

    if (stability < m_config.unstableBelow) {
        result.postureLevel = core::PostureLevel::Unstable;
    } else if (stability < m_config.moderateBelow) {
        result.postureLevel = core::PostureLevel::Moderate;
    } else {
        result.postureLevel = core::PostureLevel::Stable;
    }
    return result;
}

} // namespace dae::vision
