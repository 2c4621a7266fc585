#include "../../include/vision/AttentionEstimator.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <cmath>

namespace dae::vision {

bool AttentionEstimator::initialize(const nlohmann::json& config) {
    if (config.contains("maxYawRatio")) m_config.maxYawRatio = config["maxYawRatio"].get<double>();
    if (config.contains("maxPitchRatio")) m_config.maxPitchRatio = config["maxPitchRatio"].get<double>();
    if (config.contains("lowBelow")) m_config.lowBelow = config["lowBelow"].get<double>();
    if (config.contains("moderateBelow")) m_config.moderateBelow = config["moderateBelow"].get<double>();
    return m_config.maxYawRatio > 0.0 && m_config.maxPitchRatio > 0.0;
}

bool AttentionEstimator::isAttentive(const std::vector<Point2>& face) const {
    const size_t needed = std::max({kFaceLeftEye, kFaceRightEye, kFaceNoseTip, kFaceUpperLip});
    if (face.size() <= needed) return true;

    const Point2& leftEye = face[kFaceLeftEye];
    const Point2& rightEye = face[kFaceRightEye];
    const Point2& nose = face[kFaceNoseTip];
    const Point2& mouth = face[kFaceUpperLip];

    const double eyeMidX = (leftEye.x + rightEye.x) / 2.0;
    const double eyeMidY = (leftEye.y + rightEye.y) / 2.0;
    const double interEye = std::max(std::abs(rightEye.x - leftEye.x), 1e-6);
    const double eyeToMouth = std::max(std::abs(mouth.y - eyeMidY), 1e-6);

    const double yawRatio = std::abs(nose.x - eyeMidX) / interEye;
    const double pitchRatio = std::abs(nose.y - eyeMidY) / eyeToMouth;
    return yawRatio <= m_config.maxYawRatio && pitchRatio <= m_config.maxPitchRatio;
}

AttentionResult AttentionEstimator::analyze(const std::vector<LandmarkFrame>& frames) const {
    AttentionResult result;
    for (const auto& frame : frames) {
        if (!frame.faceTracked) continue;
        bool attentive = false;
        if (frame.face) {
            ++result.faceSamples;
            attentive = isAttentive(*frame.face);
        }
        if (attentive) ++result.attentiveFrames;
        result.attentive.push_back({frame.timestamp, attentive});
    }

    if (result.attentive.empty()) return result;

    const double pct = static_cast<double>(result.attentiveFrames)
                     / static_cast<double>(result.attentive.size()) * 100.0;
    const double score = core::clampValue(pct / 10.0, 0.0, 10.0);
    result.eyeContactPct = core::roundTo(pct, 3);
    result.eyeContactScore = core::roundTo(score, 3);

    if (result.faceSamples == 0) {
        result.eyeContactLevel = core::Level::Unknown;
    } else if (score < m_config.lowBelow) {
        result.eyeContactLevel = core::Level::Low;
    } else if (score < m_config.moderateBelow) {
        result.eyeContactLevel = core::Level::Moderate;
    } else {
        result.eyeContactLevel = core::Level::High;
    }
    return result;
}

} // namespace dae::vision
