#include "../../include/vision/GestureEnergyEstimator.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <cmath>

namespace dae::vision {

namespace {

bool hasHands(const std::optional<std::vector<double>>& hands) {
    if (!hands || hands->empty()) return false;
    return std::any_of(hands->begin(), hands->end(), [](double v) { return v != 0.0; });
}

} // namespace

bool GestureEnergyEstimator::initialize(const nlohmann::json& config) {
    if (config.contains("energyScale")) m_config.energyScale = config["energyScale"].get<double>();
    if (config.contains("lowBelow")) m_config.lowBelow = config["lowBelow"].get<double>();
    if (config.contains("moderateBelow")) m_config.moderateBelow = config["moderateBelow"].get<double>();
    return m_config.energyScale > 0.0 && m_config.lowBelow <= m_config.moderateBelow;
}

double GestureEnergyEstimator::frameVelocity(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t n = std::min(a.size(), b.size());
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) sum += std::abs(a[i] - b[i]);
    return sum / static_cast<double>(n);
}

core::Level GestureEnergyEstimator::classify(double gestureEnergy, size_t transitions) const {
    if (transitions == 0) return core::Level::Unknown;
    if (gestureEnergy < m_config.lowBelow) return core::Level::Low;
    if (gestureEnergy < m_config.moderateBelow) return core::Level::Moderate;
    return core::Level::High;
}

GestureResult GestureEnergyEstimator::analyze(const std::vector<LandmarkFrame>& frames) const {
    std::vector<double> velocities;
    size_t moving = 0;
    const std::vector<double>* previous = nullptr;

    for (const auto& frame : frames) {
        if (!hasHands(frame.hands)) continue;
        if (previous) {
            velocities.push_back(frameVelocity(*frame.hands, *previous));
            if (velocities.back() > 0.0) ++moving;
        }
        previous = &*frame.hands;
    }

    GestureResult result;
    result.transitions = velocities.size();
    const double avgVelocity = core::mean(velocities);
    const double energy = core::clampValue(avgVelocity * m_config.energyScale, 0.0, 10.0);
    result.avgVelocity = core::roundTo(avgVelocity, 6);
    result.gestureEnergy = core::roundTo(energy, 3);
    // A frozen stream (no transition moved at all) is no evidence of gesturing.
    result.activityLevel = classify(energy, moving);
    return result;
}

} // namespace dae::vision
