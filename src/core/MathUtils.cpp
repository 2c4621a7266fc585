#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>

namespace dae::core {

double roundTo(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

double clampValue(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double variance(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double mu = mean(values);
    double acc = 0.0;
    for (double v : values) {
        acc += (v - mu) * (v - mu);
    }
    return acc / static_cast<double>(values.size());
}

std::string formatClock(double totalSeconds) {
    const double total = std::max(0.0, totalSeconds);
    const int hours = static_cast<int>(total / 3600.0);
    const int minutes = static_cast<int>(std::fmod(total, 3600.0) / 60.0);
    const double seconds = total - hours * 3600.0 - minutes * 60.0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%05.2f", hours, minutes, seconds);
    return buf;
}

} // namespace dae::core
