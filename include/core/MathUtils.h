#ifndef DAE_CORE_MATHUTILS_H
#define DAE_CORE_MATHUTILS_H

#include <string>
#include <vector>

namespace dae::core {

/** @brief Rounds to a fixed number of decimal places (half away from zero). */
double roundTo(double value, int digits);

double clampValue(double value, double lo, double hi);

/** @brief Arithmetic mean; 0 for an empty input. */
double mean(const std::vector<double>& values);

/** @brief Population variance; 0 for an empty input. */
double variance(const std::vector<double>& values);

/**
 * @brief Formats seconds as "HH:MM:SS.ss". Negative input is treated as 0.
 */
std::string formatClock(double totalSeconds);

} // namespace dae::core

#endif // DAE_CORE_MATHUTILS_H
