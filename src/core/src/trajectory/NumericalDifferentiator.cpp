/**
 * @file NumericalDifferentiator.cpp
 * @brief Finite-difference derivative implementation
 */

#include "NumericalDifferentiator.hpp"

namespace planar_arm {
namespace trajectory {

bool NumericalDifferentiator::isStrictlyIncreasing(const std::vector<double>& times) {
    if (times.empty()) {
        return false;
    }
    for (size_t i = 1; i < times.size(); ++i) {
        if (!(times[i] > times[i - 1])) {
            return false;
        }
    }
    return true;
}

std::vector<double> NumericalDifferentiator::differentiate(const std::vector<double>& times,
                                                           const std::vector<double>& values) {
    if (times.size() != values.size() || !isStrictlyIncreasing(times)) {
        return {};
    }

    const size_t n = times.size();
    std::vector<double> derivative(n, 0.0);
    if (n == 1) {
        return derivative;
    }

    // Forward / backward differences at the endpoints
    derivative[0] = (values[1] - values[0]) / (times[1] - times[0]);
    derivative[n - 1] = (values[n - 1] - values[n - 2]) / (times[n - 1] - times[n - 2]);

    // Central differences for interior points
    for (size_t i = 1; i + 1 < n; ++i) {
        const double h1 = times[i] - times[i - 1];
        const double h2 = times[i + 1] - times[i];
        derivative[i] = -h2 / (h1 * (h1 + h2)) * values[i - 1]
                      + (h2 - h1) / (h1 * h2) * values[i]
                      + h1 / (h2 * (h1 + h2)) * values[i + 1];
    }

    return derivative;
}

} // namespace trajectory
} // namespace planar_arm
