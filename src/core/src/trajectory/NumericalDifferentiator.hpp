/**
 * @file NumericalDifferentiator.hpp
 * @brief Finite-difference derivative of a time series
 *
 * Interior points: three-point central difference on (possibly) non-uniform
 * spacing. With h1 = t[i]-t[i-1], h2 = t[i+1]-t[i]:
 *
 *   f'(t[i]) = -h2/(h1(h1+h2)) f[i-1] + (h2-h1)/(h1 h2) f[i] + h1/(h2(h1+h2)) f[i+1]
 *
 * which is (f[i+1]-f[i-1])/(2h) for uniform spacing.
 * Endpoints: forward difference at the first sample, backward at the last.
 */

#pragma once

#include <cstddef>
#include <vector>

namespace planar_arm {
namespace trajectory {

class NumericalDifferentiator {
public:
    /**
     * True if times is non-empty and strictly increasing
     */
    static bool isStrictlyIncreasing(const std::vector<double>& times);

    /**
     * Derivative of values with respect to times.
     *
     * @param times  Strictly increasing sample times
     * @param values Samples, same length as times
     * @return Derivative at every sample; all zeros for a single sample;
     *         empty if the inputs are mismatched or times is not increasing
     */
    static std::vector<double> differentiate(const std::vector<double>& times,
                                             const std::vector<double>& values);
};

} // namespace trajectory
} // namespace planar_arm
