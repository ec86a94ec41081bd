#ifndef SURVIVAL_MATH_UTILITIES_HH
#define SURVIVAL_MATH_UTILITIES_HH

/**
 * @file MathUtilities.hh
 * @brief Mathematical utility functions for survival estimation
 *
 * Provides:
 * - Scoped hold of the floating point environment
 * - Running sums that skip undefined terms
 */

#include <cfenv>
#include <cmath>
#include <vector>

namespace SurvivalEstimation {

/**
 * @class ScopedFloatingPointHold
 * @brief Holds the floating point environment for the lifetime of the object
 *
 * On construction the current environment is saved, status flags are
 * cleared and non-stop mode is installed (no enabled trap fires). On
 * destruction the saved environment is restored, which discards any
 * FE_DIVBYZERO / FE_INVALID raised in between.
 */
class ScopedFloatingPointHold {
public:
    ScopedFloatingPointHold() {
        std::feholdexcept(&m_env);
    }

    ~ScopedFloatingPointHold() {
        std::fesetenv(&m_env);
    }

private:
    ScopedFloatingPointHold(const ScopedFloatingPointHold&);
    ScopedFloatingPointHold& operator=(const ScopedFloatingPointHold&);

    std::fenv_t m_env;
};

/**
 * @brief Running sum in the order given
 *
 * NaN terms are skipped: they add nothing to the running total and the
 * position keeps the total accumulated so far.
 *
 * @param terms Terms to accumulate
 * @return out[i] = sum of terms[0..i]
 */
inline std::vector<double> cumulativeSum(const std::vector<double>& terms) {
    std::vector<double> out(terms.size());
    double total = 0.0;
    for (std::size_t i = 0; i < terms.size(); ++i) {
        if (!std::isnan(terms[i])) total += terms[i];
        out[i] = total;
    }
    return out;
}

} // namespace SurvivalEstimation

#endif // SURVIVAL_MATH_UTILITIES_HH
