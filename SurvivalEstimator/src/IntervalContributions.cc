/**
 * @file IntervalContributions.cc
 * @brief Implementation of Kaplan-Meier interval contributions
 */

#include "IntervalContributions.hh"
#include "MathUtilities.hh"
#include <cmath>

namespace SurvivalEstimation {

std::vector<double> kaplanMeierLogIncrement(const std::vector<double>& population,
                                            const std::vector<double>& deaths) {
    ScopedFloatingPointHold hold;

    std::vector<double> increment(population.size());
    for (std::size_t i = 0; i < population.size(); ++i) {
        increment[i] = std::log(population[i] - deaths[i]) - std::log(population[i]);
    }
    return increment;
}

std::vector<double> greenwoodVarianceIncrement(const std::vector<double>& population,
                                               const std::vector<double>& deaths) {
    ScopedFloatingPointHold hold;

    std::vector<double> increment(population.size());
    for (std::size_t i = 0; i < population.size(); ++i) {
        double v = deaths[i] / (population[i] * (population[i] - deaths[i]));
        // no informative denominator: contributes nothing
        increment[i] = std::isfinite(v) ? v : 0.0;
    }
    return increment;
}

} // namespace SurvivalEstimation
