#ifndef SURVIVAL_ADDITIVE_ESTIMATE_HH
#define SURVIVAL_ADDITIVE_ESTIMATE_HH

/**
 * @file AdditiveEstimate.hh
 * @brief Cumulative accumulation of per-interval contributions
 *
 * Any additive estimator (Kaplan-Meier, Nelson-Aalen, ...) is described by
 * two interval functions of (population, deaths). This module sums them
 * over the event table and pads the result onto a reporting timeline.
 *
 * Forward (right censoring):
 *   population = at_risk, value at t = sum over rows with time <= t
 *
 * Reverse (left censoring):
 *   population = total entrance - removals strictly after the row,
 *   value at t = sum over rows with time > t
 */

#include "DataTypes.hh"
#include <functional>
#include <vector>

namespace SurvivalEstimation {

/// f(population, deaths) -> per-interval term, element by element
typedef std::function<std::vector<double>(const std::vector<double>&,
                                          const std::vector<double>&)> IntervalFunction;

/**
 * @struct AdditiveEstimateResult
 * @brief Accumulated sequences aligned with the reporting timeline
 */
struct AdditiveEstimateResult {
    std::vector<double> timeline;            ///< Reporting timeline
    std::vector<double> logEstimate;         ///< Cumulative log-space estimate
    std::vector<double> cumulativeVariance;  ///< Cumulative variance
};

/**
 * @brief Accumulate interval contributions over the event table
 *
 * Timeline points before the first event table row take the boundary
 * value: 0 for the forward sum, -inf for the reverse sum, with zero
 * variance.
 *
 * @param table Event table
 * @param timeline Reporting timeline (ascending)
 * @param additiveF Log-space interval contribution
 * @param additiveVar Variance interval contribution
 * @param reverse True for left censorship
 * @return Cumulative log estimate and variance on the timeline
 */
AdditiveEstimateResult additiveEstimate(const EventTable& table,
                                        const std::vector<double>& timeline,
                                        IntervalFunction additiveF,
                                        IntervalFunction additiveVar,
                                        bool reverse);

} // namespace SurvivalEstimation

#endif // SURVIVAL_ADDITIVE_ESTIMATE_HH
