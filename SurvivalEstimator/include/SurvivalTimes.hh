#ifndef SURVIVAL_SURVIVAL_TIMES_HH
#define SURVIVAL_SURVIVAL_TIMES_HH

/**
 * @file SurvivalTimes.hh
 * @brief Time-indexed queries on a fitted step function
 *
 * - Quantile (and median) survival times
 * - Step-function lookup at arbitrary times
 */

#include "KaplanMeierEstimate.hh"
#include <vector>

namespace SurvivalEstimation {

/**
 * @brief Time at which the estimate crosses q
 *
 * SurvivalFunction: first time with S(t) <= q, +inf if S never drops to q.
 * CumulativeDensity: first time with F(t) >= q, -inf if F starts above q.
 *
 * @param q Probability level
 * @param timeline Ascending times
 * @param values Estimate on the timeline
 * @param kind Kind of the estimate
 * @return Crossing time
 */
double qthSurvivalTime(double q,
                       const std::vector<double>& timeline,
                       const std::vector<double>& values,
                       EstimateKind kind);

/**
 * @brief Median survival time, qthSurvivalTime(0.5, ...)
 */
double medianSurvivalTime(const std::vector<double>& timeline,
                          const std::vector<double>& values,
                          EstimateKind kind);

/**
 * @brief Step-function value at each query time
 *
 * Each time takes the value at the last timeline point at or before it
 * (no interpolation). Times before the first point take `before`.
 *
 * @param timeline Ascending times
 * @param values Step values on the timeline
 * @param times Query times, any order
 * @param before Value reported before the first timeline point
 * @return One value per query time
 */
std::vector<double> stepFunctionValues(const std::vector<double>& timeline,
                                       const std::vector<double>& values,
                                       const std::vector<double>& times,
                                       double before);

} // namespace SurvivalEstimation

#endif // SURVIVAL_SURVIVAL_TIMES_HH
