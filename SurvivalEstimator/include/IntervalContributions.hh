#ifndef SURVIVAL_INTERVAL_CONTRIBUTIONS_HH
#define SURVIVAL_INTERVAL_CONTRIBUTIONS_HH

/**
 * @file IntervalContributions.hh
 * @brief Kaplan-Meier per-interval contributions in log space
 *
 * For an interval with population at risk p and observed deaths d:
 *   log increment:      log(p - d) - log(p)
 *   variance increment: d / (p (p - d))        (Greenwood)
 *
 * Summing the log increments over the timeline gives log S(t); summing the
 * variance increments gives the Greenwood variance of log S(t).
 */

#include <vector>

namespace SurvivalEstimation {

/**
 * @brief Log of the conditional survival probability of each interval
 *
 * p == d gives -inf (the curve drops to zero); no floating point exception
 * status escapes the call.
 *
 * @param population At-risk population per interval
 * @param deaths Observed deaths per interval
 * @return log(p - d) - log(p), element by element
 */
std::vector<double> kaplanMeierLogIncrement(const std::vector<double>& population,
                                            const std::vector<double>& deaths);

/**
 * @brief Greenwood variance term of each interval
 *
 * Where p (p - d) == 0 the term is 0.
 *
 * @param population At-risk population per interval
 * @param deaths Observed deaths per interval
 * @return d / (p (p - d)), element by element
 */
std::vector<double> greenwoodVarianceIncrement(const std::vector<double>& population,
                                               const std::vector<double>& deaths);

} // namespace SurvivalEstimation

#endif // SURVIVAL_INTERVAL_CONTRIBUTIONS_HH
