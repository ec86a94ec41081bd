#ifndef SURVIVAL_CONFIDENCE_BANDS_HH
#define SURVIVAL_CONFIDENCE_BANDS_HH

/**
 * @file ConfidenceBands.hh
 * @brief Pointwise confidence band from Greenwood's exponential formula
 *
 * With v = log S(t), V(t) the cumulative Greenwood variance and
 * z = Phi^-1(1 - alpha/2):
 *   upper = exp(-exp(log(-v) + z sqrt(V) / v))
 *   lower = exp(-exp(log(-v) - z sqrt(V) / v))
 *
 * Working on log(-log S) keeps both bounds inside [0, 1].
 * Where S(t) == 1 (v == 0) both bounds equal the point estimate; where
 * S(t) == 0 both bounds are 0.
 */

#include <string>
#include <vector>

namespace SurvivalEstimation {

/**
 * @struct ConfidenceBand
 * @brief Upper and lower bound columns with their names
 */
struct ConfidenceBand {
    std::string upperLabel;
    std::string lowerLabel;
    std::vector<double> upper;
    std::vector<double> lower;
};

/**
 * @brief Default band labels "<label>_upper_<1-alpha>", "<label>_lower_<1-alpha>"
 * @return {upper, lower}
 */
std::vector<std::string> defaultConfidenceLabels(const std::string& label, double alpha);

/**
 * @brief Build the exponential Greenwood band around a point estimate
 *
 * @param estimate Point estimate values in [0, 1]
 * @param cumulativeVariance Cumulative Greenwood variance, same length
 * @param alpha Significance level, 0 < alpha < 1
 * @param label Name of the estimate, used for default labels
 * @param ciLabels Empty, or exactly two labels {upper, lower}
 * @return Band with both bounds in [0, 1]
 * @throws ValidationError for a bad alpha or a label list not of length 2
 */
ConfidenceBand exponentialGreenwoodBand(const std::vector<double>& estimate,
                                        const std::vector<double>& cumulativeVariance,
                                        double alpha,
                                        const std::string& label,
                                        const std::vector<std::string>& ciLabels = std::vector<std::string>());

} // namespace SurvivalEstimation

#endif // SURVIVAL_CONFIDENCE_BANDS_HH
