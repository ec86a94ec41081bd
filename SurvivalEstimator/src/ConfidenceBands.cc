/**
 * @file ConfidenceBands.cc
 * @brief Implementation of the exponential Greenwood band
 */

#include "ConfidenceBands.hh"
#include "InputValidation.hh"
#include "StandardNormalDistribution.hh"
#include <cmath>
#include <sstream>

namespace SurvivalEstimation {

std::vector<std::string> defaultConfidenceLabels(const std::string& label, double alpha) {
    std::stringstream upper;
    std::stringstream lower;
    upper << label << "_upper_" << (1.0 - alpha);
    lower << label << "_lower_" << (1.0 - alpha);

    std::vector<std::string> labels;
    labels.push_back(upper.str());
    labels.push_back(lower.str());
    return labels;
}

ConfidenceBand exponentialGreenwoodBand(const std::vector<double>& estimate,
                                        const std::vector<double>& cumulativeVariance,
                                        double alpha,
                                        const std::string& label,
                                        const std::vector<std::string>& ciLabels) {
    if (!(alpha > 0.0 && alpha < 1.0)) {
        std::stringstream os;
        os << "alpha must lie strictly between 0 and 1 (got " << alpha << ").";
        throw ValidationError(os.str());
    }
    if (!ciLabels.empty() && ciLabels.size() != 2) {
        std::stringstream os;
        os << "ci_labels should be a length 2 array (got " << ciLabels.size() << ").";
        throw ValidationError(os.str());
    }

    const std::vector<std::string> labels =
        ciLabels.empty() ? defaultConfidenceLabels(label, alpha) : ciLabels;

    StandardNormalDistribution normal;
    const double z = normal.inv_cdf(1.0 - alpha / 2.0);

    ConfidenceBand band;
    band.upperLabel = labels[0];
    band.lowerLabel = labels[1];
    band.upper.resize(estimate.size());
    band.lower.resize(estimate.size());

    for (std::size_t i = 0; i < estimate.size(); ++i) {
        const double s = estimate[i];
        if (s >= 1.0) {
            band.upper[i] = s;
            band.lower[i] = s;
            continue;
        }
        if (s <= 0.0) {
            band.upper[i] = 0.0;
            band.lower[i] = 0.0;
            continue;
        }

        const double v = std::log(s);
        const double halfWidth = z * std::sqrt(cumulativeVariance[i]) / v;
        band.upper[i] = std::exp(-std::exp(std::log(-v) + halfWidth));
        band.lower[i] = std::exp(-std::exp(std::log(-v) - halfWidth));
    }

    return band;
}

} // namespace SurvivalEstimation
