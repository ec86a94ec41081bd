/**
 * @file KaplanMeierEstimate.cc
 * @brief Implementation of fitted estimate accessors
 */

#include "KaplanMeierEstimate.hh"
#include <iomanip>
#include <limits>

namespace SurvivalEstimation {

std::string estimateName(EstimateKind kind) {
    return (kind == EstimateKind::SurvivalFunction) ? "survival_function"
                                                    : "cumulative_density";
}

KaplanMeierEstimate::KaplanMeierEstimate()
    : kind(EstimateKind::SurvivalFunction)
    , label("KM_estimate")
    , alpha(0.05)
    , median(std::numeric_limits<double>::quiet_NaN())
{
}

NamedSeries KaplanMeierEstimate::estimateSeries() const {
    return NamedSeries(label, timeline, estimate);
}

NamedSeries KaplanMeierEstimate::upperSeries() const {
    return NamedSeries(upperLabel, timeline, upper);
}

NamedSeries KaplanMeierEstimate::lowerSeries() const {
    return NamedSeries(lowerLabel, timeline, lower);
}

NamedSeries KaplanMeierEstimate::varianceSeries() const {
    return NamedSeries(label + "_cumulative_variance", timeline, cumulativeVariance);
}

void KaplanMeierEstimate::print(std::ostream& os) const {
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();

    os << std::fixed << std::setprecision(4);
    os << "=== Kaplan-Meier " << estimateName(kind) << " (" << label << ") ===\n";
    os << "  alpha = " << alpha << ", median = " << median << "\n";
    os << std::setw(12) << "timeline"
       << std::setw(14) << label.substr(0, 13)
       << std::setw(14) << "lower"
       << std::setw(14) << "upper"
       << std::setw(14) << "variance" << "\n";
    os << "  " << std::string(66, '-') << "\n";
    for (std::size_t i = 0; i < timeline.size(); ++i) {
        os << std::setw(12) << timeline[i]
           << std::setw(14) << estimate[i]
           << std::setw(14) << lower[i]
           << std::setw(14) << upper[i]
           << std::setw(14) << cumulativeVariance[i] << "\n";
    }
    os << "==========================================\n";

    os.flags(flags);
    os.precision(precision);
}

} // namespace SurvivalEstimation
