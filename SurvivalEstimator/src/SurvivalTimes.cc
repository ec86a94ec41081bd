/**
 * @file SurvivalTimes.cc
 * @brief Implementation of time-indexed queries
 */

#include "SurvivalTimes.hh"
#include <algorithm>
#include <limits>

namespace SurvivalEstimation {

double qthSurvivalTime(double q,
                       const std::vector<double>& timeline,
                       const std::vector<double>& values,
                       EstimateKind kind) {
    const double inf = std::numeric_limits<double>::infinity();
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();

    if (kind == EstimateKind::CumulativeDensity) {
        if (values.front() > q) return -inf;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (values[i] >= q) return timeline[i];
        }
        return inf;
    }

    if (values.back() > q) return inf;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i] <= q) return timeline[i];
    }
    return inf;
}

double medianSurvivalTime(const std::vector<double>& timeline,
                          const std::vector<double>& values,
                          EstimateKind kind) {
    return qthSurvivalTime(0.5, timeline, values, kind);
}

std::vector<double> stepFunctionValues(const std::vector<double>& timeline,
                                       const std::vector<double>& values,
                                       const std::vector<double>& times,
                                       double before) {
    std::vector<double> out;
    out.reserve(times.size());
    for (double t : times) {
        std::vector<double>::const_iterator it = std::upper_bound(timeline.begin(), timeline.end(), t);
        if (it == timeline.begin()) {
            out.push_back(before);
        } else {
            out.push_back(values[static_cast<std::size_t>(it - timeline.begin()) - 1]);
        }
    }
    return out;
}

} // namespace SurvivalEstimation
