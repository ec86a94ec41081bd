/**
 * @file AdditiveEstimate.cc
 * @brief Implementation of the additive accumulator
 */

#include "AdditiveEstimate.hh"
#include "MathUtilities.hh"
#include <algorithm>
#include <cmath>
#include <limits>

namespace SurvivalEstimation {

namespace {

// Sum of terms strictly after each position, skipping NaN terms
std::vector<double> trailingSum(const std::vector<double>& terms) {
    std::vector<double> out(terms.size(), 0.0);
    double total = 0.0;
    for (std::size_t k = terms.size(); k-- > 0; ) {
        out[k] = total;
        if (!std::isnan(terms[k])) total += terms[k];
    }
    return out;
}

} // namespace

AdditiveEstimateResult additiveEstimate(const EventTable& table,
                                        const std::vector<double>& timeline,
                                        IntervalFunction additiveF,
                                        IntervalFunction additiveVar,
                                        bool reverse) {
    const std::size_t n = table.size();
    const std::vector<double> times = table.times();
    const std::vector<double> deaths = table.observed();

    std::vector<double> estimate;
    std::vector<double> variance;

    if (reverse) {
        const std::vector<double> removed = table.removed();
        const std::vector<double> entrance = table.entrance();
        double totalEntrance = 0.0;
        for (double e : entrance) totalEntrance += e;

        std::vector<double> population(n);
        double removedAfter = 0.0;
        for (std::size_t k = n; k-- > 0; ) {
            population[k] = totalEntrance - removedAfter;
            removedAfter += removed[k];
        }

        estimate = trailingSum(additiveF(population, deaths));
        variance = trailingSum(additiveVar(population, deaths));
    } else {
        const std::vector<double> population = table.atRisk();
        estimate = cumulativeSum(additiveF(population, deaths));
        variance = cumulativeSum(additiveVar(population, deaths));
    }

    AdditiveEstimateResult result;
    result.timeline = timeline;
    result.logEstimate.reserve(timeline.size());
    result.cumulativeVariance.reserve(timeline.size());

    const double boundary = reverse ? -std::numeric_limits<double>::infinity() : 0.0;
    for (double t : timeline) {
        // last event table row at or before t
        std::vector<double>::const_iterator it = std::upper_bound(times.begin(), times.end(), t);
        if (it == times.begin()) {
            result.logEstimate.push_back(boundary);
            result.cumulativeVariance.push_back(0.0);
        } else {
            std::size_t k = static_cast<std::size_t>(it - times.begin()) - 1;
            result.logEstimate.push_back(estimate[k]);
            result.cumulativeVariance.push_back(variance[k]);
        }
    }

    return result;
}

} // namespace SurvivalEstimation
