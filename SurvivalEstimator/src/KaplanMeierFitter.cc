/**
 * @file KaplanMeierFitter.cc
 * @brief Implementation of the Kaplan-Meier fitter
 */

#include "KaplanMeierFitter.hh"
#include "AdditiveEstimate.hh"
#include "ConfidenceBands.hh"
#include "EventTable.hh"
#include "InputValidation.hh"
#include "IntervalContributions.hh"
#include "SurvivalTimes.hh"
#include "TruncationDiagnostics.hh"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace SurvivalEstimation {

KaplanMeierFitter::KaplanMeierFitter(const FitConfig& config)
    : m_config(config)
    , m_fitted(false)
{
}

void KaplanMeierFitter::setConfig(const FitConfig& config) {
    m_config = config;
}

const FitConfig& KaplanMeierFitter::getConfig() const {
    return m_config;
}

const KaplanMeierEstimate& KaplanMeierFitter::fit(const LifetimeData& data) {
    return fit(data, m_config);
}

const KaplanMeierEstimate& KaplanMeierFitter::fit(const LifetimeData& data, const FitConfig& config) {
    PreprocessedInputs inputs = preprocessInputs(data);

    KaplanMeierEstimate result;
    result.kind = config.leftCensorship ? EstimateKind::CumulativeDensity
                                        : EstimateKind::SurvivalFunction;
    result.label = config.label;
    result.alpha = config.alpha;

    if (data.hasEntry()) {
        checkTruncationDegeneracy(inputs.eventTable);
    }

    if (hasNonIntegralValues(inputs.weights)) {
        const std::string caveat =
            "It looks like your weights are not integers, possibly propensity scores. "
            "The naive variance estimates are biased for such weights; "
            "estimate the variances by Monte Carlo instead.";
        std::cerr << "Warning: " << caveat << std::endl;
        result.warnings.push_back(caveat);
    }

    AdditiveEstimateResult accumulated = additiveEstimate(inputs.eventTable,
                                                          inputs.timeline,
                                                          kaplanMeierLogIncrement,
                                                          greenwoodVarianceIncrement,
                                                          config.leftCensorship);

    result.timeline = accumulated.timeline;
    result.cumulativeVariance = accumulated.cumulativeVariance;
    result.estimate.reserve(accumulated.logEstimate.size());
    for (double logValue : accumulated.logEstimate) {
        result.estimate.push_back(std::exp(logValue));
    }

    ConfidenceBand band = exponentialGreenwoodBand(result.estimate,
                                                   result.cumulativeVariance,
                                                   config.alpha,
                                                   config.label,
                                                   config.ciLabels);
    result.upperLabel = band.upperLabel;
    result.lowerLabel = band.lowerLabel;
    result.upper.swap(band.upper);
    result.lower.swap(band.lower);

    result.median = medianSurvivalTime(result.timeline, result.estimate, result.kind);

    result.eventTable = inputs.eventTable;
    result.durations.swap(inputs.durations);
    result.eventObserved.swap(inputs.eventObserved);
    result.entry.swap(inputs.entry);
    result.weights.swap(inputs.weights);

    m_estimate = std::move(result);
    m_fitted = true;
    return m_estimate;
}

bool KaplanMeierFitter::isFitted() const {
    return m_fitted;
}

const KaplanMeierEstimate& KaplanMeierFitter::getEstimate() const {
    if (!m_fitted) {
        throw std::logic_error("KaplanMeierFitter has not been fitted yet; call fit() first.");
    }
    return m_estimate;
}

double KaplanMeierFitter::median() const {
    return getEstimate().median;
}

std::vector<double> KaplanMeierFitter::predict(const std::vector<double>& times) const {
    const KaplanMeierEstimate& est = getEstimate();
    checkNansOrInfs(times, "times");

    const double before = (est.kind == EstimateKind::SurvivalFunction) ? 1.0 : 0.0;
    std::vector<double> values = stepFunctionValues(est.timeline, est.estimate, times, before);

    // A supplied timeline may start after the first event table row; times
    // in between are read off the event table itself.
    const double firstReported = est.timeline.empty() ? std::numeric_limits<double>::infinity()
                                                      : est.timeline.front();
    const double firstRow = est.eventTable.empty() ? firstReported : est.eventTable[0].time;
    if (firstRow < firstReported) {
        std::vector<double> gap;
        std::vector<std::size_t> gapIndex;
        for (std::size_t i = 0; i < times.size(); ++i) {
            if (times[i] >= firstRow && times[i] < firstReported) {
                gap.push_back(times[i]);
                gapIndex.push_back(i);
            }
        }
        if (!gap.empty()) {
            AdditiveEstimateResult rows = additiveEstimate(est.eventTable, gap,
                                                           kaplanMeierLogIncrement,
                                                           greenwoodVarianceIncrement,
                                                           est.kind == EstimateKind::CumulativeDensity);
            for (std::size_t k = 0; k < gapIndex.size(); ++k) {
                values[gapIndex[k]] = std::exp(rows.logEstimate[k]);
            }
        }
    }
    return values;
}

NamedSeries KaplanMeierFitter::survivalFunctionAtTimes(const std::vector<double>& times,
                                                       const std::string& label) const {
    std::vector<double> values = predict(times);
    if (m_estimate.kind == EstimateKind::CumulativeDensity) {
        for (double& v : values) v = 1.0 - v;
    }
    return NamedSeries(label.empty() ? m_estimate.label : label, times, values);
}

NamedSeries KaplanMeierFitter::cumulativeDensityAtTimes(const std::vector<double>& times,
                                                        const std::string& label) const {
    std::vector<double> values = predict(times);
    if (m_estimate.kind == EstimateKind::SurvivalFunction) {
        for (double& v : values) v = 1.0 - v;
    }
    return NamedSeries(label.empty() ? m_estimate.label : label, times, values);
}

void KaplanMeierFitter::plot(EstimatePlotter& plotter) const {
    plotter.plot(getEstimate());
}

void KaplanMeierFitter::plotLogLogs(EstimatePlotter& plotter) const {
    plotter.plotSeries(logLogTransform(getEstimate()));
}

} // namespace SurvivalEstimation
