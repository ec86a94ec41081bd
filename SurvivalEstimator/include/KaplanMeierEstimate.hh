#ifndef SURVIVAL_KAPLAN_MEIER_ESTIMATE_HH
#define SURVIVAL_KAPLAN_MEIER_ESTIMATE_HH

/**
 * @file KaplanMeierEstimate.hh
 * @brief Fitted Kaplan-Meier estimate and its confidence band
 */

#include "DataTypes.hh"
#include <iostream>
#include <string>
#include <vector>

namespace SurvivalEstimation {

/**
 * @brief Which curve a fit estimates
 *
 * SurvivalFunction:  S(t), non-increasing, right censoring
 * CumulativeDensity: F(t), non-decreasing, left censoring
 */
enum class EstimateKind {
    SurvivalFunction,
    CumulativeDensity
};

/**
 * @brief Name of the estimate, "survival_function" or "cumulative_density"
 */
std::string estimateName(EstimateKind kind);

/**
 * @struct KaplanMeierEstimate
 * @brief Everything produced by one fit
 */
struct KaplanMeierEstimate {
    EstimateKind kind;                       ///< Survival or cumulative density
    std::string label;                       ///< Name of the estimate column
    double alpha;                            ///< Significance level of the band

    std::vector<double> timeline;            ///< Reporting times (ascending)
    std::vector<double> estimate;            ///< Point estimate on the timeline
    std::vector<double> cumulativeVariance;  ///< Greenwood variance of log estimate

    std::string upperLabel;                  ///< Name of the upper bound column
    std::string lowerLabel;                  ///< Name of the lower bound column
    std::vector<double> upper;               ///< Upper confidence bound
    std::vector<double> lower;               ///< Lower confidence bound

    double median;                           ///< Median survival time (+/-inf if never crossed)

    EventTable eventTable;                   ///< Table the estimate was built from
    std::vector<double> durations;           ///< Preprocessed inputs
    std::vector<int> eventObserved;
    std::vector<double> entry;
    std::vector<double> weights;

    std::vector<std::string> warnings;       ///< Statistical caveats raised during the fit

    KaplanMeierEstimate();

    NamedSeries estimateSeries() const;
    NamedSeries upperSeries() const;
    NamedSeries lowerSeries() const;
    NamedSeries varianceSeries() const;

    /**
     * @brief Print the estimate with its confidence band
     * @param os Output stream
     */
    void print(std::ostream& os = std::cout) const;
};

} // namespace SurvivalEstimation

#endif // SURVIVAL_KAPLAN_MEIER_ESTIMATE_HH
