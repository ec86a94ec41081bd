#ifndef SURVIVAL_KAPLAN_MEIER_FITTER_HH
#define SURVIVAL_KAPLAN_MEIER_FITTER_HH

/**
 * @file KaplanMeierFitter.hh
 * @brief Kaplan-Meier estimator of the survival function
 *
 * Fits the product-limit estimate
 *   S(t) = prod_{t_i <= t} (1 - d_i / n_i)
 * in log space, with Greenwood's variance and an exponential ("log-log")
 * confidence band. Supports right censoring, left censoring (estimating the
 * cumulative density F(t) instead), left truncation through entry times,
 * and case weights.
 */

#include "DataTypes.hh"
#include "KaplanMeierEstimate.hh"
#include "EstimatePlotter.hh"
#include <string>
#include <vector>

namespace SurvivalEstimation {

/**
 * @brief Configuration of a Kaplan-Meier fit
 */
struct FitConfig {
    double alpha;                        ///< Significance level of the band
    bool leftCensorship;                 ///< Durations are left-censored: estimate F(t)
    std::string label;                   ///< Name of the estimate column
    std::vector<std::string> ciLabels;   ///< Empty, or {upper, lower} band names

    FitConfig()
        : alpha(0.05)
        , leftCensorship(false)
        , label("KM_estimate")
    {}
};

/**
 * @class KaplanMeierFitter
 * @brief Fits one Kaplan-Meier estimate at a time
 *
 * Each call to fit() replaces the previous estimate. The new estimate is
 * stored only when the whole fit succeeds; a fit that throws leaves the
 * previous estimate (or the unfitted state) unchanged.
 */
class KaplanMeierFitter {
public:
    /**
     * @brief Constructor with configuration
     * @param config Fit configuration
     */
    explicit KaplanMeierFitter(const FitConfig& config = FitConfig());

    void setConfig(const FitConfig& config);
    const FitConfig& getConfig() const;

    /**
     * @brief Fit with the stored configuration
     * @param data Durations, events, entry times, weights, timeline
     * @return The fitted estimate
     * @throws ValidationError on invalid inputs or band labels
     * @throws StatisticalDegeneracyError if left truncation empties the
     *         risk set in the first half of the timeline
     */
    const KaplanMeierEstimate& fit(const LifetimeData& data);

    /**
     * @brief Fit with a configuration for this call only
     */
    const KaplanMeierEstimate& fit(const LifetimeData& data, const FitConfig& config);

    bool isFitted() const;

    /**
     * @brief Last fitted estimate
     * @throws std::logic_error before the first successful fit
     */
    const KaplanMeierEstimate& getEstimate() const;

    double median() const;

    /**
     * @brief Step-function values of the fitted estimate at arbitrary times
     *
     * Values are those of the fitted kind (S for a survival fit, F for a
     * cumulative density fit).
     */
    std::vector<double> predict(const std::vector<double>& times) const;

    /**
     * @brief S(t) at arbitrary times
     * @param times Query times
     * @param label Series name, defaults to the fit label
     */
    NamedSeries survivalFunctionAtTimes(const std::vector<double>& times,
                                        const std::string& label = std::string()) const;

    /**
     * @brief F(t) = 1 - S(t) at arbitrary times
     */
    NamedSeries cumulativeDensityAtTimes(const std::vector<double>& times,
                                         const std::string& label = std::string()) const;

    /**
     * @brief Hand the fitted estimate to a renderer
     */
    void plot(EstimatePlotter& plotter) const;

    /**
     * @brief Hand log(-log S(t)) against log(t) to a renderer
     */
    void plotLogLogs(EstimatePlotter& plotter) const;

private:
    FitConfig m_config;
    KaplanMeierEstimate m_estimate;
    bool m_fitted;
};

} // namespace SurvivalEstimation

#endif // SURVIVAL_KAPLAN_MEIER_FITTER_HH
