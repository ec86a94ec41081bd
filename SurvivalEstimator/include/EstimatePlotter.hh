#ifndef SURVIVAL_ESTIMATE_PLOTTER_HH
#define SURVIVAL_ESTIMATE_PLOTTER_HH

/**
 * @file EstimatePlotter.hh
 * @brief Hook through which a fitted estimate is handed to a renderer
 *
 * Graphical back ends implement EstimatePlotter; TablePlotter renders the
 * estimate as a text table.
 */

#include "KaplanMeierEstimate.hh"
#include <iostream>

namespace SurvivalEstimation {

/**
 * @class EstimatePlotter
 * @brief Renderer interface for fitted estimates
 */
class EstimatePlotter {
public:
    virtual ~EstimatePlotter() {}

    /**
     * @brief Render a point estimate with its confidence band
     */
    virtual void plot(const KaplanMeierEstimate& estimate) = 0;

    /**
     * @brief Render a single derived series (e.g. a log-log transform)
     */
    virtual void plotSeries(const NamedSeries& series) = 0;
};

/**
 * @class TablePlotter
 * @brief Fixed width text rendering to an output stream
 */
class TablePlotter : public EstimatePlotter {
public:
    explicit TablePlotter(std::ostream& os = std::cout, int precision = 4);

    virtual void plot(const KaplanMeierEstimate& estimate);
    virtual void plotSeries(const NamedSeries& series);

private:
    std::ostream& m_os;
    int m_precision;
};

/**
 * @brief log(-log S(t)) against log(t)
 *
 * Uses S = 1 - F for a cumulative density fit. Only points with t > 0 and
 * 0 < S(t) < 1 are kept.
 *
 * @param estimate Fitted estimate
 * @return Series named "log(-log(<label>))" indexed by log(t)
 */
NamedSeries logLogTransform(const KaplanMeierEstimate& estimate);

} // namespace SurvivalEstimation

#endif // SURVIVAL_ESTIMATE_PLOTTER_HH
