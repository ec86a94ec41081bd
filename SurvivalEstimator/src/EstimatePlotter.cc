/**
 * @file EstimatePlotter.cc
 * @brief Implementation of the text renderer and log-log transform
 */

#include "EstimatePlotter.hh"
#include <cmath>
#include <iomanip>

namespace SurvivalEstimation {

TablePlotter::TablePlotter(std::ostream& os, int precision)
    : m_os(os)
    , m_precision(precision)
{
}

void TablePlotter::plot(const KaplanMeierEstimate& estimate) {
    const int w = m_precision + 10;
    const std::ios_base::fmtflags flags = m_os.flags();
    const std::streamsize precision = m_os.precision();
    m_os << std::fixed << std::setprecision(m_precision);
    m_os << "# " << estimateName(estimate.kind) << "\n";
    m_os << std::setw(w) << "timeline"
         << std::setw(w) << estimate.label
         << std::setw(w) << estimate.lowerLabel
         << std::setw(w) << estimate.upperLabel << "\n";
    for (std::size_t i = 0; i < estimate.timeline.size(); ++i) {
        m_os << std::setw(w) << estimate.timeline[i]
             << std::setw(w) << estimate.estimate[i]
             << std::setw(w) << estimate.lower[i]
             << std::setw(w) << estimate.upper[i] << "\n";
    }
    m_os.flags(flags);
    m_os.precision(precision);
}

void TablePlotter::plotSeries(const NamedSeries& series) {
    const int w = m_precision + 10;
    const std::ios_base::fmtflags flags = m_os.flags();
    const std::streamsize precision = m_os.precision();
    m_os << std::fixed << std::setprecision(m_precision);
    m_os << "# " << series.name << "\n";
    for (std::size_t i = 0; i < series.size(); ++i) {
        m_os << std::setw(w) << series.index[i]
             << std::setw(w) << series.values[i] << "\n";
    }
    m_os.flags(flags);
    m_os.precision(precision);
}

NamedSeries logLogTransform(const KaplanMeierEstimate& estimate) {
    NamedSeries series;
    series.name = "log(-log(" + estimate.label + "))";

    for (std::size_t i = 0; i < estimate.timeline.size(); ++i) {
        const double t = estimate.timeline[i];
        const double s = (estimate.kind == EstimateKind::SurvivalFunction)
                             ? estimate.estimate[i]
                             : 1.0 - estimate.estimate[i];
        if (t > 0.0 && s > 0.0 && s < 1.0) {
            series.index.push_back(std::log(t));
            series.values.push_back(std::log(-std::log(s)));
        }
    }
    return series;
}

} // namespace SurvivalEstimation
