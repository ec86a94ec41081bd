/**
 * @file TruncationDiagnostics.cc
 * @brief Implementation of the left-truncation degeneracy check
 */

#include "TruncationDiagnostics.hh"
#include <sstream>

namespace SurvivalEstimation {

void checkTruncationDegeneracy(const EventTable& table) {
    const std::size_t half = table.size() / 2;
    if (half == 0) return;

    double net = 0.0;
    double minNet = 0.0;
    std::size_t minIndex = 0;
    for (std::size_t i = 0; i < half; ++i) {
        net += table[i].entrance - table[i].removed;
        if (i == 0 || net < minNet) {
            minNet = net;
            minIndex = i;
        }
    }

    if (minNet <= 0.0) {
        std::stringstream os;
        os << "There are too few early truncation times and too many events. "
           << "S(t)==0 for all t>" << table[minIndex].time << ". "
           << "Use a Breslow-Fleming-Harrington estimator instead.";
        throw StatisticalDegeneracyError(os.str(), table[minIndex].time);
    }
}

} // namespace SurvivalEstimation
