#ifndef SURVIVAL_TRUNCATION_DIAGNOSTICS_HH
#define SURVIVAL_TRUNCATION_DIAGNOSTICS_HH

/**
 * @file TruncationDiagnostics.hh
 * @brief Degeneracy check for left-truncated Kaplan-Meier fits
 *
 * With few early entry times and many early events, the net population
 * (cumulative entrances - cumulative removals) can reach zero. Every
 * later factor of the product-limit estimate then multiplies by zero, so
 * S(t) == 0 from that time on as an artifact of the estimator.
 */

#include "DataTypes.hh"
#include <stdexcept>
#include <string>

namespace SurvivalEstimation {

/**
 * @class StatisticalDegeneracyError
 * @brief Raised when the ordinary estimator is unreliable for the data
 */
class StatisticalDegeneracyError : public std::runtime_error {
public:
    StatisticalDegeneracyError(const std::string& what, double time)
        : std::runtime_error(what), m_time(time) {}

    /// Time from which the estimate would be forced to zero
    double time() const { return m_time; }

private:
    double m_time;
};

/**
 * @brief Check the first half of the event table for a vanishing population
 *
 * The running net population is inspected over the first floor(n/2) rows.
 *
 * @param table Event table of a left-truncated fit
 * @throws StatisticalDegeneracyError if its minimum reaches zero
 */
void checkTruncationDegeneracy(const EventTable& table);

} // namespace SurvivalEstimation

#endif // SURVIVAL_TRUNCATION_DIAGNOSTICS_HH
