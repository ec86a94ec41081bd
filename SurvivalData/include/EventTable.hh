#ifndef SURVIVAL_EVENT_TABLE_HH
#define SURVIVAL_EVENT_TABLE_HH

/**
 * @file EventTable.hh
 * @brief Construction of the per-time-point event table
 *
 * Aggregates raw (duration, event, entry, weight) records into one row per
 * distinct time:
 * - removed:  weighted subjects leaving at this time
 * - observed: weighted deaths at this time
 * - censored: removed - observed
 * - entrance: weighted subjects entering observation at this time
 * - at_risk:  cumulative entrances up to and including this time minus
 *             cumulative removals strictly before it
 */

#include "DataTypes.hh"
#include <vector>

namespace SurvivalEstimation {

/**
 * @struct PreprocessedInputs
 * @brief Validated inputs together with their event table and timeline
 */
struct PreprocessedInputs {
    std::vector<double> durations;
    std::vector<int> eventObserved;   ///< 0/1 per subject
    std::vector<double> entry;        ///< Empty when no left truncation
    std::vector<double> weights;      ///< Empty when unweighted
    std::vector<double> timeline;     ///< Strictly increasing
    EventTable eventTable;
};

/**
 * @brief Build the event table from per-subject records
 *
 * When entry is empty every subject enters at min(0, min(durations)).
 *
 * @param durations Duration per subject
 * @param eventObserved 0/1 event flag per subject
 * @param entry Entry time per subject, or empty
 * @param weights Weight per subject, or empty for unit weights
 * @return Event table with strictly increasing times
 * @throws ValidationError if an entry time exceeds its duration
 */
EventTable survivalTableFromEvents(const std::vector<double>& durations,
                                   const std::vector<int>& eventObserved,
                                   const std::vector<double>& entry = std::vector<double>(),
                                   const std::vector<double>& weights = std::vector<double>());

/**
 * @brief Validate raw inputs and build the event table and timeline
 *
 * Checks performed:
 * - durations non-empty and finite
 * - event flags, entry times, weights and timeline finite
 * - optional columns empty or as long as durations
 * - weights strictly positive
 *
 * Event flags are truncated to integers; any nonzero value means observed.
 * A supplied timeline is sorted and de-duplicated, otherwise the event
 * table times are used.
 *
 * @param data Raw inputs
 * @return Preprocessed inputs
 * @throws ValidationError on any failed check
 */
PreprocessedInputs preprocessInputs(const LifetimeData& data);

} // namespace SurvivalEstimation

#endif // SURVIVAL_EVENT_TABLE_HH
