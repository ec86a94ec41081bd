#ifndef SURVIVAL_DATA_TYPES_HH
#define SURVIVAL_DATA_TYPES_HH

/**
 * @file DataTypes.hh
 * @brief Data structures for time-to-event estimation
 *
 * Defines the core data types shared by the estimator modules:
 * - LifetimeData: Raw durations, event flags, entry times and weights
 * - EventTableRow / EventTable: Per-time-point counts of the population
 * - NamedSeries: Labelled series of values over time
 */

#include <vector>
#include <string>
#include <iostream>
#include <iomanip>

namespace SurvivalEstimation {

/**
 * @brief Raw inputs of one fit
 *
 * Optional columns are left empty when not supplied:
 * - eventObserved empty: every event observed (no censoring)
 * - entry empty: every subject enters at the start (no left truncation)
 * - weights empty: unit weight per subject
 * - timeline empty: report at the event table times
 */
struct LifetimeData {
    std::vector<double> durations;      ///< Observed duration per subject
    std::vector<double> eventObserved;  ///< 1 if the event was observed, 0 if censored
    std::vector<double> entry;          ///< Entry (truncation) time per subject
    std::vector<double> weights;        ///< Positive weight per subject
    std::vector<double> timeline;       ///< Times at which to report the estimate

    LifetimeData() {}
    LifetimeData(const std::vector<double>& t, const std::vector<double>& e = std::vector<double>())
        : durations(t), eventObserved(e) {}

    bool hasEntry() const { return !entry.empty(); }
    bool hasWeights() const { return !weights.empty(); }
    std::size_t size() const { return durations.size(); }
};

/**
 * @brief One row of the event table
 *
 * Counts are weighted, so they may be fractional.
 */
struct EventTableRow {
    double time;      ///< Distinct event, censoring or entry time
    double removed;   ///< Subjects leaving at this time (observed + censored)
    double observed;  ///< Deaths observed at this time
    double censored;  ///< Censorings at this time
    double entrance;  ///< Subjects entering observation at this time
    double atRisk;    ///< Population just before this time

    EventTableRow()
        : time(0.0), removed(0.0), observed(0.0)
        , censored(0.0), entrance(0.0), atRisk(0.0) {}
};

/**
 * @brief Event table ordered by strictly increasing time
 */
class EventTable {
public:
    EventTable() {}
    explicit EventTable(const std::vector<EventTableRow>& rows) : m_rows(rows) {}

    std::size_t size() const { return m_rows.size(); }
    bool empty() const { return m_rows.empty(); }
    const EventTableRow& operator[](std::size_t i) const { return m_rows[i]; }

    std::vector<double> times() const;
    std::vector<double> removed() const;
    std::vector<double> observed() const;
    std::vector<double> censored() const;
    std::vector<double> entrance() const;
    std::vector<double> atRisk() const;

    /**
     * @brief Print the table
     * @param os Output stream
     */
    void print(std::ostream& os = std::cout) const;

private:
    std::vector<EventTableRow> m_rows;
};

/**
 * @brief Labelled series of values indexed by time
 */
struct NamedSeries {
    std::string name;
    std::vector<double> index;
    std::vector<double> values;

    NamedSeries() {}
    NamedSeries(const std::string& n, const std::vector<double>& idx, const std::vector<double>& v)
        : name(n), index(idx), values(v) {}

    std::size_t size() const { return values.size(); }
};

} // namespace SurvivalEstimation

#endif // SURVIVAL_DATA_TYPES_HH
