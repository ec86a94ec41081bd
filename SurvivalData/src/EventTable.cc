/**
 * @file EventTable.cc
 * @brief Implementation of event table construction
 */

#include "EventTable.hh"
#include "InputValidation.hh"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>

namespace SurvivalEstimation {

EventTable survivalTableFromEvents(const std::vector<double>& durations,
                                   const std::vector<int>& eventObserved,
                                   const std::vector<double>& entry,
                                   const std::vector<double>& weights) {
    const std::size_t n = durations.size();
    if (n == 0) return EventTable();

    // Everyone is "born" at min(0, earliest duration) unless entry is given
    double defaultBirth = std::min(0.0, *std::min_element(durations.begin(), durations.end()));

    std::map<double, EventTableRow> rows;
    for (std::size_t i = 0; i < n; ++i) {
        double w = weights.empty() ? 1.0 : weights[i];
        double birth = entry.empty() ? defaultBirth : entry[i];

        if (birth > durations[i]) {
            std::stringstream os;
            os << "Entry times must be less than or equal to durations (subject " << i
               << ": entry " << birth << " > duration " << durations[i] << ").";
            throw ValidationError(os.str());
        }

        EventTableRow& death = rows[durations[i]];
        death.time = durations[i];
        death.removed += w;
        death.observed += w * eventObserved[i];

        EventTableRow& born = rows[birth];
        born.time = birth;
        born.entrance += w;
    }

    std::vector<EventTableRow> table;
    table.reserve(rows.size());
    double cumEntrance = 0.0;
    double cumRemovedBefore = 0.0;
    for (auto& kv : rows) {
        EventTableRow row = kv.second;
        row.censored = row.removed - row.observed;
        cumEntrance += row.entrance;
        row.atRisk = cumEntrance - cumRemovedBefore;
        cumRemovedBefore += row.removed;
        table.push_back(row);
    }

    return EventTable(table);
}

PreprocessedInputs preprocessInputs(const LifetimeData& data) {
    const std::size_t n = data.durations.size();
    if (n == 0) {
        throw ValidationError("durations must contain at least one subject.");
    }

    checkNansOrInfs(data.durations, "durations");
    checkLengthMatches(data.eventObserved, n, "event_observed");
    checkNansOrInfs(data.eventObserved, "event_observed");
    checkLengthMatches(data.entry, n, "entry");
    checkNansOrInfs(data.entry, "entry");
    checkLengthMatches(data.weights, n, "weights");
    checkNansOrInfs(data.weights, "weights");
    checkPositive(data.weights, "weights");
    checkNansOrInfs(data.timeline, "timeline");

    PreprocessedInputs inputs;
    inputs.durations = data.durations;
    inputs.entry = data.entry;
    inputs.weights = data.weights;

    inputs.eventObserved.assign(n, 1);
    if (!data.eventObserved.empty()) {
        for (std::size_t i = 0; i < n; ++i) {
            inputs.eventObserved[i] = (static_cast<int>(data.eventObserved[i]) != 0) ? 1 : 0;
        }
    }

    inputs.eventTable = survivalTableFromEvents(inputs.durations, inputs.eventObserved,
                                                inputs.entry, inputs.weights);

    if (data.timeline.empty()) {
        inputs.timeline = inputs.eventTable.times();
    } else {
        inputs.timeline = data.timeline;
        std::sort(inputs.timeline.begin(), inputs.timeline.end());
        inputs.timeline.erase(std::unique(inputs.timeline.begin(), inputs.timeline.end()),
                              inputs.timeline.end());
    }

    return inputs;
}

} // namespace SurvivalEstimation
