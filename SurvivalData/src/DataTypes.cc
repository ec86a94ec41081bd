/**
 * @file DataTypes.cc
 * @brief Implementation of data type methods
 */

#include "DataTypes.hh"

namespace SurvivalEstimation {

std::vector<double> EventTable::times() const {
    std::vector<double> out;
    out.reserve(m_rows.size());
    for (const auto& row : m_rows) out.push_back(row.time);
    return out;
}

std::vector<double> EventTable::removed() const {
    std::vector<double> out;
    out.reserve(m_rows.size());
    for (const auto& row : m_rows) out.push_back(row.removed);
    return out;
}

std::vector<double> EventTable::observed() const {
    std::vector<double> out;
    out.reserve(m_rows.size());
    for (const auto& row : m_rows) out.push_back(row.observed);
    return out;
}

std::vector<double> EventTable::censored() const {
    std::vector<double> out;
    out.reserve(m_rows.size());
    for (const auto& row : m_rows) out.push_back(row.censored);
    return out;
}

std::vector<double> EventTable::entrance() const {
    std::vector<double> out;
    out.reserve(m_rows.size());
    for (const auto& row : m_rows) out.push_back(row.entrance);
    return out;
}

std::vector<double> EventTable::atRisk() const {
    std::vector<double> out;
    out.reserve(m_rows.size());
    for (const auto& row : m_rows) out.push_back(row.atRisk);
    return out;
}

void EventTable::print(std::ostream& os) const {
    os << "=== Event Table ===\n";
    os << std::setw(12) << "event_at"
       << std::setw(12) << "removed"
       << std::setw(12) << "observed"
       << std::setw(12) << "censored"
       << std::setw(12) << "entrance"
       << std::setw(12) << "at_risk" << "\n";
    os << "  " << std::string(70, '-') << "\n";
    for (const auto& row : m_rows) {
        os << std::setw(12) << row.time
           << std::setw(12) << row.removed
           << std::setw(12) << row.observed
           << std::setw(12) << row.censored
           << std::setw(12) << row.entrance
           << std::setw(12) << row.atRisk << "\n";
    }
    os << "===================\n";
}

} // namespace SurvivalEstimation
