/**
 * @file InputValidation.cc
 * @brief Implementation of raw input checks
 */

#include "InputValidation.hh"
#include <cmath>
#include <sstream>

namespace SurvivalEstimation {

void checkNansOrInfs(const std::vector<double>& values, const std::string& what) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) {
            std::stringstream os;
            os << "NaNs were detected in " << what << " (index " << i
               << "). Check the inputs and remove or impute them.";
            throw ValidationError(os.str());
        }
        if (std::isinf(values[i])) {
            std::stringstream os;
            os << "Infs were detected in " << what << " (index " << i
               << "). Check the inputs and remove or replace them.";
            throw ValidationError(os.str());
        }
    }
}

void checkLengthMatches(const std::vector<double>& values, std::size_t expected,
                        const std::string& what) {
    if (!values.empty() && values.size() != expected) {
        std::stringstream os;
        os << what << " has " << values.size() << " elements but "
           << expected << " durations were given.";
        throw ValidationError(os.str());
    }
}

void checkPositive(const std::vector<double>& values, const std::string& what) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!(values[i] > 0.0)) {
            std::stringstream os;
            os << what << " must be greater than 0 (got " << values[i]
               << " at index " << i << ").";
            throw ValidationError(os.str());
        }
    }
}

bool hasNonIntegralValues(const std::vector<double>& values) {
    for (double v : values) {
        if (std::trunc(v) != v) return true;
    }
    return false;
}

} // namespace SurvivalEstimation
