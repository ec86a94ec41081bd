#ifndef SURVIVAL_INPUT_VALIDATION_HH
#define SURVIVAL_INPUT_VALIDATION_HH

/**
 * @file InputValidation.hh
 * @brief Checks applied to raw lifetime inputs before estimation
 */

#include <stdexcept>
#include <string>
#include <vector>

namespace SurvivalEstimation {

/**
 * @class ValidationError
 * @brief Raised when raw inputs cannot be used for estimation
 *
 * Covers NaN or infinite values, mismatched column lengths, non-positive
 * weights, entry times after durations, and malformed confidence labels.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Reject NaN and infinite values
 * @param values Values to check
 * @param what Name of the column, used in the error message
 * @throws ValidationError on the first non-finite value
 */
void checkNansOrInfs(const std::vector<double>& values, const std::string& what);

/**
 * @brief Require an optional column to be empty or as long as the durations
 * @param values Optional column
 * @param expected Number of subjects
 * @param what Name of the column, used in the error message
 */
void checkLengthMatches(const std::vector<double>& values, std::size_t expected,
                        const std::string& what);

/**
 * @brief Require strictly positive values
 * @param values Values to check
 * @param what Name of the column, used in the error message
 */
void checkPositive(const std::vector<double>& values, const std::string& what);

/**
 * @brief True when any value has a fractional part
 */
bool hasNonIntegralValues(const std::vector<double>& values);

} // namespace SurvivalEstimation

#endif // SURVIVAL_INPUT_VALIDATION_HH
