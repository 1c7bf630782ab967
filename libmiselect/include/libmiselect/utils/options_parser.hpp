#pragma once

#include "libmiselect/core/fit_options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace libmiselect {
namespace utils {

/**
 * Parse fit options from a JSON object
 *
 * Every key is optional; missing keys keep their FitOptions default. The
 * parsed options are validated before they are returned.
 *
 * Example: {"nlambda": 50, "tolerance": 1e-7, "n_threads": 4}
 *
 * @param config JSON object (null yields the defaults)
 * @return FitOptions with parsed values or defaults
 * @throws InvalidParameterError on unknown keys, wrongly typed values or
 *         values outside their domain
 */
core::FitOptions ParseFitOptions(const nlohmann::json &config);

/**
 * Read and parse fit options from a JSON file
 *
 * @throws InvalidParameterError if the file cannot be read or is not valid JSON
 */
core::FitOptions LoadFitOptions(const std::string &path);

/// Serialize options to JSON (all keys, suitable for ParseFitOptions)
nlohmann::json FitOptionsToJson(const core::FitOptions &options);

} // namespace utils
} // namespace libmiselect
