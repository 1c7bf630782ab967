#include "libmiselect/utils/options_parser.hpp"
#include "libmiselect/core/errors.hpp"
#include "libmiselect/utils/tracing.hpp"

#include <cstdint>
#include <fstream>
#include <string>

namespace libmiselect {
namespace utils {

namespace {

const char *const kValidKeys = "nlambda, lambda_min_ratio, max_iterations, tolerance, max_irls_iterations, "
                               "irls_tolerance, probability_clip, newton_max_iterations, newton_tolerance, "
                               "n_threads, strict_convergence";

// Non-negative integer option
size_t ExtractCount(const std::string &key, const nlohmann::json &value) {
	if (value.is_number_unsigned()) {
		return value.get<size_t>();
	}
	if (value.is_number_integer()) {
		auto v = value.get<int64_t>();
		if (v < 0) {
			throw core::InvalidParameterError("option '" + key + "' must be a non-negative integer, got " +
			                                  std::to_string(v));
		}
		return static_cast<size_t>(v);
	}
	throw core::InvalidParameterError("option '" + key + "' must be an integer");
}

double ExtractDouble(const std::string &key, const nlohmann::json &value) {
	if (!value.is_number()) {
		throw core::InvalidParameterError("option '" + key + "' must be a number");
	}
	return value.get<double>();
}

bool ExtractBool(const std::string &key, const nlohmann::json &value) {
	if (value.is_boolean()) {
		return value.get<bool>();
	}
	if (value.is_number_integer()) {
		return value.get<int64_t>() != 0;
	}
	throw core::InvalidParameterError("option '" + key + "' must be a boolean");
}

} // namespace

core::FitOptions ParseFitOptions(const nlohmann::json &config) {
	core::FitOptions opts;

	if (config.is_null()) {
		return opts;
	}
	if (!config.is_object()) {
		throw core::InvalidParameterError("fit options must be a JSON object");
	}

	for (auto it = config.begin(); it != config.end(); ++it) {
		const std::string &key = it.key();
		const nlohmann::json &value = it.value();

		if (key == "nlambda") {
			opts.nlambda = ExtractCount(key, value);
		} else if (key == "lambda_min_ratio") {
			opts.lambda_min_ratio = ExtractDouble(key, value);
		} else if (key == "max_iterations") {
			opts.max_iterations = ExtractCount(key, value);
		} else if (key == "tolerance") {
			opts.tolerance = ExtractDouble(key, value);
		} else if (key == "max_irls_iterations") {
			opts.max_irls_iterations = ExtractCount(key, value);
		} else if (key == "irls_tolerance") {
			opts.irls_tolerance = ExtractDouble(key, value);
		} else if (key == "probability_clip") {
			opts.probability_clip = ExtractDouble(key, value);
		} else if (key == "newton_max_iterations") {
			opts.newton_max_iterations = ExtractCount(key, value);
		} else if (key == "newton_tolerance") {
			opts.newton_tolerance = ExtractDouble(key, value);
		} else if (key == "n_threads") {
			opts.n_threads = ExtractCount(key, value);
		} else if (key == "strict_convergence") {
			opts.strict_convergence = ExtractBool(key, value);
		} else {
			throw core::InvalidParameterError("unknown option '" + key + "'. Valid options are: " + kValidKeys);
		}
	}

	opts.Validate();
	return opts;
}

core::FitOptions LoadFitOptions(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw core::InvalidParameterError("cannot open options file '" + path + "'");
	}

	nlohmann::json config;
	try {
		in >> config;
	} catch (const nlohmann::json::parse_error &e) {
		throw core::InvalidParameterError("options file '" + path + "' is not valid JSON: " + e.what());
	}

	MISELECT_DEBUG("loaded fit options from " << path);
	return ParseFitOptions(config);
}

nlohmann::json FitOptionsToJson(const core::FitOptions &options) {
	nlohmann::json out;
	out["nlambda"] = options.nlambda;
	out["lambda_min_ratio"] = options.lambda_min_ratio;
	out["max_iterations"] = options.max_iterations;
	out["tolerance"] = options.tolerance;
	out["max_irls_iterations"] = options.max_irls_iterations;
	out["irls_tolerance"] = options.irls_tolerance;
	out["probability_clip"] = options.probability_clip;
	out["newton_max_iterations"] = options.newton_max_iterations;
	out["newton_tolerance"] = options.newton_tolerance;
	out["n_threads"] = options.n_threads;
	out["strict_convergence"] = options.strict_convergence;
	return out;
}

} // namespace utils
} // namespace libmiselect
