#include "tsfcal/core/calibration_options.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tsfcal {
namespace core {

std::string ExtrapolationPolicyName(ExtrapolationPolicy policy) {
	switch (policy) {
	case ExtrapolationPolicy::FLAG:
		return "flag";
	case ExtrapolationPolicy::OMIT:
		return "omit";
	default:
		return "unknown";
	}
}

static std::string ToLower(std::string value) {
	for (auto &c : value) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return value;
}

static void RequireNonEmpty(const std::string &value, const std::string &name) {
	if (value.empty()) {
		throw std::invalid_argument(name + " must not be empty");
	}
}

void CalibrationOptions::Validate() const {
	RequireNonEmpty(key_column, "key_column");
	RequireNonEmpty(takeoff_column, "takeoff_column");
	RequireNonEmpty(cruise_column, "cruise_column");
	RequireNonEmpty(predicted_column, "predicted_column");
	RequireNonEmpty(extrapolated_column, "extrapolated_column");

	if (takeoff_column == cruise_column) {
		throw std::invalid_argument("takeoff_column and cruise_column must differ (both '" + takeoff_column + "')");
	}
	if (predicted_column == extrapolated_column) {
		throw std::invalid_argument("predicted_column and extrapolated_column must differ (both '" +
		                            predicted_column + "')");
	}

	if (!std::isfinite(selection_threshold) || selection_threshold < 0.0) {
		throw std::invalid_argument("selection_threshold must be finite and non-negative (got " +
		                            std::to_string(selection_threshold) + ")");
	}

	if (qr_tolerance != -1.0 && !(qr_tolerance > 0.0 && std::isfinite(qr_tolerance))) {
		throw std::invalid_argument("qr_tolerance must be positive or -1 for auto (got " +
		                            std::to_string(qr_tolerance) + ")");
	}
}

static std::string GetString(const nlohmann::json &value, const std::string &key) {
	if (!value.is_string()) {
		throw std::invalid_argument("Option '" + key + "' must be a string");
	}
	return value.get<std::string>();
}

static double GetDouble(const nlohmann::json &value, const std::string &key) {
	if (!value.is_number()) {
		throw std::invalid_argument("Option '" + key + "' must be a number");
	}
	return value.get<double>();
}

static bool GetBool(const nlohmann::json &value, const std::string &key) {
	// Accept 0/1 as well as true/false
	if (value.is_boolean()) {
		return value.get<bool>();
	}
	if (value.is_number_integer()) {
		auto v = value.get<int64_t>();
		if (v == 0 || v == 1) {
			return v == 1;
		}
	}
	throw std::invalid_argument("Option '" + key + "' must be a boolean");
}

CalibrationOptions CalibrationOptions::ParseFromJson(const nlohmann::json &config) {
	if (!config.is_object()) {
		throw std::invalid_argument("Calibration options must be a JSON object");
	}

	CalibrationOptions opts;
	for (auto it = config.begin(); it != config.end(); ++it) {
		const std::string key = ToLower(it.key());
		const nlohmann::json &value = it.value();

		if (key == "key_column") {
			opts.key_column = GetString(value, key);
		} else if (key == "takeoff_column") {
			opts.takeoff_column = GetString(value, key);
		} else if (key == "cruise_column") {
			opts.cruise_column = GetString(value, key);
		} else if (key == "predicted_column") {
			opts.predicted_column = GetString(value, key);
		} else if (key == "extrapolated_column") {
			opts.extrapolated_column = GetString(value, key);
		} else if (key == "selection_threshold") {
			opts.selection_threshold = GetDouble(value, key);
		} else if (key == "aggregate_duplicates") {
			opts.aggregate_duplicates = GetBool(value, key);
		} else if (key == "qr_tolerance") {
			opts.qr_tolerance = GetDouble(value, key);
		} else if (key == "extrapolation_policy") {
			const std::string policy = ToLower(GetString(value, key));
			if (policy == "flag") {
				opts.extrapolation_policy = ExtrapolationPolicy::FLAG;
			} else if (policy == "omit") {
				opts.extrapolation_policy = ExtrapolationPolicy::OMIT;
			} else {
				throw std::invalid_argument("extrapolation_policy must be 'flag' or 'omit' (got '" + policy + "')");
			}
		} else {
			throw std::invalid_argument("Unknown calibration option '" + it.key() + "'");
		}
	}

	opts.Validate();
	return opts;
}

CalibrationOptions CalibrationOptions::LoadFromFile(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::invalid_argument("Failed to open calibration options file: " + path);
	}

	nlohmann::json config;
	try {
		file >> config;
	} catch (const nlohmann::json::parse_error &e) {
		throw std::invalid_argument("Failed to parse calibration options file '" + path + "': " + e.what());
	}
	return ParseFromJson(config);
}

} // namespace core
} // namespace tsfcal
