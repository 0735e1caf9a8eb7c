#include "tsfcal/io/model_serialization.hpp"
#include "tsfcal/core/errors.hpp"
#include "tsfcal/utils/tracing.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tsfcal {
namespace io {

static const char *const kDegreeKey = "degree";
static const char *const kCoefficientsKey = "coefficients";
static const char *const kDomainMinKey = "domain_min";
static const char *const kDomainMaxKey = "domain_max";
static const char *const kWindowMinKey = "window_min";
static const char *const kWindowMaxKey = "window_max";

nlohmann::json ModelToJson(const core::CalibrationModel &model) {
	nlohmann::json record;
	record[kDegreeKey] = model.Degree();
	record[kCoefficientsKey] = model.Coefficients();
	record[kDomainMinKey] = model.DomainMin();
	record[kDomainMaxKey] = model.DomainMax();
	record[kWindowMinKey] = model.WindowMin();
	record[kWindowMaxKey] = model.WindowMax();
	return record;
}

static const nlohmann::json &RequireKey(const nlohmann::json &record, const char *key) {
	auto it = record.find(key);
	if (it == record.end()) {
		throw core::ModelFormatError(std::string("Model record is missing '") + key + "'");
	}
	return *it;
}

static double RequireNumber(const nlohmann::json &record, const char *key) {
	const auto &value = RequireKey(record, key);
	if (!value.is_number()) {
		throw core::ModelFormatError(std::string("Model record field '") + key + "' must be a number");
	}
	return value.get<double>();
}

core::CalibrationModel ModelFromJson(const nlohmann::json &record) {
	if (!record.is_object()) {
		throw core::ModelFormatError("Model record must be a JSON object");
	}

	const auto &degree_value = RequireKey(record, kDegreeKey);
	if (!degree_value.is_number_integer()) {
		throw core::ModelFormatError("Model record field 'degree' must be an integer");
	}
	const auto degree = degree_value.get<int64_t>();
	if (degree < 1 || degree > 2) {
		throw core::ModelFormatError("Model record has unsupported degree " + std::to_string(degree) +
		                             " (expected 1 or 2)");
	}

	const auto &coef_value = RequireKey(record, kCoefficientsKey);
	if (!coef_value.is_array()) {
		throw core::ModelFormatError("Model record field 'coefficients' must be an array");
	}
	std::vector<double> coefficients;
	coefficients.reserve(coef_value.size());
	for (const auto &c : coef_value) {
		if (!c.is_number()) {
			throw core::ModelFormatError("Model record coefficients must be numbers");
		}
		coefficients.push_back(c.get<double>());
	}
	if (static_cast<int64_t>(coefficients.size()) != degree + 1) {
		throw core::ModelFormatError("Model record has degree " + std::to_string(degree) + " but " +
		                             std::to_string(coefficients.size()) + " coefficients");
	}

	const double domain_min = RequireNumber(record, kDomainMinKey);
	const double domain_max = RequireNumber(record, kDomainMaxKey);
	const double window_min = RequireNumber(record, kWindowMinKey);
	const double window_max = RequireNumber(record, kWindowMaxKey);

	try {
		return core::CalibrationModel(std::move(coefficients), domain_min, domain_max, window_min, window_max);
	} catch (const core::DegenerateDomainError &e) {
		throw core::ModelFormatError(std::string("Invalid model record: ") + e.what());
	} catch (const std::invalid_argument &e) {
		throw core::ModelFormatError(std::string("Invalid model record: ") + e.what());
	}
}

std::string SerializeModel(const core::CalibrationModel &model, int indent) {
	return ModelToJson(model).dump(indent);
}

core::CalibrationModel DeserializeModel(const std::string &text) {
	nlohmann::json record;
	try {
		record = nlohmann::json::parse(text);
	} catch (const nlohmann::json::parse_error &e) {
		throw core::ModelFormatError(std::string("Failed to parse model record: ") + e.what());
	}
	return ModelFromJson(record);
}

void SaveModel(const core::CalibrationModel &model, const std::string &path) {
	std::ofstream file(path);
	if (!file.is_open()) {
		throw core::ModelFormatError("Failed to open model file for writing: " + path);
	}
	file << SerializeModel(model, 2) << '\n';
	if (!file) {
		throw core::ModelFormatError("Failed to write model file: " + path);
	}
	TSFCAL_DEBUG("Saved degree " << model.Degree() << " model to " << path);
}

core::CalibrationModel LoadModel(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw core::ModelFormatError("Failed to open model file: " + path);
	}

	nlohmann::json record;
	try {
		file >> record;
	} catch (const nlohmann::json::parse_error &e) {
		throw core::ModelFormatError("Failed to parse model file '" + path + "': " + e.what());
	}
	return ModelFromJson(record);
}

} // namespace io
} // namespace tsfcal
