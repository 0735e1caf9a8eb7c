#pragma once

#include "tsfcal/core/calibration_model.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace tsfcal {
namespace io {

/**
 * JSON record of a CalibrationModel:
 *
 *   {"degree": 2, "coefficients": [c0, c1, c2],
 *    "domain_min": 7.72, "domain_max": 18.37,
 *    "window_min": -1.0, "window_max": 1.0}
 *
 * Doubles are written with round-trip precision, so a reloaded model
 * evaluates bit-for-bit like the original.
 */
nlohmann::json ModelToJson(const core::CalibrationModel &model);

/// @throws core::ModelFormatError on missing keys, wrong types or invalid values
core::CalibrationModel ModelFromJson(const nlohmann::json &record);

/// @param indent -1 for compact output
std::string SerializeModel(const core::CalibrationModel &model, int indent = -1);

/// @throws core::ModelFormatError if the text is not a valid model record
core::CalibrationModel DeserializeModel(const std::string &text);

/// @throws core::ModelFormatError if the file cannot be written
void SaveModel(const core::CalibrationModel &model, const std::string &path);

/// @throws core::ModelFormatError if the file cannot be read or parsed
core::CalibrationModel LoadModel(const std::string &path);

} // namespace io
} // namespace tsfcal
