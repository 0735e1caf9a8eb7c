#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace tsfcal {
namespace core {

/**
 * How ScalingApplier treats rows whose X lies outside the fit domain
 */
enum class ExtrapolationPolicy : uint8_t {
	FLAG, // Score the row and mark it extrapolated
	OMIT  // Leave the prediction absent, still mark it extrapolated
};

std::string ExtrapolationPolicyName(ExtrapolationPolicy policy);

/**
 * Configuration for the engine calibration workflow
 *
 * Column names default to the labels used by engine certification sheets;
 * the core itself is schema-agnostic and only needs two numeric columns.
 *
 * Design notes:
 * - All defaults specified in-class
 * - Validate() checks values before any table is touched
 * - ParseFromJson() accepts a subset of keys, case-insensitively
 */
struct CalibrationOptions {
	// ========================================================================
	// Schema
	// ========================================================================

	/// Engine identification column (TEXT)
	std::string key_column = "Engine Identification";

	/// Independent variable: TSFC at takeoff, g/(kN*s)
	std::string takeoff_column = "TSFC (takeoff)";

	/// Dependent variable: TSFC at cruise, g/(kN*s), nullable
	std::string cruise_column = "TSFC (cruise)";

	/// Output column written by the scaling step
	std::string predicted_column = "TSFC (cruise, predicted)";

	/// Output flag column written by the scaling step
	std::string extrapolated_column = "extrapolated";

	// ========================================================================
	// Model selection
	// ========================================================================

	/// Minimum R² gain the quadratic model needs over the linear one
	/// Default: 0.01
	double selection_threshold = 0.01;

	// ========================================================================
	// Data handling
	// ========================================================================

	/// Average repeated engine identifications before fitting/scaling
	bool aggregate_duplicates = true;

	ExtrapolationPolicy extrapolation_policy = ExtrapolationPolicy::FLAG;

	/// QR rank tolerance (-1 = auto, use Eigen default)
	double qr_tolerance = -1.0;

	CalibrationOptions() = default;

	static CalibrationOptions Defaults() {
		return CalibrationOptions();
	}

	/// Options that refuse to extrapolate during scaling
	static CalibrationOptions InterpolationOnly() {
		CalibrationOptions opts;
		opts.extrapolation_policy = ExtrapolationPolicy::OMIT;
		return opts;
	}

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const;

	/**
	 * Parse options from a JSON object; keys not present keep their defaults
	 *
	 * @throws std::invalid_argument on unknown keys or wrongly typed values
	 */
	static CalibrationOptions ParseFromJson(const nlohmann::json &config);

	/**
	 * Read a JSON configuration file
	 *
	 * @throws std::invalid_argument if the file cannot be read or parsed
	 */
	static CalibrationOptions LoadFromFile(const std::string &path);
};

} // namespace core
} // namespace tsfcal
