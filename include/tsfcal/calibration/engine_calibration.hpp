#pragma once

#include "tsfcal/core/calibration_model.hpp"
#include "tsfcal/core/calibration_options.hpp"
#include "tsfcal/core/data_table.hpp"
#include "tsfcal/core/fit_quality.hpp"
#include "tsfcal/selection/model_selector.hpp"
#include <string>
#include <utility>
#include <vector>

namespace tsfcal {
namespace calibration {

/**
 * Outcome of calibrating the takeoff-to-cruise TSFC relationship
 */
struct CalibrationReport {
	/// Rows used for fitting (both TSFC values present and finite, duplicates averaged)
	core::DataTable calibration_table;

	core::CalibrationModel linear_model;
	core::FitQuality linear_quality;

	core::CalibrationModel quadratic_model;
	core::FitQuality quadratic_quality;

	/// Index 0 = linear, 1 = quadratic
	selection::SelectionDecision decision;

	CalibrationReport(core::DataTable calibration_table_, core::CalibrationModel linear_model_,
	                  core::FitQuality linear_quality_, core::CalibrationModel quadratic_model_,
	                  core::FitQuality quadratic_quality_, selection::SelectionDecision decision_)
	    : calibration_table(std::move(calibration_table_)), linear_model(std::move(linear_model_)),
	      linear_quality(linear_quality_), quadratic_model(std::move(quadratic_model_)),
	      quadratic_quality(quadratic_quality_), decision(decision_) {
	}

	const core::CalibrationModel &SelectedModel() const {
		return decision.SelectedFirst() ? linear_model : quadratic_model;
	}
	const core::FitQuality &SelectedQuality() const {
		return decision.SelectedFirst() ? linear_quality : quadratic_quality;
	}
};

/// One dependent column fit against a shared X column
struct ColumnFit {
	std::string column;
	core::CalibrationModel model;
	core::FitQuality quality;
};

/**
 * Engine-level calibration and scaling workflow
 *
 * Calibrate: engines with both takeoff and cruise TSFC known
 *   → drop rows missing either value → average repeated engines
 *   → fit linear and quadratic models → evaluate both → parsimony selection
 *
 * Scale: engine database without cruise data
 *   → average repeated engines → apply the chosen model to takeoff TSFC
 */
class EngineCalibration {
public:
	/**
	 * @throws core::ColumnNotFoundError if a configured column is missing
	 * @throws core::InsufficientDataError if fewer than 3 usable engines remain
	 * @throws core::DegenerateDomainError, core::UndefinedFitQualityError
	 * @throws std::invalid_argument if options do not validate
	 */
	static CalibrationReport Calibrate(const core::DataTable &engines,
	                                   const core::CalibrationOptions &options = core::CalibrationOptions::Defaults());

	/**
	 * Predict cruise TSFC for every engine in `database`
	 *
	 * @return Database (aggregated if configured) plus predicted and extrapolated columns
	 */
	static core::DataTable Scale(const core::DataTable &database, const core::CalibrationModel &model,
	                             const core::CalibrationOptions &options = core::CalibrationOptions::Defaults());

	/**
	 * Collapse rows sharing a key into one row per key
	 *
	 * Keys keep their first-appearance order. NUMERIC columns become the
	 * mean of their finite values (absent if there are none); TEXT and
	 * BOOLEAN columns keep the first valid value. Rows with a NULL key are
	 * dropped.
	 *
	 * @throws core::ColumnNotFoundError, core::ColumnTypeError (key must be TEXT)
	 */
	static core::DataTable AggregateByKey(const core::DataTable &table, const std::string &key_column);

	/// Rows where every listed NUMERIC column is present and finite
	static core::DataTable DropIncompleteRows(const core::DataTable &table, const std::vector<std::string> &columns);

	/**
	 * Fit each of `y_cols` against `x_col` with the same degree
	 *
	 * Each fit uses the rows where its own (x, y) pair is valid.
	 */
	static std::vector<ColumnFit> FitColumns(const core::DataTable &table, const std::string &x_col,
	                                         const std::vector<std::string> &y_cols, int degree,
	                                         const core::CalibrationOptions &options =
	                                             core::CalibrationOptions::Defaults());
};

} // namespace calibration
} // namespace tsfcal
