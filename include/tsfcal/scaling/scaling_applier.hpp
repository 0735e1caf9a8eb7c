#pragma once

#include "tsfcal/core/calibration_model.hpp"
#include "tsfcal/core/calibration_options.hpp"
#include "tsfcal/core/data_table.hpp"
#include <string>

namespace tsfcal {
namespace scaling {

struct ScalingOptions {
	std::string predicted_column = "predicted";
	std::string extrapolated_column = "extrapolated";
	core::ExtrapolationPolicy extrapolation_policy = core::ExtrapolationPolicy::FLAG;

	/// Output column names and policy taken from the workflow configuration
	static ScalingOptions FromCalibrationOptions(const core::CalibrationOptions &options);
};

/**
 * Applies a CalibrationModel to every row of a target table
 *
 * Output is a new table: the input columns unchanged plus
 * - predicted_column (NUMERIC): model value at the row's X
 * - extrapolated_column (BOOLEAN): true if X lies outside the model domain
 *
 * Rows with missing or non-finite X are passed through with both output
 * cells absent. Under ExtrapolationPolicy::OMIT, rows outside the domain keep
 * the flag but get no prediction. The input table is never modified.
 */
class ScalingApplier {
public:
	/**
	 * @throws core::ColumnNotFoundError if x_col is not in the schema
	 * @throws core::ColumnTypeError if x_col is not NUMERIC
	 * @throws core::DuplicateColumnError if an output column name is taken
	 */
	static core::DataTable Apply(const core::CalibrationModel &model, const core::DataTable &table,
	                             const std::string &x_col, const ScalingOptions &options = ScalingOptions());

	/// Number of true cells in a BOOLEAN flag column
	static size_t CountFlagged(const core::DataTable &table, const std::string &flag_column);
};

} // namespace scaling
} // namespace tsfcal
