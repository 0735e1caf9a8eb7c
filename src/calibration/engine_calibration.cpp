#include "tsfcal/calibration/engine_calibration.hpp"
#include "tsfcal/core/errors.hpp"
#include "tsfcal/evaluation/fit_evaluator.hpp"
#include "tsfcal/scaling/scaling_applier.hpp"
#include "tsfcal/solvers/polynomial_fitter.hpp"
#include "tsfcal/utils/tracing.hpp"
#include "tsfcal/utils/validation.hpp"
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace tsfcal {
namespace calibration {

CalibrationReport EngineCalibration::Calibrate(const core::DataTable &engines,
                                               const core::CalibrationOptions &options) {
	options.Validate();
	TSFCAL_TIMING_START();

	const std::vector<std::string> tsfc_columns {options.takeoff_column, options.cruise_column};
	utils::ValidationUtils::ValidateRequiredColumns(engines, tsfc_columns);

	const auto &cruise = engines.GetColumn(options.cruise_column);
	TSFCAL_DEBUG(utils::ValidationUtils::CountNullValues(cruise) << " of " << engines.RowCount()
	                                                             << " input rows have no '" << options.cruise_column
	                                                             << "'");

	core::DataTable complete = DropIncompleteRows(engines, tsfc_columns);
	if (options.aggregate_duplicates) {
		complete = AggregateByKey(complete, options.key_column);
	}
	TSFCAL_INFO("Calibrating on " << complete.RowCount() << " engines (" << engines.RowCount() << " input rows)");

	auto linear = solvers::PolynomialFitter::Fit(complete, options.takeoff_column, options.cruise_column, 1, options);
	auto quadratic =
	    solvers::PolynomialFitter::Fit(complete, options.takeoff_column, options.cruise_column, 2, options);

	auto linear_quality =
	    evaluation::FitEvaluator::Evaluate(linear, complete, options.takeoff_column, options.cruise_column);
	auto quadratic_quality =
	    evaluation::FitEvaluator::Evaluate(quadratic, complete, options.takeoff_column, options.cruise_column);

	auto decision = selection::ModelSelector::Compare(linear, linear_quality, quadratic, quadratic_quality,
	                                                  options.selection_threshold);

	TSFCAL_TIMING_END("Takeoff-to-cruise TSFC calibration");
	return CalibrationReport(std::move(complete), std::move(linear), linear_quality, std::move(quadratic),
	                         quadratic_quality, decision);
}

core::DataTable EngineCalibration::Scale(const core::DataTable &database, const core::CalibrationModel &model,
                                         const core::CalibrationOptions &options) {
	options.Validate();
	TSFCAL_TIMING_START();

	utils::ValidationUtils::FindNumericColumn(database, options.takeoff_column);
	core::DataTable source = options.aggregate_duplicates ? AggregateByKey(database, options.key_column) : database;

	auto scaled = scaling::ScalingApplier::Apply(model, source, options.takeoff_column,
	                                             scaling::ScalingOptions::FromCalibrationOptions(options));

	const size_t n_flagged = scaling::ScalingApplier::CountFlagged(scaled, options.extrapolated_column);
	if (n_flagged > 0) {
		TSFCAL_INFO(n_flagged << " of " << scaled.RowCount() << " engines have takeoff TSFC outside the calibration "
		                      << "domain [" << model.DomainMin() << ", " << model.DomainMax() << "]");
	}

	TSFCAL_TIMING_END("Engine database scaling");
	return scaled;
}

core::DataTable EngineCalibration::AggregateByKey(const core::DataTable &table, const std::string &key_column) {
	const auto &keys = table.GetColumn(utils::ValidationUtils::FindColumnByName(table, key_column));
	if (keys.Type() != core::ColumnType::TEXT) {
		throw core::ColumnTypeError("Key column '" + key_column + "' must be TEXT, got " +
		                            core::ColumnTypeName(keys.Type()));
	}

	// Group rows by key, groups ordered by first appearance
	std::unordered_map<std::string, size_t> group_of_key;
	std::vector<std::vector<size_t>> groups;
	size_t n_null_keys = 0;
	for (size_t row = 0; row < table.RowCount(); row++) {
		if (!keys.IsValid(row)) {
			n_null_keys++;
			continue;
		}
		auto inserted = group_of_key.emplace(keys.GetText(row), groups.size());
		if (inserted.second) {
			groups.emplace_back();
		}
		groups[inserted.first->second].push_back(row);
	}
	if (n_null_keys > 0) {
		TSFCAL_WARN("Dropped " << n_null_keys << " rows with NULL '" << key_column << "'");
	}

	core::DataTable result(table.Schema());
	const size_t n_cols = table.ColumnCount();
	for (const auto &rows : groups) {
		std::vector<core::Value> values;
		values.reserve(n_cols);
		for (size_t c = 0; c < n_cols; c++) {
			const auto &column = table.GetColumn(c);
			if (column.Type() == core::ColumnType::NUMERIC) {
				double sum = 0.0;
				size_t count = 0;
				for (size_t row : rows) {
					if (utils::ValidationUtils::IsFiniteCell(column, row)) {
						sum += column.GetNumeric(row);
						count++;
					}
				}
				values.push_back(count > 0 ? core::Value::Numeric(sum / static_cast<double>(count))
				                           : core::Value::Null());
			} else {
				core::Value first;
				for (size_t row : rows) {
					if (column.IsValid(row)) {
						first = column.GetValue(row);
						break;
					}
				}
				values.push_back(first);
			}
		}
		result.AppendRow(values);
	}

	if (result.RowCount() < table.RowCount()) {
		TSFCAL_DEBUG("Aggregated " << table.RowCount() << " rows into " << result.RowCount() << " unique '"
		                           << key_column << "' values");
	}
	return result;
}

core::DataTable EngineCalibration::DropIncompleteRows(const core::DataTable &table,
                                                      const std::vector<std::string> &columns) {
	std::vector<const core::Column *> checked;
	checked.reserve(columns.size());
	for (const auto &name : columns) {
		checked.push_back(&table.GetColumn(utils::ValidationUtils::FindNumericColumn(table, name)));
	}

	std::vector<size_t> keep;
	keep.reserve(table.RowCount());
	for (size_t row = 0; row < table.RowCount(); row++) {
		bool complete = true;
		for (const auto *column : checked) {
			if (!utils::ValidationUtils::IsFiniteCell(*column, row)) {
				complete = false;
				break;
			}
		}
		if (complete) {
			keep.push_back(row);
		}
	}
	return table.SelectRows(keep);
}

std::vector<ColumnFit> EngineCalibration::FitColumns(const core::DataTable &table, const std::string &x_col,
                                                     const std::vector<std::string> &y_cols, int degree,
                                                     const core::CalibrationOptions &options) {
	if (y_cols.empty()) {
		throw std::invalid_argument("FitColumns needs at least one dependent column");
	}
	utils::ValidationUtils::FindNumericColumn(table, x_col);
	for (const auto &y_col : y_cols) {
		utils::ValidationUtils::FindNumericColumn(table, y_col);
	}

	std::vector<ColumnFit> fits;
	fits.reserve(y_cols.size());
	for (const auto &y_col : y_cols) {
		auto model = solvers::PolynomialFitter::Fit(table, x_col, y_col, degree, options);
		auto quality = evaluation::FitEvaluator::Evaluate(model, table, x_col, y_col);
		fits.push_back(ColumnFit {y_col, std::move(model), quality});
	}
	return fits;
}

} // namespace calibration
} // namespace tsfcal
