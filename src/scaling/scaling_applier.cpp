#include "tsfcal/scaling/scaling_applier.hpp"
#include "tsfcal/core/errors.hpp"
#include "tsfcal/utils/tracing.hpp"
#include "tsfcal/utils/validation.hpp"
#include <stdexcept>
#include <utility>

namespace tsfcal {
namespace scaling {

ScalingOptions ScalingOptions::FromCalibrationOptions(const core::CalibrationOptions &options) {
	ScalingOptions result;
	result.predicted_column = options.predicted_column;
	result.extrapolated_column = options.extrapolated_column;
	result.extrapolation_policy = options.extrapolation_policy;
	return result;
}

core::DataTable ScalingApplier::Apply(const core::CalibrationModel &model, const core::DataTable &table,
                                      const std::string &x_col, const ScalingOptions &options) {
	const auto &x_column = table.GetColumn(utils::ValidationUtils::FindNumericColumn(table, x_col));

	if (options.predicted_column == options.extrapolated_column) {
		throw std::invalid_argument("predicted and extrapolated column names must differ (both '" +
		                            options.predicted_column + "')");
	}
	if (table.HasColumn(options.predicted_column)) {
		throw core::DuplicateColumnError(options.predicted_column);
	}
	if (table.HasColumn(options.extrapolated_column)) {
		throw core::DuplicateColumnError(options.extrapolated_column);
	}

	const size_t n = table.RowCount();
	core::Column predicted(options.predicted_column, core::ColumnType::NUMERIC);
	core::Column extrapolated(options.extrapolated_column, core::ColumnType::BOOLEAN);
	predicted.Reserve(n);
	extrapolated.Reserve(n);

	size_t n_unscored = 0;
	size_t n_extrapolated = 0;
	for (size_t row = 0; row < n; row++) {
		if (!utils::ValidationUtils::IsFiniteCell(x_column, row)) {
			predicted.AppendNull();
			extrapolated.AppendNull();
			n_unscored++;
			continue;
		}

		const double x = x_column.GetNumeric(row);
		const bool outside = !model.InDomain(x);
		if (outside) {
			n_extrapolated++;
		}

		if (outside && options.extrapolation_policy == core::ExtrapolationPolicy::OMIT) {
			predicted.AppendNull();
		} else {
			predicted.AppendNumeric(model.Evaluate(x));
		}
		extrapolated.AppendBoolean(outside);
	}

	TSFCAL_DEBUG("Scored " << (n - n_unscored) << " of " << n << " rows on '" << x_col << "', " << n_extrapolated
	                       << " outside domain [" << model.DomainMin() << ", " << model.DomainMax() << "] ("
	                       << core::ExtrapolationPolicyName(options.extrapolation_policy) << ")");

	return table.WithColumn(std::move(predicted)).WithColumn(std::move(extrapolated));
}

size_t ScalingApplier::CountFlagged(const core::DataTable &table, const std::string &flag_column) {
	const auto &column = table.GetColumn(flag_column);
	if (column.Type() != core::ColumnType::BOOLEAN) {
		throw core::ColumnTypeError("Flag column '" + flag_column + "' must be BOOLEAN, got " +
		                            core::ColumnTypeName(column.Type()));
	}
	size_t count = 0;
	for (size_t row = 0; row < column.Size(); row++) {
		if (column.IsValid(row) && column.GetBoolean(row)) {
			count++;
		}
	}
	return count;
}

} // namespace scaling
} // namespace tsfcal
