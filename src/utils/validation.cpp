#include "tsfcal/utils/validation.hpp"
#include <cmath>
#include <stdexcept>

namespace tsfcal {
namespace utils {

size_t ValidationUtils::FindColumnByName(const core::DataTable &table, const std::string &col_name) {
	return table.ColumnIndex(col_name);
}

size_t ValidationUtils::FindNumericColumn(const core::DataTable &table, const std::string &col_name) {
	size_t index = FindColumnByName(table, col_name);
	const auto &column = table.GetColumn(index);
	if (column.Type() != core::ColumnType::NUMERIC) {
		throw core::ColumnTypeError("Invalid type for column '" + col_name + "': " +
		                            core::ColumnTypeName(column.Type()) + " (required NUMERIC)");
	}
	return index;
}

void ValidationUtils::ValidateRequiredColumns(const core::DataTable &table,
                                              const std::vector<std::string> &required_cols) {
	if (required_cols.empty()) {
		throw std::invalid_argument("Empty column list provided for required columns check");
	}
	for (const auto &col_name : required_cols) {
		FindColumnByName(table, col_name);
	}
}

bool ValidationUtils::IsFiniteCell(const core::Column &column, size_t row) {
	return column.IsValid(row) && std::isfinite(column.GetNumeric(row));
}

size_t ValidationUtils::CountNullValues(const core::Column &column) {
	size_t count = 0;
	for (size_t row = 0; row < column.Size(); row++) {
		if (!column.IsValid(row)) {
			count++;
		}
	}
	return count;
}

FinitePairs ValidationUtils::ExtractFinitePairs(const core::DataTable &table, const std::string &x_col,
                                                const std::string &y_col) {
	const auto &x_column = table.GetColumn(FindNumericColumn(table, x_col));
	const auto &y_column = table.GetColumn(FindNumericColumn(table, y_col));

	const size_t n = table.RowCount();
	FinitePairs pairs;
	pairs.rows.reserve(n);
	for (size_t row = 0; row < n; row++) {
		if (IsFiniteCell(x_column, row) && IsFiniteCell(y_column, row)) {
			pairs.rows.push_back(row);
		}
	}
	pairs.n_excluded = n - pairs.rows.size();

	const auto n_valid = static_cast<Eigen::Index>(pairs.rows.size());
	pairs.x.resize(n_valid);
	pairs.y.resize(n_valid);
	for (Eigen::Index i = 0; i < n_valid; i++) {
		size_t row = pairs.rows[static_cast<size_t>(i)];
		pairs.x(i) = x_column.GetNumeric(row);
		pairs.y(i) = y_column.GetNumeric(row);
	}
	return pairs;
}

} // namespace utils
} // namespace tsfcal
