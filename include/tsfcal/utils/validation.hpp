#pragma once

#include "tsfcal/core/data_table.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace tsfcal {
namespace utils {

/**
 * @brief (x, y) observations that passed the finiteness filter
 *
 * `rows` holds the source row index of each observation, in table order.
 */
struct FinitePairs {
	Eigen::VectorXd x;
	Eigen::VectorXd y;
	std::vector<size_t> rows;
	size_t n_excluded = 0;

	size_t size() const {
		return rows.size();
	}
};

/**
 * @brief Schema and value validation for table-facing operations
 *
 * Every public operation resolves its columns through here first so schema
 * mistakes fail fast with ColumnNotFoundError/ColumnTypeError instead of
 * surfacing later as a numeric failure.
 */
class ValidationUtils {
public:
	/**
	 * @brief Resolve a column by name
	 *
	 * @throws core::ColumnNotFoundError if not found
	 */
	static size_t FindColumnByName(const core::DataTable &table, const std::string &col_name);

	/**
	 * @brief Resolve a NUMERIC column by name
	 *
	 * @throws core::ColumnNotFoundError if not found
	 * @throws core::ColumnTypeError if the column is not NUMERIC
	 */
	static size_t FindNumericColumn(const core::DataTable &table, const std::string &col_name);

	/**
	 * @brief Validate that all named columns exist
	 *
	 * @throws std::invalid_argument if the list is empty
	 * @throws core::ColumnNotFoundError for the first missing column
	 */
	static void ValidateRequiredColumns(const core::DataTable &table, const std::vector<std::string> &required_cols);

	/// True if the cell is valid (non-NULL) and holds a finite number
	static bool IsFiniteCell(const core::Column &column, size_t row);

	static size_t CountNullValues(const core::Column &column);

	/**
	 * @brief Collect rows where both X and Y are present and finite
	 *
	 * Rows failing the filter are skipped, never coerced to zero.
	 *
	 * @throws core::ColumnNotFoundError, core::ColumnTypeError
	 */
	static FinitePairs ExtractFinitePairs(const core::DataTable &table, const std::string &x_col,
	                                      const std::string &y_col);
};

} // namespace utils
} // namespace tsfcal
