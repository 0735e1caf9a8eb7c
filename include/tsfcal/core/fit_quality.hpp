#pragma once

#include <cstddef>
#include <limits>

namespace tsfcal {
namespace core {

/**
 * Goodness of fit of a CalibrationModel against one table
 *
 * Kept apart from CalibrationModel so two models fit on the same data can be
 * compared without mixing fit parameters and fit quality.
 */
struct FitQuality {
	/// Coefficient of determination: 1 - SS_res/SS_tot (<= 1, may be negative on held-out data)
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Number of rows that passed the finiteness filter
	size_t sample_count = 0;

	/// Root mean squared error: sqrt(SS_res / n)
	double rmse = std::numeric_limits<double>::quiet_NaN();

	/// Mean absolute error
	double mae = std::numeric_limits<double>::quiet_NaN();

	FitQuality() = default;
	FitQuality(double r_squared_, size_t sample_count_, double rmse_, double mae_)
	    : r_squared(r_squared_), sample_count(sample_count_), rmse(rmse_), mae(mae_) {
	}
};

} // namespace core
} // namespace tsfcal
