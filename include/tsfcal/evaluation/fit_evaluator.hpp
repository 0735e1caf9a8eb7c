#pragma once

#include "tsfcal/core/calibration_model.hpp"
#include "tsfcal/core/data_table.hpp"
#include "tsfcal/core/errors.hpp"
#include "tsfcal/core/fit_quality.hpp"
#include "tsfcal/utils/tracing.hpp"
#include "tsfcal/utils/validation.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tsfcal {
namespace evaluation {

/**
 * Goodness-of-fit of a CalibrationModel against a table
 *
 * The table is usually the one the model was fit on, but any table with
 * compatible columns works, so held-out rows can be scored too (R² may then
 * be negative).
 *
 * Metrics:
 * - R² = 1 - SS_res / SS_tot
 * - RMSE = sqrt(SS_res / n)
 * - MAE = mean |y - ŷ|
 */
class FitEvaluator {
public:
	/**
	 * @throws core::ColumnNotFoundError, core::ColumnTypeError on schema mismatch
	 * @throws core::UndefinedFitQualityError if the valid Y values have zero variance
	 */
	static core::FitQuality Evaluate(const core::CalibrationModel &model, const core::DataTable &table,
	                                 const std::string &x_col, const std::string &y_col);

	static core::FitQuality Evaluate(const core::CalibrationModel &model, const Eigen::VectorXd &x,
	                                 const Eigen::VectorXd &y);

	/**
	 * R² from observed and predicted values
	 *
	 * @throws core::UndefinedFitQualityError if y is constant or empty, or the
	 *         sums of squares are not finite
	 */
	static double RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &y_pred);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double FitEvaluator::RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &y_pred) {
	if (y.size() == 0) {
		throw core::UndefinedFitQualityError("R² is undefined for an empty sample");
	}
	if ((y.array() == y(0)).all()) {
		throw core::UndefinedFitQualityError("R² is undefined: all " + std::to_string(y.size()) +
		                                     " observed values equal " + std::to_string(y(0)));
	}

	const double ss_res = (y - y_pred).squaredNorm();
	const double ss_tot = (y.array() - y.mean()).square().sum();
	// Distinct values can still underflow or overflow the variance
	if (!(ss_tot > 0.0) || !std::isfinite(ss_tot)) {
		throw core::UndefinedFitQualityError("R² is undefined: total sum of squares of " + std::to_string(y.size()) +
		                                     " observed values is not a positive finite number");
	}
	const double r_squared = 1.0 - ss_res / ss_tot;
	if (!std::isfinite(r_squared)) {
		throw core::UndefinedFitQualityError("R² is undefined: residual sum of squares is not finite");
	}
	return r_squared;
}

inline core::FitQuality FitEvaluator::Evaluate(const core::CalibrationModel &model, const Eigen::VectorXd &x,
                                               const Eigen::VectorXd &y) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("x and y must have the same length (" + std::to_string(x.size()) + " vs " +
		                            std::to_string(y.size()) + ")");
	}
	const Eigen::VectorXd y_pred = model.Evaluate(x);
	const double r_squared = RSquared(y, y_pred);

	const Eigen::VectorXd residuals = y - y_pred;
	const auto n = static_cast<double>(y.size());
	const double rmse = std::sqrt(residuals.squaredNorm() / n);
	const double mae = residuals.cwiseAbs().sum() / n;

	return core::FitQuality(r_squared, static_cast<size_t>(y.size()), rmse, mae);
}

inline core::FitQuality FitEvaluator::Evaluate(const core::CalibrationModel &model, const core::DataTable &table,
                                               const std::string &x_col, const std::string &y_col) {
	auto pairs = utils::ValidationUtils::ExtractFinitePairs(table, x_col, y_col);
	auto quality = Evaluate(model, pairs.x, pairs.y);

	TSFCAL_DEBUG("Degree " << model.Degree() << " model: R²=" << quality.r_squared << " over "
	                       << quality.sample_count << " rows (" << pairs.n_excluded << " excluded)");
	return quality;
}

} // namespace evaluation
} // namespace tsfcal
