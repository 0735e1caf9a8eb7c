#pragma once

#include "tsfcal/core/calibration_model.hpp"
#include "tsfcal/core/calibration_options.hpp"
#include "tsfcal/core/data_table.hpp"
#include "tsfcal/core/errors.hpp"
#include "tsfcal/utils/tracing.hpp"
#include "tsfcal/utils/validation.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tsfcal {
namespace solvers {

/**
 * Bounded-domain least-squares polynomial fitter (degree 1 or 2)
 *
 * Algorithm:
 * 1. Keep rows where X and Y are present and finite
 * 2. Domain = [min(X), max(X)] over the kept rows
 * 3. Map X affinely onto the window [-1, 1]
 * 4. Build the Vandermonde matrix V (n × (degree+1)) in the window coordinate
 * 5. Solve min ||V*c - y|| with Eigen's ColPivHouseholderQR
 *
 * Normalizing to the window keeps V well conditioned; raw TSFC values in
 * g/(kN*s) squared would otherwise dominate the intercept column.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Pure function of its inputs; safe to call concurrently
 * - Rank-deficient V (too few distinct X) is reported, not solved min-norm
 */
class PolynomialFitter {
public:
	/**
	 * Fit y_col against x_col
	 *
	 * @param table Source table (not modified)
	 * @param x_col Independent NUMERIC column
	 * @param y_col Dependent NUMERIC column
	 * @param degree 1 (linear) or 2 (quadratic)
	 * @param options Only qr_tolerance is used
	 * @return Fitted CalibrationModel
	 *
	 * @throws core::ColumnNotFoundError if x_col or y_col is not in the schema
	 * @throws core::ColumnTypeError if either column is not NUMERIC
	 * @throws core::InsufficientDataError if fewer than degree+1 valid rows
	 *         (or distinct X values) exist
	 * @throws core::DegenerateDomainError if all valid X values are identical
	 * @throws std::invalid_argument if degree is not 1 or 2
	 */
	static core::CalibrationModel Fit(const core::DataTable &table, const std::string &x_col, const std::string &y_col,
	                                  int degree,
	                                  const core::CalibrationOptions &options = core::CalibrationOptions::Defaults());

	/**
	 * Fit on raw vectors; every value must be finite
	 *
	 * @param qr_tolerance QR rank threshold (-1 = Eigen default)
	 */
	static core::CalibrationModel FitArrays(const Eigen::VectorXd &x, const Eigen::VectorXd &y, int degree,
	                                        double qr_tolerance = -1.0);

	/// Vandermonde matrix [1, t, t², ...] of the window coordinates
	static Eigen::MatrixXd BuildVandermonde(const Eigen::VectorXd &t, int degree);

	/// @throws std::invalid_argument unless degree is 1 or 2
	static void ValidateDegree(int degree);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void PolynomialFitter::ValidateDegree(int degree) {
	if (degree < core::CalibrationModel::kMinDegree || degree > core::CalibrationModel::kMaxDegree) {
		throw std::invalid_argument("degree must be 1 (linear) or 2 (quadratic) (got " + std::to_string(degree) +
		                            ")");
	}
}

inline Eigen::MatrixXd PolynomialFitter::BuildVandermonde(const Eigen::VectorXd &t, int degree) {
	Eigen::MatrixXd V(t.size(), degree + 1);
	V.col(0).setOnes();
	for (int k = 1; k <= degree; k++) {
		V.col(k) = V.col(k - 1).cwiseProduct(t);
	}
	return V;
}

inline core::CalibrationModel PolynomialFitter::FitArrays(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                                          int degree, double qr_tolerance) {
	ValidateDegree(degree);

	if (x.size() != y.size()) {
		throw std::invalid_argument("x and y must have the same length (" + std::to_string(x.size()) + " vs " +
		                            std::to_string(y.size()) + ")");
	}
	if (!x.allFinite() || !y.allFinite()) {
		throw std::invalid_argument("x and y must contain only finite values");
	}

	const auto n = static_cast<size_t>(x.size());
	const auto n_params = static_cast<size_t>(degree + 1);
	if (n < n_params) {
		throw core::InsufficientDataError("Degree " + std::to_string(degree) + " fit needs at least " +
		                                  std::to_string(n_params) + " valid rows (got " + std::to_string(n) + ")");
	}

	const double domain_min = x.minCoeff();
	const double domain_max = x.maxCoeff();
	if (!(domain_min < domain_max)) {
		throw core::DegenerateDomainError("All " + std::to_string(n) + " valid X values equal " +
		                                  std::to_string(domain_min) + "; domain collapses to a single point");
	}

	// Placeholder model carries the exact affine map the fitted model will use
	const core::CalibrationModel mapping(std::vector<double>(n_params, 0.0), domain_min, domain_max);
	Eigen::VectorXd t(x.size());
	for (Eigen::Index i = 0; i < x.size(); i++) {
		t(i) = mapping.MapToWindow(x(i));
	}

	const Eigen::MatrixXd V = BuildVandermonde(t, degree);
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(V);
	if (qr_tolerance > 0.0) {
		qr.setThreshold(qr_tolerance);
	}

	const auto rank = static_cast<size_t>(qr.rank());
	if (rank < n_params) {
		throw core::InsufficientDataError("Degree " + std::to_string(degree) + " fit needs at least " +
		                                  std::to_string(n_params) + " distinct X values (design matrix rank " +
		                                  std::to_string(rank) + ")");
	}

	const Eigen::VectorXd coef = qr.solve(y);

	std::vector<double> coefficients(n_params);
	for (size_t k = 0; k < n_params; k++) {
		coefficients[k] = coef(static_cast<Eigen::Index>(k));
	}

	TSFCAL_DEBUG("Fitted degree " << degree << " polynomial on " << n << " rows, domain [" << domain_min << ", "
	                              << domain_max << "]");

	return core::CalibrationModel(std::move(coefficients), domain_min, domain_max);
}

inline core::CalibrationModel PolynomialFitter::Fit(const core::DataTable &table, const std::string &x_col,
                                                    const std::string &y_col, int degree,
                                                    const core::CalibrationOptions &options) {
	ValidateDegree(degree);

	// Schema check happens before any row is looked at
	auto pairs = utils::ValidationUtils::ExtractFinitePairs(table, x_col, y_col);
	if (pairs.n_excluded > 0) {
		TSFCAL_DEBUG("Excluded " << pairs.n_excluded << " of " << table.RowCount() << " rows with missing or "
		                         << "non-finite '" << x_col << "'/'" << y_col << "'");
	}

	return FitArrays(pairs.x, pairs.y, degree, options.qr_tolerance);
}

} // namespace solvers
} // namespace tsfcal
