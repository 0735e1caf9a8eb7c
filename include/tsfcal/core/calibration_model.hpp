#pragma once

#include "tsfcal/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tsfcal {
namespace core {

/**
 * Fitted takeoff-to-cruise polynomial with its domain/window mapping
 *
 * Immutable value object. Coefficients are stored lowest degree first and
 * apply to the normalized coordinate
 *
 *     t = offset + scale * x,   scale = (w1 - w0) / (d1 - d0),
 *                               offset = (d1 * w0 - d0 * w1) / (d1 - d0)
 *
 * which maps the fit domain [d0, d1] onto the window [w0, w1]. The same
 * mapping is reused for every later evaluation, inside or outside the domain.
 *
 * Design notes:
 * - No mutable state; copies are cheap and safe to share across threads
 * - Degree is implied by the coefficient count and restricted to 1 or 2
 * - Window is [-1, 1] for every model produced by PolynomialFitter
 */
class CalibrationModel {
public:
	static constexpr double kWindowMin = -1.0;
	static constexpr double kWindowMax = 1.0;
	static constexpr int kMinDegree = 1;
	static constexpr int kMaxDegree = 2;

	/**
	 * @param coefficients Polynomial coefficients in window coordinate, lowest degree first
	 * @param domain_min Lower bound of the X range the model was fit on
	 * @param domain_max Upper bound of the X range the model was fit on
	 * @param window_min Lower bound of the normalization window
	 * @param window_max Upper bound of the normalization window
	 *
	 * @throws std::invalid_argument if degree is not 1 or 2, values are not finite
	 *         or the window is empty
	 * @throws DegenerateDomainError if domain_min >= domain_max
	 */
	CalibrationModel(std::vector<double> coefficients, double domain_min, double domain_max,
	                 double window_min = kWindowMin, double window_max = kWindowMax);

	int Degree() const {
		return static_cast<int>(coefficients_.size()) - 1;
	}
	const std::vector<double> &Coefficients() const {
		return coefficients_;
	}
	double DomainMin() const {
		return domain_min_;
	}
	double DomainMax() const {
		return domain_max_;
	}
	double WindowMin() const {
		return window_min_;
	}
	double WindowMax() const {
		return window_max_;
	}

	/// Affine map of a raw X value into the window coordinate
	double MapToWindow(double x) const {
		return offset_ + scale_ * x;
	}

	/// Predicted Y at raw X (Horner evaluation in window coordinate)
	double Evaluate(double x) const;

	/// Vectorized Evaluate
	Eigen::VectorXd Evaluate(const Eigen::VectorXd &x) const;

	/// True if x lies inside the closed fit domain
	bool InDomain(double x) const {
		return x >= domain_min_ && x <= domain_max_;
	}

	/**
	 * Coefficients of the same polynomial in raw X, lowest degree first
	 *
	 * Expands p(offset + scale * x) binomially. Useful for reporting a
	 * conventional formula; evaluation should keep using Evaluate().
	 */
	std::vector<double> PowerBasisCoefficients() const;

	bool operator==(const CalibrationModel &other) const {
		return coefficients_ == other.coefficients_ && domain_min_ == other.domain_min_ &&
		       domain_max_ == other.domain_max_ && window_min_ == other.window_min_ &&
		       window_max_ == other.window_max_;
	}
	bool operator!=(const CalibrationModel &other) const {
		return !(*this == other);
	}

private:
	std::vector<double> coefficients_;
	double domain_min_;
	double domain_max_;
	double window_min_;
	double window_max_;
	double offset_;
	double scale_;
};

// ============================================================================
// Implementation
// ============================================================================

inline CalibrationModel::CalibrationModel(std::vector<double> coefficients, double domain_min, double domain_max,
                                          double window_min, double window_max)
    : coefficients_(std::move(coefficients)), domain_min_(domain_min), domain_max_(domain_max),
      window_min_(window_min), window_max_(window_max), offset_(0.0), scale_(1.0) {
	const int degree = Degree();
	if (degree < kMinDegree || degree > kMaxDegree) {
		throw std::invalid_argument("Calibration model degree must be 1 or 2 (got " +
		                            std::to_string(coefficients_.size()) + " coefficients)");
	}
	for (double c : coefficients_) {
		if (!std::isfinite(c)) {
			throw std::invalid_argument("Calibration model coefficients must be finite");
		}
	}
	if (!std::isfinite(domain_min_) || !std::isfinite(domain_max_) || !std::isfinite(window_min_) ||
	    !std::isfinite(window_max_)) {
		throw std::invalid_argument("Calibration model domain and window bounds must be finite");
	}
	if (!(domain_min_ < domain_max_)) {
		throw DegenerateDomainError("Domain [" + std::to_string(domain_min_) + ", " + std::to_string(domain_max_) +
		                            "] collapses to a single point");
	}
	if (!(window_min_ < window_max_)) {
		throw std::invalid_argument("Window [" + std::to_string(window_min_) + ", " + std::to_string(window_max_) +
		                            "] is empty");
	}

	const double span = domain_max_ - domain_min_;
	offset_ = (domain_max_ * window_min_ - domain_min_ * window_max_) / span;
	scale_ = (window_max_ - window_min_) / span;
}

inline double CalibrationModel::Evaluate(double x) const {
	const double t = MapToWindow(x);
	double y = 0.0;
	for (auto it = coefficients_.rbegin(); it != coefficients_.rend(); ++it) {
		y = y * t + *it;
	}
	return y;
}

inline Eigen::VectorXd CalibrationModel::Evaluate(const Eigen::VectorXd &x) const {
	Eigen::VectorXd y(x.size());
	for (Eigen::Index i = 0; i < x.size(); i++) {
		y(i) = Evaluate(x(i));
	}
	return y;
}

inline std::vector<double> CalibrationModel::PowerBasisCoefficients() const {
	const size_t n = coefficients_.size();
	std::vector<double> result(n, 0.0);

	// (offset + scale*x)^k expanded term by term; powers built incrementally
	std::vector<double> power(1, 1.0);
	for (size_t k = 0; k < n; k++) {
		for (size_t j = 0; j < power.size(); j++) {
			result[j] += coefficients_[k] * power[j];
		}
		std::vector<double> next(power.size() + 1, 0.0);
		for (size_t j = 0; j < power.size(); j++) {
			next[j] += offset_ * power[j];
			next[j + 1] += scale_ * power[j];
		}
		power.swap(next);
	}
	return result;
}

} // namespace core
} // namespace tsfcal
