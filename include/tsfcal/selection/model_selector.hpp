#pragma once

#include "tsfcal/core/calibration_model.hpp"
#include "tsfcal/core/fit_quality.hpp"
#include "tsfcal/utils/tracing.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace tsfcal {
namespace selection {

/// Default minimum R² gain required to accept the higher-degree model
constexpr double kDefaultSelectionThreshold = 0.01;

struct SelectionDecision {
	/// 0 = first candidate, 1 = second candidate
	int selected_index = 0;

	/// R² of the higher-degree candidate minus R² of the lower-degree one
	/// (second minus first when degrees are equal)
	double r_squared_gain = 0.0;

	bool SelectedFirst() const {
		return selected_index == 0;
	}
};

/**
 * Parsimony tie-break between two candidate models fit on the same data
 *
 * With different degrees, the higher-degree model wins only if its R² gain
 * over the lower-degree model is at least `threshold`; otherwise the simpler
 * model is kept. With equal degrees the higher R² wins and ties keep the
 * first candidate. Depends only on the two FitQuality values and degrees, so
 * repeated calls always pick the same model.
 */
class ModelSelector {
public:
	/**
	 * @throws std::invalid_argument if threshold is negative or not finite,
	 *         or an R² value is not finite
	 */
	static SelectionDecision Compare(const core::CalibrationModel &model_a, const core::FitQuality &quality_a,
	                                 const core::CalibrationModel &model_b, const core::FitQuality &quality_b,
	                                 double threshold = kDefaultSelectionThreshold);

	/// Copy of the chosen candidate, so temporaries may be passed in
	static core::CalibrationModel Select(const core::CalibrationModel &model_a, const core::FitQuality &quality_a,
	                                     const core::CalibrationModel &model_b, const core::FitQuality &quality_b,
	                                     double threshold = kDefaultSelectionThreshold);
};

inline SelectionDecision ModelSelector::Compare(const core::CalibrationModel &model_a,
                                                const core::FitQuality &quality_a,
                                                const core::CalibrationModel &model_b,
                                                const core::FitQuality &quality_b, double threshold) {
	if (!std::isfinite(threshold) || threshold < 0.0) {
		throw std::invalid_argument("selection threshold must be finite and non-negative (got " +
		                            std::to_string(threshold) + ")");
	}
	if (!std::isfinite(quality_a.r_squared) || !std::isfinite(quality_b.r_squared)) {
		throw std::invalid_argument("cannot select between models without finite R² values");
	}
	if (quality_a.sample_count != quality_b.sample_count) {
		TSFCAL_WARN("Comparing models evaluated on different samples (" << quality_a.sample_count << " vs "
		                                                                << quality_b.sample_count << " rows)");
	}

	SelectionDecision decision;
	if (model_a.Degree() == model_b.Degree()) {
		decision.r_squared_gain = quality_b.r_squared - quality_a.r_squared;
		decision.selected_index = decision.r_squared_gain > 0.0 ? 1 : 0;
	} else {
		const bool a_is_simple = model_a.Degree() < model_b.Degree();
		const double r2_simple = a_is_simple ? quality_a.r_squared : quality_b.r_squared;
		const double r2_complex = a_is_simple ? quality_b.r_squared : quality_a.r_squared;

		decision.r_squared_gain = r2_complex - r2_simple;
		const bool keep_complex = decision.r_squared_gain >= threshold;
		decision.selected_index = (keep_complex == a_is_simple) ? 1 : 0;
	}

	TSFCAL_INFO("Selected degree "
	            << (decision.SelectedFirst() ? model_a.Degree() : model_b.Degree()) << " model (R² gain "
	            << decision.r_squared_gain << ", threshold " << threshold << ")");
	return decision;
}

inline core::CalibrationModel ModelSelector::Select(const core::CalibrationModel &model_a,
                                                    const core::FitQuality &quality_a,
                                                    const core::CalibrationModel &model_b,
                                                    const core::FitQuality &quality_b, double threshold) {
	return Compare(model_a, quality_a, model_b, quality_b, threshold).SelectedFirst() ? model_a : model_b;
}

} // namespace selection
} // namespace tsfcal
