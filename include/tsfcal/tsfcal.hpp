#pragma once

// Public entry points of the calibration-and-scaling core.
//
//   auto linear    = tsfcal::Fit(engines, "TSFC (takeoff)", "TSFC (cruise)", 1);
//   auto quadratic = tsfcal::Fit(engines, "TSFC (takeoff)", "TSFC (cruise)", 2);
//   auto q1 = tsfcal::Evaluate(linear, engines, "TSFC (takeoff)", "TSFC (cruise)");
//   auto q2 = tsfcal::Evaluate(quadratic, engines, "TSFC (takeoff)", "TSFC (cruise)");
//   auto model  = tsfcal::SelectModel(linear, q1, quadratic, q2);
//   auto scored = tsfcal::Apply(model, database, "TSFC (takeoff)");

#include "tsfcal/calibration/engine_calibration.hpp"
#include "tsfcal/core/calibration_model.hpp"
#include "tsfcal/core/calibration_options.hpp"
#include "tsfcal/core/data_table.hpp"
#include "tsfcal/core/errors.hpp"
#include "tsfcal/core/fit_quality.hpp"
#include "tsfcal/evaluation/fit_evaluator.hpp"
#include "tsfcal/io/model_serialization.hpp"
#include "tsfcal/scaling/scaling_applier.hpp"
#include "tsfcal/selection/model_selector.hpp"
#include "tsfcal/solvers/polynomial_fitter.hpp"

namespace tsfcal {

inline core::CalibrationModel Fit(const core::DataTable &table, const std::string &x_col, const std::string &y_col,
                                  int degree) {
	return solvers::PolynomialFitter::Fit(table, x_col, y_col, degree);
}

inline core::FitQuality Evaluate(const core::CalibrationModel &model, const core::DataTable &table,
                                 const std::string &x_col, const std::string &y_col) {
	return evaluation::FitEvaluator::Evaluate(model, table, x_col, y_col);
}

inline core::DataTable Apply(const core::CalibrationModel &model, const core::DataTable &table,
                             const std::string &x_col,
                             const scaling::ScalingOptions &options = scaling::ScalingOptions()) {
	return scaling::ScalingApplier::Apply(model, table, x_col, options);
}

inline core::CalibrationModel SelectModel(const core::CalibrationModel &model_a, const core::FitQuality &quality_a,
                                          const core::CalibrationModel &model_b, const core::FitQuality &quality_b,
                                          double threshold = selection::kDefaultSelectionThreshold) {
	return selection::ModelSelector::Select(model_a, quality_a, model_b, quality_b, threshold);
}

} // namespace tsfcal
