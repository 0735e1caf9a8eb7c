#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "../test_helpers.hpp"
#include <tsfcal/core/errors.hpp>
#include <tsfcal/scaling/scaling_applier.hpp>

using namespace tsfcal::core;
using namespace tsfcal::testing;
using tsfcal::scaling::ScalingApplier;
using tsfcal::scaling::ScalingOptions;
using Catch::Matchers::WithinAbs;

const double TOLERANCE = 1e-9;

// Linear model fit on takeoff TSFC 7.72 to 18.37
static CalibrationModel ReferenceModel() {
	return CalibrationModel({21.431274982142263, 2.1411422022358697}, 7.72, 18.37);
}

static DataTable TargetTable() {
	auto table = MakeEngineTable();
	AppendEngine(table, "CFM56-7B", 20.0, kMissing);
	AppendEngine(table, "V2500", 10.0, kMissing);
	AppendEngine(table, "D-36", 7.72, kMissing);
	AppendEngine(table, "TFE731", kMissing, kMissing);
	AppendEngine(table, "PW100", 5.0, kMissing);
	return table;
}

TEST_CASE("ScalingApplier - Predictions and extrapolation flags", "[scaling]") {
	auto model = ReferenceModel();
	auto input = TargetTable();
	auto scored = ScalingApplier::Apply(model, input, "TSFC (takeoff)");

	const auto &predicted = scored.GetColumn("predicted");
	const auto &flag = scored.GetColumn("extrapolated");

	SECTION("Output schema extends the input") {
		REQUIRE(scored.ColumnCount() == input.ColumnCount() + 2);
		REQUIRE(scored.RowCount() == input.RowCount());
		REQUIRE(predicted.Type() == ColumnType::NUMERIC);
		REQUIRE(flag.Type() == ColumnType::BOOLEAN);
		REQUIRE(scored.GetColumn("Engine Identification").GetText(1) == "V2500");
	}

	SECTION("Above the domain") {
		REQUIRE_THAT(predicted.GetNumeric(0), WithinAbs(24.2278278491001, TOLERANCE));
		REQUIRE(flag.GetBoolean(0));
	}

	SECTION("Inside the domain") {
		REQUIRE_THAT(predicted.GetNumeric(1), WithinAbs(20.206903525652457, TOLERANCE));
		REQUIRE_FALSE(flag.GetBoolean(1));
	}

	SECTION("Domain bounds are inside") {
		REQUIRE_FALSE(flag.GetBoolean(2));
		REQUIRE(predicted.IsValid(2));
	}

	SECTION("Missing X yields missing outputs") {
		REQUIRE_FALSE(predicted.IsValid(3));
		REQUIRE_FALSE(flag.IsValid(3));
	}

	SECTION("Below the domain") {
		REQUIRE(flag.GetBoolean(4));
		REQUIRE(predicted.GetNumeric(4) == model.Evaluate(5.0));
	}

	SECTION("Flag count") {
		REQUIRE(ScalingApplier::CountFlagged(scored, "extrapolated") == 2);
		REQUIRE_THROWS_AS(ScalingApplier::CountFlagged(scored, "predicted"), ColumnTypeError);
	}

	SECTION("Input table is left untouched") {
		REQUIRE(input.ColumnCount() == 3);
		REQUIRE(input == TargetTable());
	}
}

TEST_CASE("ScalingApplier - Repeated application", "[scaling]") {
	auto model = ReferenceModel();
	auto input = TargetTable();

	SECTION("Same model and input give identical output") {
		auto first = ScalingApplier::Apply(model, input, "TSFC (takeoff)");
		auto second = ScalingApplier::Apply(model, input, "TSFC (takeoff)");
		REQUIRE(first == second);
	}

	SECTION("Re-applying to scored output refuses to overwrite") {
		auto scored = ScalingApplier::Apply(model, input, "TSFC (takeoff)");
		REQUIRE_THROWS_AS(ScalingApplier::Apply(model, scored, "TSFC (takeoff)"), DuplicateColumnError);
	}
}

TEST_CASE("ScalingApplier - Options", "[scaling]") {
	auto model = ReferenceModel();
	auto input = TargetTable();

	SECTION("Custom output names") {
		ScalingOptions options;
		options.predicted_column = "TSFC (cruise, predicted)";
		options.extrapolated_column = "outside calibration";
		auto scored = ScalingApplier::Apply(model, input, "TSFC (takeoff)", options);
		REQUIRE(scored.HasColumn("TSFC (cruise, predicted)"));
		REQUIRE(scored.HasColumn("outside calibration"));
	}

	SECTION("OMIT drops predictions outside the domain") {
		ScalingOptions options;
		options.extrapolation_policy = ExtrapolationPolicy::OMIT;
		auto scored = ScalingApplier::Apply(model, input, "TSFC (takeoff)", options);
		const auto &predicted = scored.GetColumn("predicted");
		const auto &flag = scored.GetColumn("extrapolated");
		REQUIRE_FALSE(predicted.IsValid(0));
		REQUIRE(flag.GetBoolean(0));
		REQUIRE(predicted.IsValid(1));
		REQUIRE_FALSE(predicted.IsValid(4));
	}

	SECTION("Options derived from the workflow configuration") {
		auto options = ScalingOptions::FromCalibrationOptions(CalibrationOptions::InterpolationOnly());
		REQUIRE(options.predicted_column == "TSFC (cruise, predicted)");
		REQUIRE(options.extrapolated_column == "extrapolated");
		REQUIRE(options.extrapolation_policy == ExtrapolationPolicy::OMIT);
	}
}

TEST_CASE("Input Validation: ScalingApplier - Invalid inputs", "[validation][scaling]") {
	auto model = ReferenceModel();
	auto input = TargetTable();

	SECTION("Missing X column") {
		REQUIRE_THROWS_AS(ScalingApplier::Apply(model, input, "TSFC (idle)"), ColumnNotFoundError);
	}

	SECTION("Non-numeric X column") {
		REQUIRE_THROWS_AS(ScalingApplier::Apply(model, input, "Engine Identification"), ColumnTypeError);
	}

	SECTION("Output name collides with an input column") {
		ScalingOptions options;
		options.predicted_column = "TSFC (cruise)";
		REQUIRE_THROWS_AS(ScalingApplier::Apply(model, input, "TSFC (takeoff)", options), DuplicateColumnError);
	}

	SECTION("Output names must differ") {
		ScalingOptions options;
		options.extrapolated_column = options.predicted_column;
		REQUIRE_THROWS_AS(ScalingApplier::Apply(model, input, "TSFC (takeoff)", options), std::invalid_argument);
	}
}
