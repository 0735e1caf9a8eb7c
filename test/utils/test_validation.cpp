#include <catch2/catch_test_macros.hpp>

#include "../test_helpers.hpp"
#include <tsfcal/core/errors.hpp>
#include <tsfcal/utils/validation.hpp>

using namespace tsfcal::core;
using namespace tsfcal::testing;
using tsfcal::utils::ValidationUtils;

TEST_CASE("ValidationUtils - Column resolution", "[utils][validation]") {
	auto table = MakeEngineTable();
	AppendEngine(table, "D-100", 8.1, 15.3);

	REQUIRE(ValidationUtils::FindColumnByName(table, "TSFC (cruise)") == 2);
	REQUIRE(ValidationUtils::FindNumericColumn(table, "TSFC (takeoff)") == 1);
	REQUIRE_THROWS_AS(ValidationUtils::FindNumericColumn(table, "Engine Identification"), ColumnTypeError);
	REQUIRE_THROWS_AS(ValidationUtils::FindColumnByName(table, "Thrust"), ColumnNotFoundError);

	REQUIRE_NOTHROW(ValidationUtils::ValidateRequiredColumns(table, {"TSFC (takeoff)", "TSFC (cruise)"}));
	REQUIRE_THROWS_AS(ValidationUtils::ValidateRequiredColumns(table, {}), std::invalid_argument);

	try {
		ValidationUtils::ValidateRequiredColumns(table, {"TSFC (takeoff)", "Thrust"});
		FAIL("Expected ColumnNotFoundError");
	} catch (const ColumnNotFoundError &e) {
		REQUIRE(e.ColumnName() == "Thrust");
	}
}

TEST_CASE("ValidationUtils - Finite pair extraction", "[utils][validation]") {
	auto table = MakeXYTable({1.0, kMissing, 3.0, 4.0, 5.0}, {2.0, 4.0, kMissing, 8.0, 10.0});
	table.AppendRow({Value::Numeric(std::numeric_limits<double>::infinity()), Value::Numeric(12.0)});

	auto pairs = ValidationUtils::ExtractFinitePairs(table, "x", "y");

	REQUIRE(pairs.size() == 3);
	REQUIRE(pairs.n_excluded == 3);
	const std::vector<size_t> expected_rows {0, 3, 4};
	REQUIRE(pairs.rows == expected_rows);
	REQUIRE(pairs.x(1) == 4.0);
	REQUIRE(pairs.y(2) == 10.0);

	REQUIRE(ValidationUtils::CountNullValues(table.GetColumn("x")) == 1);
	REQUIRE(ValidationUtils::CountNullValues(table.GetColumn("y")) == 1);
	REQUIRE_FALSE(ValidationUtils::IsFiniteCell(table.GetColumn("x"), 5));
	REQUIRE(ValidationUtils::IsFiniteCell(table.GetColumn("x"), 0));
}
