#include <catch2/catch_test_macros.hpp>

#include <tsfcal/core/data_table.hpp>
#include <tsfcal/core/errors.hpp>
#include <cmath>
#include <limits>

using namespace tsfcal::core;

static DataTable MakeEngines() {
	DataTable table({{"Engine Identification", ColumnType::TEXT},
	                 {"TSFC (takeoff)", ColumnType::NUMERIC},
	                 {"TSFC (cruise)", ColumnType::NUMERIC}});
	table.AppendRow({Value::Text("D-30KU"), Value::Numeric(13.87952222), Value::Numeric(19.82788889)});
	table.AppendRow({Value::Text("D-100"), Value::Numeric(8.101108889), Value::Numeric(15.2958)});
	table.AppendRow({Value::Text("CFE738"), Value::Numeric(10.45213), Value::Null()});
	return table;
}

TEST_CASE("DataTable - Schema and row access", "[core][table]") {
	auto table = MakeEngines();

	SECTION("Dimensions") {
		REQUIRE(table.RowCount() == 3);
		REQUIRE(table.ColumnCount() == 3);
		REQUIRE_FALSE(table.Empty());
	}

	SECTION("Column lookup by name") {
		REQUIRE(table.HasColumn("TSFC (cruise)"));
		REQUIRE(table.ColumnIndex("TSFC (takeoff)") == 1);
		REQUIRE(table.GetColumn("Engine Identification").GetText(2) == "CFE738");
		REQUIRE(table.GetColumn(1).GetNumeric(1) == 8.101108889);
	}

	SECTION("Missing column raises ColumnNotFoundError") {
		REQUIRE_THROWS_AS(table.ColumnIndex("Rated Thrust"), ColumnNotFoundError);
		REQUIRE_THROWS_AS(table.GetColumn("Rated Thrust"), ColumnNotFoundError);
	}

	SECTION("NULL cells are absent, not zero") {
		const auto &cruise = table.GetColumn("TSFC (cruise)");
		REQUIRE_FALSE(cruise.IsValid(2));
		REQUIRE(cruise.GetValue(2).IsNull());
		REQUIRE_THROWS_AS(cruise.GetNumeric(2), ColumnTypeError);
	}

	SECTION("Typed access on the wrong column type") {
		REQUIRE_THROWS_AS(table.GetColumn("TSFC (takeoff)").GetText(0), ColumnTypeError);
	}

	SECTION("Column names keep schema order") {
		auto names = table.ColumnNames();
		REQUIRE(names.size() == 3);
		REQUIRE(names[0] == "Engine Identification");
		REQUIRE(names[2] == "TSFC (cruise)");
	}
}

TEST_CASE("DataTable - Append validation", "[core][table]") {
	auto table = MakeEngines();

	SECTION("Wrong arity") {
		REQUIRE_THROWS_AS(table.AppendRow({Value::Text("X")}), std::invalid_argument);
		REQUIRE(table.RowCount() == 3);
	}

	SECTION("Wrong type leaves no partial row") {
		REQUIRE_THROWS_AS((table.AppendRow({Value::Text("X"), Value::Text("oops"), Value::Numeric(1.0)})),
		                  ColumnTypeError);
		REQUIRE(table.RowCount() == 3);
		for (size_t c = 0; c < table.ColumnCount(); c++) {
			REQUIRE(table.GetColumn(c).Size() == 3);
		}
	}

	SECTION("Non-finite numbers are stored as given") {
		table.AppendRow({Value::Text("INF"), Value::Numeric(std::numeric_limits<double>::infinity()), Value::Null()});
		REQUIRE(std::isinf(table.GetColumn("TSFC (takeoff)").GetNumeric(3)));
	}

	SECTION("Empty columns can only be added before ingestion") {
		REQUIRE_THROWS_AS((table.AddColumn({"Rated Thrust", ColumnType::NUMERIC})), std::logic_error);

		DataTable empty;
		empty.AddColumn({"a", ColumnType::NUMERIC});
		REQUIRE_THROWS_AS((empty.AddColumn({"a", ColumnType::TEXT})), DuplicateColumnError);
	}
}

TEST_CASE("DataTable - Copy-on-write semantics", "[core][table]") {
	auto original = MakeEngines();

	SECTION("Appending to a copy leaves the original untouched") {
		DataTable copy = original;
		copy.AppendRow({Value::Text("PW4000"), Value::Numeric(9.5), Value::Numeric(16.0)});
		REQUIRE(copy.RowCount() == 4);
		REQUIRE(original.RowCount() == 3);
		REQUIRE(original.GetColumn("TSFC (takeoff)").Size() == 3);
	}

	SECTION("WithColumn returns a new table") {
		Column flag("flag", ColumnType::BOOLEAN);
		flag.AppendBoolean(true);
		flag.AppendNull();
		flag.AppendBoolean(false);

		auto extended = original.WithColumn(flag);
		REQUIRE(extended.ColumnCount() == 4);
		REQUIRE(original.ColumnCount() == 3);
		REQUIRE(extended.GetColumn("flag").GetBoolean(0));
		REQUIRE_FALSE(extended.GetColumn("flag").IsValid(1));
	}

	SECTION("WithColumn rejects duplicates and length mismatches") {
		Column dup("TSFC (cruise)", ColumnType::NUMERIC);
		dup.AppendNumeric(1.0);
		dup.AppendNumeric(2.0);
		dup.AppendNumeric(3.0);
		REQUIRE_THROWS_AS(original.WithColumn(dup), DuplicateColumnError);

		Column shorter("short", ColumnType::NUMERIC);
		shorter.AppendNumeric(1.0);
		REQUIRE_THROWS_AS(original.WithColumn(shorter), std::invalid_argument);
	}

	SECTION("Equality compares contents") {
		DataTable copy = original;
		REQUIRE(copy == original);
		copy.AppendRow({Value::Text("PW4000"), Value::Numeric(9.5), Value::Numeric(16.0)});
		REQUIRE(copy != original);
	}
}

TEST_CASE("DataTable - Row selection and key validation", "[core][table]") {
	auto table = MakeEngines();

	SECTION("SelectRows keeps the requested order") {
		auto subset = table.SelectRows({2, 0});
		REQUIRE(subset.RowCount() == 2);
		REQUIRE(subset.GetColumn("Engine Identification").GetText(0) == "CFE738");
		REQUIRE_FALSE(subset.GetColumn("TSFC (cruise)").IsValid(0));
		REQUIRE(subset.GetColumn("Engine Identification").GetText(1) == "D-30KU");
		REQUIRE_THROWS_AS(table.SelectRows({5}), std::out_of_range);
	}

	SECTION("Unique keys pass") {
		REQUIRE_NOTHROW(table.ValidateUniqueKey("Engine Identification"));
	}

	SECTION("Repeated keys are reported") {
		table.AppendRow({Value::Text("D-100"), Value::Numeric(8.2), Value::Numeric(15.3)});
		REQUIRE_THROWS_AS(table.ValidateUniqueKey("Engine Identification"), DuplicateKeyError);
	}

	SECTION("Key column must be TEXT") {
		REQUIRE_THROWS_AS(table.ValidateUniqueKey("TSFC (takeoff)"), ColumnTypeError);
	}
}

TEST_CASE("Value - Typed construction", "[core][value]") {
	REQUIRE(Value().IsNull());
	REQUIRE(Value::Numeric(1.5).GetNumeric() == 1.5);
	REQUIRE(Value::Text("D-100").GetText() == "D-100");
	REQUIRE(Value::Boolean(true).GetBoolean());
	REQUIRE_THROWS_AS(Value::Null().GetNumeric(), ColumnTypeError);
	REQUIRE_THROWS_AS(Value::Text("1.5").GetNumeric(), ColumnTypeError);
	REQUIRE(Value::Numeric(2.0) == Value::Numeric(2.0));
	REQUIRE(Value::Numeric(2.0) != Value::Null());
}
