#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <tsfcal/selection/model_selector.hpp>
#include <limits>

using namespace tsfcal::core;
using tsfcal::selection::ModelSelector;
using Catch::Matchers::WithinAbs;

static CalibrationModel Linear() {
	return CalibrationModel({21.431274982142263, 2.1411422022358697}, 7.72, 18.37);
}

static CalibrationModel Quadratic() {
	return CalibrationModel({21.230144413736507, 2.1465697287594283, 0.4089645056678463}, 7.72, 18.37);
}

static FitQuality Quality(double r_squared) {
	return FitQuality(r_squared, 5, 0.1, 0.1);
}

TEST_CASE("ModelSelector - Parsimony rule", "[selection]") {
	auto linear = Linear();
	auto quadratic = Quadratic();

	SECTION("Gain above threshold selects the quadratic") {
		auto decision = ModelSelector::Compare(linear, Quality(0.9853378643089966), quadratic,
		                                       Quality(0.9987115269780045));
		REQUIRE(decision.selected_index == 1);
		REQUIRE_THAT(decision.r_squared_gain, WithinAbs(0.0133736626690079, 1e-12));

		auto chosen =
		    ModelSelector::Select(linear, Quality(0.9853378643089966), quadratic, Quality(0.9987115269780045));
		REQUIRE(chosen.Degree() == 2);
		REQUIRE(chosen == quadratic);
	}

	SECTION("Gain below threshold keeps the linear model") {
		auto decision = ModelSelector::Compare(linear, Quality(0.9984309353483427), quadratic,
		                                       Quality(0.9998008594904393));
		REQUIRE(decision.SelectedFirst());
		REQUIRE(ModelSelector::Select(linear, Quality(0.9984309353483427), quadratic, Quality(0.9998008594904393))
		            .Degree() == 1);
	}

	SECTION("Gain exactly at the threshold selects the quadratic") {
		auto decision = ModelSelector::Compare(linear, Quality(0.5), quadratic, Quality(0.75), 0.25);
		REQUIRE(decision.selected_index == 1);
	}

	SECTION("Quadratic scoring worse keeps the linear model") {
		auto decision = ModelSelector::Compare(linear, Quality(0.95), quadratic, Quality(0.94), 0.0);
		REQUIRE(decision.SelectedFirst());
	}

	SECTION("Candidate order does not change the chosen model") {
		auto decision = ModelSelector::Compare(quadratic, Quality(0.9987115269780045), linear,
		                                       Quality(0.9853378643089966));
		REQUIRE(decision.SelectedFirst());
		REQUIRE_THAT(decision.r_squared_gain, WithinAbs(0.0133736626690079, 1e-12));

		decision = ModelSelector::Compare(quadratic, Quality(0.9998008594904393), linear, Quality(0.9984309353483427));
		REQUIRE(decision.selected_index == 1);
	}

	SECTION("Zero threshold prefers any improvement") {
		auto decision = ModelSelector::Compare(linear, Quality(0.9984309353483427), quadratic,
		                                       Quality(0.9998008594904393), 0.0);
		REQUIRE(decision.selected_index == 1);
	}

	SECTION("Repeated calls give the same decision") {
		for (int i = 0; i < 10; i++) {
			auto decision = ModelSelector::Compare(linear, Quality(0.9853378643089966), quadratic,
			                                       Quality(0.9987115269780045));
			REQUIRE(decision.selected_index == 1);
		}
	}
}

TEST_CASE("ModelSelector - Equal degrees", "[selection]") {
	auto a = Linear();
	auto b = CalibrationModel({21.0, 2.0}, 7.72, 18.37);

	SECTION("Higher R² wins") {
		REQUIRE(ModelSelector::Select(a, Quality(0.90), b, Quality(0.95)) == b);
		REQUIRE(ModelSelector::Select(a, Quality(0.95), b, Quality(0.90)) == a);
	}

	SECTION("Ties keep the first candidate") {
		REQUIRE(ModelSelector::Select(a, Quality(0.90), b, Quality(0.90)) == a);
		REQUIRE(ModelSelector::Select(b, Quality(0.90), a, Quality(0.90)) == b);
	}
}

TEST_CASE("ModelSelector - Selecting between temporaries", "[selection]") {
	const auto &chosen = ModelSelector::Select(Linear(), Quality(0.9853378643089966), Quadratic(),
	                                           Quality(0.9987115269780045));
	// Result is a copy bound to the reference, so it outlives the candidates
	REQUIRE(chosen.Degree() == 2);
	REQUIRE(chosen == Quadratic());
	REQUIRE(chosen.Evaluate(12.0) == Quadratic().Evaluate(12.0));
}

TEST_CASE("Input Validation: ModelSelector - Invalid inputs", "[validation][selection]") {
	auto linear = Linear();
	auto quadratic = Quadratic();

	SECTION("Negative threshold") {
		REQUIRE_THROWS_AS(ModelSelector::Compare(linear, Quality(0.9), quadratic, Quality(0.95), -0.01),
		                  std::invalid_argument);
	}

	SECTION("Non-finite threshold") {
		const double nan = std::numeric_limits<double>::quiet_NaN();
		REQUIRE_THROWS_AS(ModelSelector::Compare(linear, Quality(0.9), quadratic, Quality(0.95), nan),
		                  std::invalid_argument);
	}

	SECTION("Unevaluated quality") {
		REQUIRE_THROWS_AS(ModelSelector::Compare(linear, FitQuality(), quadratic, Quality(0.95)),
		                  std::invalid_argument);
	}
}
