#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "projector.hpp"
#include "eligibility.hpp"
#include "io/policy_reader.hpp"

using namespace taxparam;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

#ifndef TAXPARAM_DATA_DIR
#define TAXPARAM_DATA_DIR "data"
#endif

namespace {

// Rates for 2017-2021: 2%, 2%, 2%, 3%, 4%
InflationRateSeries make_rates() {
    return InflationRateSeries(2017, {0.02, 0.02, 0.02, 0.03, 0.04});
}

ParameterRecord scalar_record() {
    ParameterRecord record;
    record.indexed = true;
    record.value = {Value(4000.0), Value(4100.0), Value(1500.0),
                    Value(0.0), Value(0.0), Value(9999.0)};
    record.value_years = {2017, 2018, 2019, 2022};
    return record;
}

ParameterRecord vector_record() {
    ParameterRecord record;
    record.indexed = true;
    record.value = {
        std::vector<double>{6000.0, 12000.0},
        std::vector<double>{6100.0, 12200.0},
        std::vector<double>{12000.0, 24000.0},
        std::vector<double>{0.0, 0.0},
        std::vector<double>{0.0, 0.0},
        std::vector<double>{1.0, 1.0}
    };
    record.value_years = {2017, 2018, 2019, 2022};
    record.round_to = {50.0};
    record.round_dir = RoundingDirection::Down;
    return record;
}

ParameterRecord mismatched_record() {
    ParameterRecord record = vector_record();
    for (auto& v : record.value) {
        std::get<std::vector<double>>(v).push_back(100.0);
    }
    record.round_to = {1.0, 1.0};
    record.round_dir = RoundingDirection::Nearest;
    return record;
}

double scalar_at(const ProjectionResult& result, int year) {
    return std::get<double>(result.at(year));
}

const std::vector<double>& columns_at(const ProjectionResult& result, int year) {
    return std::get<std::vector<double>>(result.at(year));
}

} // anonymous namespace

// ============================================================================
// InflationFactors
// ============================================================================

TEST_CASE("InflationFactors build", "[projector][factors]") {
    YearWindow window(2017, 2019, 2022);

    auto factors = InflationFactors::build(window, make_rates());

    REQUIRE_THAT(factors.final_factor, WithinRel(1.1367660096, 1e-12));
    REQUIRE(factors.window.size() == 3);
    REQUIRE(factors.window.at(2019) == 1.0);
    REQUIRE_THAT(factors.window.at(2021), WithinRel(1.0506, 1e-12));
}

TEST_CASE("InflationFactors build fails without coverage", "[projector][factors]") {
    YearWindow window(2017, 2019, 2023);

    REQUIRE_THROWS_AS(InflationFactors::build(window, make_rates()), ConfigurationError);
}

// ============================================================================
// project_parameter
// ============================================================================

TEST_CASE("Scalar parameter projection", "[projector]") {
    YearWindow window(2017, 2019, 2022);
    auto factors = InflationFactors::build(window, make_rates());

    auto result = project_parameter("_scalar", scalar_record(), 2017, window, factors);

    REQUIRE(result.name == "_scalar");
    REQUIRE(result.values.size() == 6);
    REQUIRE(result.values.begin()->first == 2017);
    REQUIRE(result.values.rbegin()->first == 2022);

    SECTION("History through the base year is copied verbatim") {
        REQUIRE(scalar_at(result, 2017) == 4000.0);
        REQUIRE(scalar_at(result, 2018) == 4100.0);
        REQUIRE(scalar_at(result, 2019) == 1500.0);
    }

    SECTION("Intermediate years grow from the base-year value") {
        REQUIRE_THAT(scalar_at(result, 2020), WithinAbs(1530.0, 1e-9));
        REQUIRE_THAT(scalar_at(result, 2021), WithinAbs(1575.9, 1e-9));
    }

    SECTION("Final year reverts from the prior-year value") {
        // 4000 * 1.1367660096 = 4547.06 rounded to whole units
        REQUIRE(scalar_at(result, 2022) == 4547.0);
    }

    SECTION("Years outside the window are absent") {
        REQUIRE_THROWS_AS(result.at(2016), std::out_of_range);
        REQUIRE_THROWS_AS(result.at(2023), std::out_of_range);
    }
}

TEST_CASE("Per-column parameter keeps its shape", "[projector]") {
    YearWindow window(2017, 2019, 2022);
    auto factors = InflationFactors::build(window, make_rates());

    auto result = project_parameter("_vector", vector_record(), 2017, window, factors);

    for (const auto& entry : result.values) {
        REQUIRE(column_count(entry.second) == 2);
    }

    REQUIRE(columns_at(result, 2020) == std::vector<double>{12200.0, 24450.0});
    REQUIRE(columns_at(result, 2021) == std::vector<double>{12600.0, 25200.0});
    REQUIRE(columns_at(result, 2022) == std::vector<double>{6800.0, 13600.0});
}

TEST_CASE("Ten percent reversion of a whole amount", "[projector]") {
    YearWindow window(2017, 2018, 2019);
    InflationRateSeries rates(2017, {0.0, 0.10});

    ParameterRecord record;
    record.indexed = true;
    record.value = {Value(2000.0), Value(2100.0), Value(0.0)};
    record.value_years = {2017, 2018, 2019};

    auto result = project_parameter("_ten", record, 2017, window,
                                    InflationFactors::build(window, rates));

    REQUIRE(scalar_at(result, 2019) == 2200.0);
}

TEST_CASE("Intermediate years round the exact grown value to cents", "[projector]") {
    YearWindow window(2017, 2019, 2021);
    InflationRateSeries rates(2017, {0.0, 0.0, 0.0, 0.0});

    ParameterRecord record;
    record.indexed = true;
    record.value = {Value(1000.0), Value(1000.0), Value(1000.015), Value(0.0), Value(0.0)};
    record.value_years = {2017, 2018, 2019, 2021};

    auto result = project_parameter("_cents", record, 2017, window,
                                    InflationFactors::build(window, rates));

    REQUIRE(scalar_at(result, 2019) == 1000.015);
    REQUIRE(scalar_at(result, 2020) == 1000.01);
    REQUIRE(scalar_at(result, 2021) == 1000.0);
}

TEST_CASE("Projected values are capped at the infinity sentinel", "[projector]") {
    YearWindow window(2017, 2019, 2022);
    auto factors = InflationFactors::build(window, make_rates());

    ParameterRecord record;
    record.indexed = true;
    record.value = std::vector<Value>(6, Value(9e99));
    record.value_years = {2017, 2018, 2019, 2022};
    record.round_to = {25.0};
    record.round_dir = RoundingDirection::Nearest;

    auto result = project_parameter("_top", record, 2017, window, factors);

    for (const auto& entry : result.values) {
        REQUIRE(std::get<double>(entry.second) <= INFINITY_CAP);
    }
    REQUIRE(scalar_at(result, 2022) == INFINITY_CAP);
}

TEST_CASE("Unusable records raise InvalidParameterError", "[projector]") {
    YearWindow window(2017, 2019, 2022);
    auto factors = InflationFactors::build(window, make_rates());

    SECTION("round_to does not match the column count") {
        REQUIRE_THROWS_AS(project_parameter("_bad", mismatched_record(), 2017, window, factors),
                          ShapeMismatchError);
    }

    SECTION("History does not reach the base year") {
        ParameterRecord record;
        record.indexed = true;
        record.value = {Value(1.0)};
        REQUIRE_THROWS_AS(project_parameter("_short", record, 2017, window, factors),
                          InvalidParameterError);
    }
}

// ============================================================================
// project_parameters
// ============================================================================

TEST_CASE("Batch projection skips invalid parameters by default", "[projector][batch]") {
    ParameterTable table(2017);
    table.add("_scalar", scalar_record());
    table.add("_vector", vector_record());
    table.add("_bad", mismatched_record());

    YearWindow window(2017, 2019, 2022);
    auto report = project_parameters(table, {"_vector", "_bad", "_scalar"}, window, make_rates());

    REQUIRE(report.results.size() == 2);
    REQUIRE(report.results[0].name == "_scalar");
    REQUIRE(report.results[1].name == "_vector");

    REQUIRE(report.skipped.size() == 1);
    REQUIRE(report.skipped[0].name == "_bad");
    REQUIRE(report.skipped[0].reason.find("_bad") != std::string::npos);

    REQUIRE(report.find("_scalar") != nullptr);
    REQUIRE(report.find("_bad") == nullptr);
    REQUIRE(report.execution_time_ms >= 0.0);
}

TEST_CASE("Batch projection can abort on invalid parameters", "[projector][batch]") {
    ParameterTable table(2017);
    table.add("_scalar", scalar_record());
    table.add("_bad", mismatched_record());

    ProjectionConfig config;
    config.on_invalid = InvalidParameterPolicy::Abort;

    YearWindow window(2017, 2019, 2022);
    const std::vector<std::string> names{"_scalar", "_bad"};

    REQUIRE_THROWS_AS(project_parameters(table, names, window, make_rates(), config),
                      ShapeMismatchError);
}

TEST_CASE("Batch projection validates coverage before projecting", "[projector][batch]") {
    ParameterTable table(2017);
    table.add("_scalar", scalar_record());

    YearWindow window(2017, 2019, 2023);
    const std::vector<std::string> names{"_scalar"};

    REQUIRE_THROWS_AS(project_parameters(table, names, window, make_rates()), ConfigurationError);
}

TEST_CASE("Batch projection de-duplicates names", "[projector][batch]") {
    ParameterTable table(2017);
    table.add("_scalar", scalar_record());

    YearWindow window(2017, 2019, 2022);
    auto report = project_parameters(table, {"_scalar", "_scalar"}, window, make_rates());

    REQUIRE(report.results.size() == 1);
    REQUIRE(report.skipped.empty());
}

TEST_CASE("Invalid-parameter policy string conversion", "[projector]") {
    REQUIRE(string_to_policy("skip") == InvalidParameterPolicy::Skip);
    REQUIRE(string_to_policy("abort") == InvalidParameterPolicy::Abort);
    REQUIRE(policy_to_string(InvalidParameterPolicy::Abort) == "abort");
    REQUIRE_THROWS_AS(string_to_policy("ignore"), std::invalid_argument);
    REQUIRE(ProjectionConfig().on_invalid == InvalidParameterPolicy::Skip);
}

// ============================================================================
// Bundled current-law run
// ============================================================================

TEST_CASE("Current-law reversion run", "[projector][integration]") {
    auto doc = io::read_policy_json(std::string(TAXPARAM_DATA_DIR) + "/policy_current_law.json");
    auto rates = InflationRateSeries::load_from_csv(std::string(TAXPARAM_DATA_DIR) + "/growfactors.csv");
    YearWindow window(2017, 2019, 2026);

    auto names = select_reverting_parameters(doc.table, window.final_year, {"_II_brk7", "_PT_brk7"});
    auto report = project_parameters(doc.table, names, window, rates);

    REQUIRE(report.results.size() == 4);
    REQUIRE(report.skipped.empty());

    SECTION("_II_em reverts from its 2017 value") {
        const auto* em = report.find("_II_em");
        REQUIRE(em != nullptr);
        REQUIRE(scalar_at(*em, 2017) == 4050.0);
        REQUIRE(scalar_at(*em, 2020) == 0.0);
        REQUIRE(scalar_at(*em, 2025) == 0.0);
        REQUIRE(scalar_at(*em, 2026) == 4946.0);
    }

    SECTION("_II_brk1 rounds each column to its own grid") {
        const auto* brk1 = report.find("_II_brk1");
        REQUIRE(brk1 != nullptr);
        REQUIRE(columns_at(*brk1, 2020) == std::vector<double>{9875, 19750, 9875, 14100, 19750});
        REQUIRE(columns_at(*brk1, 2025) == std::vector<double>{11075, 22150, 11075, 15800, 22150});
        REQUIRE(columns_at(*brk1, 2026) == std::vector<double>{11400, 22800, 11400, 16300, 22800});
    }

    SECTION("_STD rounds down to 50") {
        const auto* std_ded = report.find("_STD");
        REQUIRE(std_ded != nullptr);
        REQUIRE(columns_at(*std_ded, 2020) == std::vector<double>{12400, 24850, 12400, 18650, 24850});
        REQUIRE(columns_at(*std_ded, 2025) == std::vector<double>{13900, 27800, 13900, 20900, 27800});
        REQUIRE(columns_at(*std_ded, 2026) == std::vector<double>{7750, 15500, 7750, 11400, 15500});
    }

    SECTION("_SS_Earnings_c rounds to the nearest 300") {
        const auto* ss = report.find("_SS_Earnings_c");
        REQUIRE(ss != nullptr);
        REQUIRE(scalar_at(*ss, 2020) == 135300.0);
        REQUIRE(scalar_at(*ss, 2023) == 144900.0);
        REQUIRE(scalar_at(*ss, 2026) == 155400.0);
    }
}
