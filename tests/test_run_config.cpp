#include <catch2/catch_test_macros.hpp>
#include "run_config.hpp"
#include <cstdlib>

using namespace taxparam;

#ifndef TAXPARAM_DATA_DIR
#define TAXPARAM_DATA_DIR "data"
#endif

TEST_CASE("RunConfig defaults", "[run_config]") {
    RunConfig config;

    REQUIRE(config.index_column == "ACPIU");
    REQUIRE(config.prior_year == 2017);
    REQUIRE(config.base_year == 2019);
    REQUIRE(config.final_year == 2026);
    REQUIRE(config.skip == std::set<std::string>{"_II_brk7", "_PT_brk7"});
    REQUIRE(config.on_invalid == InvalidParameterPolicy::Skip);
    REQUIRE(config.old_path == "ppp.old");
    REQUIRE(config.new_path == "ppp.new");
    REQUIRE(config.json_path.empty());
    REQUIRE(config.logging.min_level == LogLevel::INFO);
    REQUIRE_NOTHROW(config.window());
}

TEST_CASE("RunConfig window rejects out-of-order years", "[run_config]") {
    RunConfig config;
    config.base_year = 2026;

    REQUIRE_THROWS_AS(config.window(), ConfigurationError);
}

TEST_CASE("Parse full run configuration", "[run_config]") {
    std::string json_str = R"({
        "policy": "/data/policy.json",
        "inflation": {"source": "/data/growfactors.csv", "column": "AWAGE"},
        "years": {"prior": 2016, "base": 2018, "final": 2025},
        "skip": ["_II_brk6"],
        "on_invalid_parameter": "abort",
        "output": {"old": "/out/a.old", "new": "/out/a.new", "json": "/out/a.json"},
        "logging": {"level": "DEBUG", "json": false, "console": false, "file": "/out/run.log"}
    })";

    RunConfig config = parse_run_config_from_string(json_str);

    REQUIRE(config.policy_path == "/data/policy.json");
    REQUIRE(config.growfactors_path == "/data/growfactors.csv");
    REQUIRE(config.index_column == "AWAGE");
    REQUIRE(config.prior_year == 2016);
    REQUIRE(config.base_year == 2018);
    REQUIRE(config.final_year == 2025);
    REQUIRE(config.skip == std::set<std::string>{"_II_brk6"});
    REQUIRE(config.on_invalid == InvalidParameterPolicy::Abort);
    REQUIRE(config.old_path == "/out/a.old");
    REQUIRE(config.new_path == "/out/a.new");
    REQUIRE(config.json_path == "/out/a.json");
    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE_FALSE(config.logging.enable_json);
    REQUIRE_FALSE(config.logging.enable_console);
    REQUIRE(config.logging.enable_file);
    REQUIRE(config.logging.log_file_path == "/out/run.log");
}

TEST_CASE("Parse partial run configuration keeps defaults", "[run_config]") {
    RunConfig config = parse_run_config_from_string(R"({
        "policy": "policy.json",
        "inflation": "growfactors.csv"
    })");

    REQUIRE(config.policy_path == "policy.json");
    REQUIRE(config.growfactors_path == "growfactors.csv");
    REQUIRE(config.index_column == "ACPIU");
    REQUIRE(config.final_year == 2026);
    REQUIRE(config.skip.size() == 2);
}

TEST_CASE("An empty skip list clears the default exclusions", "[run_config]") {
    RunConfig config = parse_run_config_from_string(R"({"skip": []})");

    REQUIRE(config.skip.empty());
}

TEST_CASE("Invalid run configurations raise ConfigParseError", "[run_config]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(parse_run_config_from_string("{oops"), ConfigParseError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(parse_run_config_from_string("[1, 2]"), ConfigParseError);
    }

    SECTION("Wrong type") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"years": {"prior": "x"}})"),
                          ConfigParseError);
    }

    SECTION("Unknown invalid-parameter policy") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"on_invalid_parameter": "ignore"})"),
                          ConfigParseError);
    }

    SECTION("Remote source") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"policy": "https://example.com/p.json"})"),
                          ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_run_config_from_file("/nonexistent/run.json"), ConfigParseError);
    }
}

TEST_CASE("Relative paths resolve against the config file", "[run_config][paths]") {
    REQUIRE(resolve_relative_path("policy.json", "/etc/taxparam/run.json") == "/etc/taxparam/policy.json");
    REQUIRE(resolve_relative_path("/abs/policy.json", "/etc/taxparam/run.json") == "/abs/policy.json");
    REQUIRE(resolve_relative_path("policy.json", "") == "policy.json");
    REQUIRE(resolve_relative_path("", "/etc/taxparam/run.json").empty());
}

TEST_CASE("Source scheme handling", "[run_config][paths]") {
    REQUIRE(strip_source_scheme("local://policy.json") == "policy.json");
    REQUIRE(strip_source_scheme("policy.json") == "policy.json");
    REQUIRE_THROWS_AS(strip_source_scheme("s3://bucket/policy.json"), ConfigParseError);
}

TEST_CASE("Environment variable expansion", "[run_config][paths]") {
    setenv("TAXPARAM_TEST_DIR", "/srv/data", 1);
    unsetenv("TAXPARAM_TEST_UNSET");

    REQUIRE(expand_environment_variables("${TAXPARAM_TEST_DIR}/policy.json") == "/srv/data/policy.json");
    REQUIRE(expand_environment_variables("$TAXPARAM_TEST_DIR/policy.json") == "/srv/data/policy.json");
    REQUIRE(expand_environment_variables("${TAXPARAM_TEST_UNSET}policy.json") == "policy.json");
    REQUIRE(expand_environment_variables("cost$") == "cost$");
    REQUIRE(expand_environment_variables("no variables") == "no variables");
    REQUIRE_THROWS_AS(expand_environment_variables("${TAXPARAM_TEST_DIR"), ConfigParseError);
}

TEST_CASE("Parse bundled run configuration", "[run_config]") {
    const std::string path = std::string(TAXPARAM_DATA_DIR) + "/run_config.json";

    RunConfig config = parse_run_config_from_file(path);

    REQUIRE(config.policy_path == std::string(TAXPARAM_DATA_DIR) + "/policy_current_law.json");
    REQUIRE(config.growfactors_path == std::string(TAXPARAM_DATA_DIR) + "/growfactors.csv");
    REQUIRE(config.old_path == std::string(TAXPARAM_DATA_DIR) + "/ppp.old");
    REQUIRE(config.on_invalid == InvalidParameterPolicy::Skip);
    REQUIRE(config.window().final_year == 2026);
}
