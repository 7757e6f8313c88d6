#ifndef TAXPARAM_PROJECTOR_HPP
#define TAXPARAM_PROJECTOR_HPP

#include "parameter.hpp"
#include "inflation.hpp"
#include <map>
#include <string>
#include <vector>

namespace taxparam {

// Inflation factors shared by every parameter of a run. Built once.
struct InflationFactors {
    double final_factor;            // prior_year -> final_year in one step
    std::map<int, double> window;   // base_year -> y for y in [base_year, final_year)

    InflationFactors();

    // Throws ConfigurationError if rates do not cover the window
    static InflationFactors build(const YearWindow& window, const InflationRateSeries& rates);
};

// Projected values for one parameter, keyed by year over
// [prior_year, final_year]. Every entry has the source parameter's shape.
struct ProjectionResult {
    std::string name;
    std::map<int, Value> values;

    ProjectionResult();
    ProjectionResult(const std::string& parameter_name, std::map<int, Value>&& year_values);

    const Value& at(int year) const;
};

// What a batch projection does with a parameter that cannot be projected
enum class InvalidParameterPolicy {
    Skip,       // drop the parameter, log a warning, record it as skipped
    Abort       // propagate the InvalidParameterError
};

std::string policy_to_string(InvalidParameterPolicy policy);
InvalidParameterPolicy string_to_policy(const std::string& policy_str);

struct ProjectionConfig {
    InvalidParameterPolicy on_invalid;
    std::string run_id;             // used to tag log events

    ProjectionConfig();
};

struct SkippedParameter {
    std::string name;
    std::string reason;
};

// Result of projecting a set of parameters
struct ProjectionReport {
    std::vector<ProjectionResult> results;      // sorted by name
    std::vector<SkippedParameter> skipped;      // sorted by name
    double execution_time_ms;

    ProjectionReport();

    const ProjectionResult* find(const std::string& name) const;
};

// Project a single parameter
//
// - [prior_year, base_year]: historical values copied verbatim
// - (base_year, final_year): value[base_year] * factors.window[year], rounded
//   with the record's direction (Default -> 2 decimals)
// - final_year: value[prior_year] * factors.final_factor, rounded with the
//   record's direction (Default -> whole units)
//
// Throws ShapeMismatchError / InvalidParameterError for an unusable record.
ProjectionResult project_parameter(
    const std::string& name,
    const ParameterRecord& record,
    int start_year,
    const YearWindow& window,
    const InflationFactors& factors
);

// Project every named parameter of a table. Factors are built once.
// Throws ConfigurationError before projecting anything if the rates do not
// cover the window.
ProjectionReport project_parameters(
    const ParameterTable& table,
    const std::vector<std::string>& names,
    const YearWindow& window,
    const InflationRateSeries& rates,
    const ProjectionConfig& config = ProjectionConfig()
);

} // namespace taxparam

#endif // TAXPARAM_PROJECTOR_HPP
