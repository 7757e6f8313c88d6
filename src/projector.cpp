#include "projector.hpp"
#include "rounding.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace taxparam {

// ============================================================================
// InflationFactors Implementation
// ============================================================================

InflationFactors::InflationFactors() : final_factor(1.0) {}

InflationFactors InflationFactors::build(const YearWindow& window,
                                         const InflationRateSeries& rates) {
    window.validate();

    InflationFactors factors;
    factors.final_factor = taxparam::final_factor(window.prior_year, window.final_year, rates);
    factors.window = window_factors(window.base_year, window.final_year, rates);
    return factors;
}

// ============================================================================
// ProjectionResult Implementation
// ============================================================================

ProjectionResult::ProjectionResult() = default;

ProjectionResult::ProjectionResult(const std::string& parameter_name,
                                   std::map<int, Value>&& year_values)
    : name(parameter_name), values(std::move(year_values)) {}

const Value& ProjectionResult::at(int year) const {
    auto it = values.find(year);
    if (it == values.end()) {
        throw std::out_of_range(name + ": no projected value for year " + std::to_string(year));
    }
    return it->second;
}

// ============================================================================
// ProjectionConfig / ProjectionReport Implementation
// ============================================================================

std::string policy_to_string(InvalidParameterPolicy policy) {
    switch (policy) {
        case InvalidParameterPolicy::Skip: return "skip";
        case InvalidParameterPolicy::Abort: return "abort";
        default: return "unknown";
    }
}

InvalidParameterPolicy string_to_policy(const std::string& policy_str) {
    if (policy_str == "skip") return InvalidParameterPolicy::Skip;
    if (policy_str == "abort") return InvalidParameterPolicy::Abort;
    throw std::invalid_argument("Unknown invalid-parameter policy: " + policy_str);
}

ProjectionConfig::ProjectionConfig()
    : on_invalid(InvalidParameterPolicy::Skip), run_id("ppp") {}

ProjectionReport::ProjectionReport() : execution_time_ms(0.0) {}

const ProjectionResult* ProjectionReport::find(const std::string& name) const {
    auto it = std::lower_bound(results.begin(), results.end(), name,
        [](const ProjectionResult& r, const std::string& n) { return r.name < n; });
    if (it != results.end() && it->name == name) {
        return &*it;
    }
    return nullptr;
}

// ============================================================================
// Projection Implementation
// ============================================================================

ProjectionResult project_parameter(
    const std::string& name,
    const ParameterRecord& record,
    int start_year,
    const YearWindow& window,
    const InflationFactors& factors)
{
    record.validate(name);

    std::map<int, Value> values;

    // Known history through the base year
    for (int year = window.prior_year; year <= window.base_year; ++year) {
        values[year] = record.value_at(name, year, start_year);
    }

    // Intermediate years grow from the base-year value
    const Value& bvalue = record.value_at(name, window.base_year, start_year);
    for (int year = window.base_year + 1; year < window.final_year; ++year) {
        auto it = factors.window.find(year);
        if (it == factors.window.end()) {
            throw ConfigurationError("No inflation factor for year " + std::to_string(year));
        }
        values[year] = round_value(scale(bvalue, it->second), record.round_dir,
                                   record.round_to, ProjectionStage::Intermediate);
    }

    // Final year reverts from the prior-year value over the whole window
    const Value& pvalue = record.value_at(name, window.prior_year, start_year);
    values[window.final_year] = round_value(scale(pvalue, factors.final_factor),
                                            record.round_dir, record.round_to,
                                            ProjectionStage::Final);

    return ProjectionResult(name, std::move(values));
}

ProjectionReport project_parameters(
    const ParameterTable& table,
    const std::vector<std::string>& names,
    const YearWindow& window,
    const InflationRateSeries& rates,
    const ProjectionConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    // Fails before any parameter is touched
    const InflationFactors factors = InflationFactors::build(window, rates);

    std::vector<std::string> sorted_names(names);
    std::sort(sorted_names.begin(), sorted_names.end());
    sorted_names.erase(std::unique(sorted_names.begin(), sorted_names.end()), sorted_names.end());

    // One slot per parameter so the parallel loop never shares state
    const size_t count = sorted_names.size();
    std::vector<ProjectionResult> slots(count);
    std::vector<std::exception_ptr> errors(count);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 8)
    for (long i = 0; i < static_cast<long>(count); ++i) {
        const size_t idx = static_cast<size_t>(i);
        try {
            slots[idx] = project_parameter(sorted_names[idx], table.get(sorted_names[idx]),
                                           table.start_year(), window, factors);
        } catch (...) {
            errors[idx] = std::current_exception();
        }
    }
#else
    for (size_t idx = 0; idx < count; ++idx) {
        try {
            slots[idx] = project_parameter(sorted_names[idx], table.get(sorted_names[idx]),
                                           table.start_year(), window, factors);
        } catch (...) {
            errors[idx] = std::current_exception();
        }
    }
#endif

    Logger& logger = Logger::get_instance();
    RunContext ctx(config.run_id, "project");

    ProjectionReport report;
    report.results.reserve(count);

    for (size_t idx = 0; idx < count; ++idx) {
        if (errors[idx]) {
            try {
                std::rethrow_exception(errors[idx]);
            } catch (const InvalidParameterError& e) {
                if (config.on_invalid == InvalidParameterPolicy::Abort) {
                    throw;
                }
                logger.log_parameter_skipped(ctx, sorted_names[idx], e.what());
                report.skipped.push_back({sorted_names[idx], e.what()});
            }
            continue;
        }

        const ParameterRecord& record = table.get(sorted_names[idx]);
        const Value& sample = slots[idx].values.begin()->second;
        logger.log_parameter_projected(ctx, sorted_names[idx], column_count(sample), record.round_dir);
        report.results.push_back(std::move(slots[idx]));
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    report.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    return report;
}

} // namespace taxparam
