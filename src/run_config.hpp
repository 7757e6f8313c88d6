#ifndef TAXPARAM_RUN_CONFIG_HPP
#define TAXPARAM_RUN_CONFIG_HPP

#include "inflation.hpp"
#include "logger.hpp"
#include "projector.hpp"
#include <set>
#include <stdexcept>
#include <string>

namespace taxparam {

/**
 * @brief Exception thrown when a run configuration cannot be parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Settings for one projection run
 *
 * Defaults reproduce the TCJA reversion run: values known through 2019,
 * reverting in 2026 from their 2017 level, with the two "infinite" top
 * bracket parameters excluded.
 */
struct RunConfig {
    std::string policy_path;             ///< Parameter-table JSON
    std::string growfactors_path;        ///< Growth-factor CSV (empty: rates from policy_path)
    std::string index_column;            ///< Growth-factor column holding the price index

    int prior_year;
    int base_year;
    int final_year;

    std::set<std::string> skip;          ///< Parameters never projected
    InvalidParameterPolicy on_invalid;

    std::string old_path;                ///< Historical snapshot output
    std::string new_path;                ///< Projected snapshot output
    std::string json_path;               ///< JSON update output (empty: not written)

    LoggerConfig logging;

    RunConfig();

    /**
     * @brief Year window of the run
     * @throws ConfigurationError if the years are out of order
     */
    YearWindow window() const;
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative paths in the file are resolved against the file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @param json_string JSON configuration
 * @param config_file_path Path used to resolve relative paths (may be empty)
 * @throws ConfigParseError if the JSON is invalid
 */
RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& config_file_path = "");

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of the config file
 *
 * Absolute paths, and any path when config_file_path is empty, are returned
 * unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

/**
 * @brief Strips a "local://" source prefix
 *
 * @throws ConfigParseError for any other scheme (e.g. "https://")
 */
std::string strip_source_scheme(const std::string& source);

} // namespace taxparam

#endif // TAXPARAM_RUN_CONFIG_HPP
