/**
 * @file logger.hpp
 * @brief Structured logging for projection runs with JSON output
 *
 * The Logger provides:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines on stderr and/or a log file
 * - Run context tracking (run id, phase)
 * - One method per run event (inputs loaded, parameters selected,
 *   parameter projected or skipped, snapshot written, run complete)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef TAXPARAM_LOGGER_HPP
#define TAXPARAM_LOGGER_HPP

#include "parameter.hpp"
#include "inflation.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace taxparam {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-parameter detail
    INFO,    ///< Run milestones (inputs loaded, snapshots written)
    WARN,    ///< Skipped parameters, non-fatal input issues
    ERROR    ///< Fatal errors
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (unknown strings map to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Run context attached to every event
 */
struct RunContext {
    std::string run_id;              ///< Identifier of the projection run
    std::string phase;               ///< load, select, project, write

    RunContext() : run_id(""), phase("") {}

    RunContext(const std::string& id, const std::string& run_phase)
        : run_id(id), phase(run_phase) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("taxparam.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   RunContext ctx("ppp", "select");
 *   Logger::get_instance().log_parameters_selected(ctx, 98, 2, 250);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a projection run
     *
     * @param ctx Run context
     * @param window Year window of the run
     * @param inputs Input descriptions (e.g. "policy" -> path)
     */
    void log_run_start(
        const RunContext& ctx,
        const YearWindow& window,
        const std::map<std::string, std::string>& inputs
    );

    /**
     * @brief Log a loaded parameter table
     */
    void log_table_loaded(
        const RunContext& ctx,
        const std::string& source,
        size_t parameter_count,
        int start_year
    );

    /**
     * @brief Log a loaded inflation-rate series
     */
    void log_rates_loaded(
        const RunContext& ctx,
        const std::string& source,
        const InflationRateSeries& rates
    );

    /**
     * @brief Log the outcome of the eligibility filter
     *
     * @param selected Number of reverting parameters
     * @param excluded Number of names in the exclusion set
     * @param table_size Number of parameters in the table
     */
    void log_parameters_selected(
        const RunContext& ctx,
        size_t selected,
        size_t excluded,
        size_t table_size
    );

    void log_parameter_projected(
        const RunContext& ctx,
        const std::string& name,
        size_t columns,
        RoundingDirection direction
    );

    void log_parameter_skipped(
        const RunContext& ctx,
        const std::string& name,
        const std::string& reason
    );

    void log_snapshot_written(
        const RunContext& ctx,
        const std::string& path,
        size_t parameter_count
    );

    void log_run_complete(
        const RunContext& ctx,
        size_t projected,
        size_t skipped,
        double elapsed_ms
    );

    /**
     * @brief Log error with context
     */
    void log_error(
        const RunContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Log warning message
     */
    void log_warning(
        const RunContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex mutex_;

    using Fields = std::map<std::string, std::string>;

    // Formats one line and writes it to every enabled sink
    void emit(LogLevel level, const std::string& message, Fields fields);
    std::string format_line(LogLevel level, const std::string& message, const Fields& fields) const;
};

} // namespace taxparam

#endif // TAXPARAM_LOGGER_HPP
