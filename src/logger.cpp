/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace taxparam {

namespace {

// UTC, ISO-8601 with milliseconds: 2026-10-18T09:30:00.125Z
std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string json_escape(const std::string& text) {
    std::ostringstream oss;
    for (unsigned char c : text) {
        if (c == '"' || c == '\\') {
            oss << '\\' << c;
        } else if (c == '\n') {
            oss << "\\n";
        } else if (c == '\r') {
            oss << "\\r";
        } else if (c == '\t') {
            oss << "\\t";
        } else if (c < 0x20) {
            oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                << static_cast<int>(c) << std::dec;
        } else {
            oss << c;
        }
    }
    return oss.str();
}

// Fields every event carries
std::map<std::string, std::string> event_fields(const std::string& event, const RunContext& ctx) {
    std::map<std::string, std::string> fields{{"event", event}, {"run_id", ctx.run_id}};
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_() {}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (!config_.enable_file) {
        return;
    }
    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        file_stream_.reset();
    }
}

// ============================================================================
// Run events
// ============================================================================

void Logger::log_run_start(
    const RunContext& ctx,
    const YearWindow& window,
    const std::map<std::string, std::string>& inputs
) {
    Fields fields = event_fields("run_start", ctx);
    fields["prior_year"] = std::to_string(window.prior_year);
    fields["base_year"] = std::to_string(window.base_year);
    fields["final_year"] = std::to_string(window.final_year);
    for (const auto& [key, value] : inputs) {
        fields["input." + key] = value;
    }

    emit(LogLevel::INFO, "Projection run started", std::move(fields));
}

void Logger::log_table_loaded(
    const RunContext& ctx,
    const std::string& source,
    size_t parameter_count,
    int start_year
) {
    Fields fields = event_fields("table_loaded", ctx);
    fields["source"] = source;
    fields["parameter_count"] = std::to_string(parameter_count);
    fields["start_year"] = std::to_string(start_year);

    emit(LogLevel::INFO, "Loaded parameter table", std::move(fields));
}

void Logger::log_rates_loaded(
    const RunContext& ctx,
    const std::string& source,
    const InflationRateSeries& rates
) {
    Fields fields = event_fields("rates_loaded", ctx);
    fields["source"] = source;
    fields["first_year"] = std::to_string(rates.start_year());
    fields["last_year"] = std::to_string(rates.end_year() - 1);
    fields["rate_count"] = std::to_string(rates.size());

    emit(LogLevel::INFO, "Loaded inflation rates", std::move(fields));
}

void Logger::log_parameters_selected(
    const RunContext& ctx,
    size_t selected,
    size_t excluded,
    size_t table_size
) {
    Fields fields = event_fields("parameters_selected", ctx);
    fields["reverting_parameters"] = std::to_string(selected);
    fields["excluded_parameters"] = std::to_string(excluded);
    fields["table_size"] = std::to_string(table_size);

    emit(LogLevel::INFO, "Selected reverting parameters", std::move(fields));
}

void Logger::log_parameter_projected(
    const RunContext& ctx,
    const std::string& name,
    size_t columns,
    RoundingDirection direction
) {
    // Checked up front so a quiet run does not build one map per parameter
    if (LogLevel::DEBUG < config_.min_level) {
        return;
    }

    Fields fields = event_fields("parameter_projected", ctx);
    fields["parameter"] = name;
    fields["columns"] = std::to_string(columns);
    fields["round_dir"] = direction_to_string(direction);

    emit(LogLevel::DEBUG, "Projected parameter", std::move(fields));
}

void Logger::log_parameter_skipped(
    const RunContext& ctx,
    const std::string& name,
    const std::string& reason
) {
    Fields fields = event_fields("parameter_skipped", ctx);
    fields["parameter"] = name;
    fields["reason"] = reason;

    emit(LogLevel::WARN, "Skipped parameter", std::move(fields));
}

void Logger::log_snapshot_written(
    const RunContext& ctx,
    const std::string& path,
    size_t parameter_count
) {
    Fields fields = event_fields("snapshot_written", ctx);
    fields["path"] = path;
    fields["parameter_count"] = std::to_string(parameter_count);

    emit(LogLevel::INFO, "Wrote snapshot", std::move(fields));
}

void Logger::log_run_complete(
    const RunContext& ctx,
    size_t projected,
    size_t skipped,
    double elapsed_ms
) {
    Fields fields = event_fields("run_complete", ctx);
    fields["projected"] = std::to_string(projected);
    fields["skipped"] = std::to_string(skipped);

    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(3) << elapsed_ms;
    fields["elapsed_ms"] = elapsed.str();

    // A run that dropped parameters finishes with a warning
    emit(skipped > 0 ? LogLevel::WARN : LogLevel::INFO, "Projection run completed", std::move(fields));
}

void Logger::log_error(
    const RunContext& ctx,
    const std::string& error_message
) {
    Fields fields = event_fields("error", ctx);
    fields["error_message"] = error_message;

    emit(LogLevel::ERROR, "Run error", std::move(fields));
}

void Logger::log_warning(
    const RunContext& ctx,
    const std::string& warning_message
) {
    Fields fields = event_fields("warning", ctx);
    fields["warning"] = warning_message;

    emit(LogLevel::WARN, warning_message, std::move(fields));
}

// ============================================================================
// Output
// ============================================================================

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::emit(LogLevel level, const std::string& message, Fields fields) {
    if (level < config_.min_level) {
        return;
    }

    fields["timestamp"] = utc_timestamp();
    const std::string line = format_line(level, message, fields);

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        *file_stream_ << line << '\n';
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message, const Fields& fields) const {
    std::ostringstream oss;

    if (config_.enable_json) {
        oss << "{\"level\":\"" << level_to_string(level) << "\","
            << "\"message\":\"" << json_escape(message) << "\"";
        for (const auto& [key, value] : fields) {
            oss << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
        }
        oss << "}";
        return oss.str();
    }

    // timestamp [LEVEL] message key=value ...
    auto ts = fields.find("timestamp");
    oss << (ts != fields.end() ? ts->second : std::string()) << " ["
        << level_to_string(level) << "] " << message;
    for (const auto& [key, value] : fields) {
        if (key == "timestamp") continue;
        oss << ' ' << key << '=' << value;
    }
    return oss.str();
}

} // namespace taxparam
