#ifndef TAXPARAM_PARAMETER_HPP
#define TAXPARAM_PARAMETER_HPP

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace taxparam {

// Sentinel used by parameter tables for "no limit" ceilings
constexpr double INFINITY_CAP = 9e99;

// A parameter value for one year: either a single number or one number
// per column (e.g. one entry per filing status)
using Value = std::variant<double, std::vector<double>>;

enum class RoundingDirection {
    Default,    // 2 decimals for intermediate years, integer for the final year
    Down,
    Nearest
};

std::string direction_to_string(RoundingDirection dir);
RoundingDirection string_to_direction(const std::string& dir_str);

// Raised when a parameter record cannot be projected
class InvalidParameterError : public std::runtime_error {
public:
    InvalidParameterError(const std::string& parameter, const std::string& message)
        : std::runtime_error(parameter + ": " + message), parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// round_to length does not match the value's column count, or the
// value history is ragged
class ShapeMismatchError : public InvalidParameterError {
public:
    ShapeMismatchError(const std::string& parameter, const std::string& message)
        : InvalidParameterError(parameter, message) {}
};

// Number of columns in a value (1 for scalars)
size_t column_count(const Value& value);

bool is_vector(const Value& value);

// Multiply every column by factor
Value scale(const Value& value, double factor);

// Render a value the way snapshots print it: "1050" or "[9325, 18650]"
std::string format_value(const Value& value);
std::string format_number(double number);

struct ParameterRecord {
    bool indexed;
    std::vector<Value> value;           // value[year - start_year]
    std::set<int> value_years;          // years with authoritative values
    std::vector<double> round_to;       // one granularity per column, or a single shared one
    RoundingDirection round_dir;

    ParameterRecord();

    // Granularity that applies to column idx
    double granularity(size_t idx) const;

    // Value for a calendar year; throws InvalidParameterError if the year
    // is outside the value history
    const Value& value_at(const std::string& name, int year, int start_year) const;

    // Check round_to against the value shape and reject ragged histories.
    // Throws ShapeMismatchError or InvalidParameterError.
    void validate(const std::string& name) const;
};

// Parameter records keyed by name. Iteration is sorted by name.
class ParameterTable {
public:
    ParameterTable();
    explicit ParameterTable(int start_year);

    int start_year() const { return start_year_; }
    void set_start_year(int year) { start_year_ = year; }

    void add(const std::string& name, const ParameterRecord& record);
    void add(const std::string& name, ParameterRecord&& record);

    const ParameterRecord& get(const std::string& name) const;
    bool contains(const std::string& name) const;
    size_t size() const;
    bool empty() const;

    const std::map<std::string, ParameterRecord>& records() const { return records_; }

private:
    int start_year_;
    std::map<std::string, ParameterRecord> records_;
};

} // namespace taxparam

#endif // TAXPARAM_PARAMETER_HPP
