#include "parameter.hpp"
#include <iomanip>
#include <sstream>

namespace taxparam {

// ============================================================================
// RoundingDirection
// ============================================================================

std::string direction_to_string(RoundingDirection dir) {
    switch (dir) {
        case RoundingDirection::Default: return "default";
        case RoundingDirection::Down: return "down";
        case RoundingDirection::Nearest: return "nearest";
        default: return "unknown";
    }
}

RoundingDirection string_to_direction(const std::string& dir_str) {
    if (dir_str == "down") return RoundingDirection::Down;
    if (dir_str == "nearest") return RoundingDirection::Nearest;
    if (dir_str.empty() || dir_str == "default") return RoundingDirection::Default;
    throw std::invalid_argument("Unknown rounding direction: " + dir_str);
}

// ============================================================================
// Value helpers
// ============================================================================

size_t column_count(const Value& value) {
    if (const auto* columns = std::get_if<std::vector<double>>(&value)) {
        return columns->size();
    }
    return 1;
}

bool is_vector(const Value& value) {
    return std::holds_alternative<std::vector<double>>(value);
}

Value scale(const Value& value, double factor) {
    if (const auto* columns = std::get_if<std::vector<double>>(&value)) {
        std::vector<double> scaled;
        scaled.reserve(columns->size());
        for (double column : *columns) {
            scaled.push_back(column * factor);
        }
        return scaled;
    }
    return std::get<double>(value) * factor;
}

std::string format_number(double number) {
    std::ostringstream oss;
    oss << std::setprecision(15) << number;
    return oss.str();
}

std::string format_value(const Value& value) {
    if (const auto* columns = std::get_if<std::vector<double>>(&value)) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < columns->size(); ++i) {
            if (i > 0) oss << ", ";
            oss << format_number((*columns)[i]);
        }
        oss << "]";
        return oss.str();
    }
    return format_number(std::get<double>(value));
}

// ============================================================================
// ParameterRecord Implementation
// ============================================================================

ParameterRecord::ParameterRecord()
    : indexed(false), round_to{0.01}, round_dir(RoundingDirection::Default) {}

double ParameterRecord::granularity(size_t idx) const {
    if (round_to.size() == 1) {
        return round_to[0];
    }
    return round_to.at(idx);
}

const Value& ParameterRecord::value_at(const std::string& name, int year, int start_year) const {
    const int offset = year - start_year;
    if (offset < 0 || static_cast<size_t>(offset) >= value.size()) {
        throw InvalidParameterError(name, "no value for year " + std::to_string(year));
    }
    return value[static_cast<size_t>(offset)];
}

void ParameterRecord::validate(const std::string& name) const {
    if (round_to.empty()) {
        throw ShapeMismatchError(name, "round_to is empty");
    }
    for (double g : round_to) {
        if (!(g > 0.0)) {
            throw InvalidParameterError(name, "round_to entries must be positive");
        }
    }
    if (value.empty()) {
        return;
    }

    const bool vector_shape = is_vector(value.front());
    const size_t columns = column_count(value.front());
    for (size_t i = 0; i < value.size(); ++i) {
        if (is_vector(value[i]) != vector_shape || column_count(value[i]) != columns) {
            throw ShapeMismatchError(name, "ragged value history at index " + std::to_string(i));
        }
    }

    if (round_to.size() != 1 && round_to.size() != columns) {
        throw ShapeMismatchError(name,
            "round_to has " + std::to_string(round_to.size()) +
            " entries but values have " + std::to_string(columns) + " columns");
    }
}

// ============================================================================
// ParameterTable Implementation
// ============================================================================

ParameterTable::ParameterTable() : start_year_(0) {}

ParameterTable::ParameterTable(int start_year) : start_year_(start_year) {}

void ParameterTable::add(const std::string& name, const ParameterRecord& record) {
    records_[name] = record;
}

void ParameterTable::add(const std::string& name, ParameterRecord&& record) {
    records_[name] = std::move(record);
}

const ParameterRecord& ParameterTable::get(const std::string& name) const {
    auto it = records_.find(name);
    if (it == records_.end()) {
        throw std::out_of_range("Unknown parameter: " + name);
    }
    return it->second;
}

bool ParameterTable::contains(const std::string& name) const {
    return records_.find(name) != records_.end();
}

size_t ParameterTable::size() const {
    return records_.size();
}

bool ParameterTable::empty() const {
    return records_.empty();
}

} // namespace taxparam
