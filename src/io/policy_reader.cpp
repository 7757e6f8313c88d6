#include "policy_reader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace taxparam {
namespace io {

namespace {

Value parse_value_entry(const std::string& name, const json& entry) {
    if (entry.is_number()) {
        return entry.get<double>();
    }
    if (entry.is_array()) {
        std::vector<double> columns;
        columns.reserve(entry.size());
        for (const auto& column : entry) {
            if (!column.is_number()) {
                throw PolicyParseError("Parameter '" + name + "' has a non-numeric value column");
            }
            columns.push_back(column.get<double>());
        }
        return columns;
    }
    if (entry.is_boolean()) {
        // Boolean switches are stored as 0/1
        return entry.get<bool>() ? 1.0 : 0.0;
    }
    throw PolicyParseError("Parameter '" + name + "' has a value that is neither a number nor a list");
}

ParameterRecord parse_record(const std::string& name, const json& j, int start_year) {
    if (!j.is_object()) {
        throw PolicyParseError("Parameter '" + name + "' must be an object");
    }

    ParameterRecord record;

    if (j.contains("indexed")) {
        record.indexed = j["indexed"].get<bool>();
    }

    if (!j.contains("value") || !j["value"].is_array()) {
        throw PolicyParseError("Parameter '" + name + "' missing required array: value");
    }
    for (const auto& entry : j["value"]) {
        record.value.push_back(parse_value_entry(name, entry));
    }

    const int last_year = start_year + static_cast<int>(record.value.size()) - 1;
    if (j.contains("value_yrs")) {
        for (const auto& year_json : j["value_yrs"]) {
            int year = year_json.get<int>();
            if (year < start_year || year > last_year) {
                throw PolicyParseError("Parameter '" + name + "' lists value year " +
                                       std::to_string(year) + " outside its value history");
            }
            record.value_years.insert(year);
        }
    } else {
        for (int year = start_year; year <= last_year; ++year) {
            record.value_years.insert(year);
        }
    }

    if (j.contains("round_to")) {
        const auto& round_to = j["round_to"];
        record.round_to.clear();
        if (round_to.is_array()) {
            for (const auto& g : round_to) {
                record.round_to.push_back(g.get<double>());
            }
        } else {
            record.round_to.push_back(round_to.get<double>());
        }
    }

    if (j.contains("round_dir") && !j["round_dir"].is_null()) {
        try {
            record.round_dir = string_to_direction(j["round_dir"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw PolicyParseError("Parameter '" + name + "': " + e.what());
        }
    }

    return record;
}

InflationRateSeries parse_rates(const json& j, int start_year) {
    int rates_start = start_year;
    const json* rates_json = &j;

    if (j.is_object()) {
        if (j.contains("start_year")) {
            rates_start = j["start_year"].get<int>();
        }
        if (!j.contains("rates")) {
            throw PolicyParseError("inflation_rates object missing required field: rates");
        }
        rates_json = &j["rates"];
    }
    if (!rates_json->is_array()) {
        throw PolicyParseError("inflation_rates must be an array of rates");
    }

    std::vector<double> rates;
    rates.reserve(rates_json->size());
    for (const auto& rate : *rates_json) {
        rates.push_back(rate.get<double>());
    }
    return InflationRateSeries(rates_start, std::move(rates));
}

PolicyDocument from_json(const json& j) {
    if (!j.is_object()) {
        throw PolicyParseError("Parameter table must be a JSON object");
    }
    if (!j.contains("start_year")) {
        throw PolicyParseError("Missing required field: start_year");
    }
    if (!j.contains("parameters") || !j["parameters"].is_object()) {
        throw PolicyParseError("Missing required object: parameters");
    }

    PolicyDocument doc;
    const int start_year = j["start_year"].get<int>();
    doc.table.set_start_year(start_year);

    for (auto it = j["parameters"].begin(); it != j["parameters"].end(); ++it) {
        doc.table.add(it.key(), parse_record(it.key(), it.value(), start_year));
    }

    if (j.contains("inflation_rates")) {
        doc.rates = parse_rates(j["inflation_rates"], start_year);
        doc.has_rates = true;
    }

    return doc;
}

} // anonymous namespace

PolicyDocument::PolicyDocument() : has_rates(false) {}

PolicyDocument read_policy_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw PolicyParseError("Cannot open parameter table: " + filepath);
    }
    return read_policy_json(file);
}

PolicyDocument read_policy_json(std::istream& is) {
    json j;
    try {
        is >> j;
        return from_json(j);
    } catch (const json::exception& e) {
        throw PolicyParseError("Failed to parse parameter table: " + std::string(e.what()));
    }
}

PolicyDocument parse_policy_json(const std::string& json_string) {
    std::istringstream iss(json_string);
    return read_policy_json(iss);
}

} // namespace io
} // namespace taxparam
