#include "growfactor_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace taxparam {
namespace io {

namespace {

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string clean_cell(const std::string& cell) {
    std::string s = trim(cell);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

bool same_name(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // anonymous namespace

GrowthFactorReader::GrowthFactorReader(std::istream& is, const std::string& index_column)
    : is_(is), line_number_(0), value_idx_(0), values_are_rates_(false) {
    std::vector<std::string> header;
    if (!read_fields(header)) {
        throw std::runtime_error("Growth factor CSV is empty");
    }
    if (header.size() < 2) {
        throw std::runtime_error("Growth factor CSV requires a year column and a rate or index column");
    }

    for (size_t i = 1; i < header.size(); ++i) {
        if (same_name(header[i], "rate")) {
            value_idx_ = i;
            values_are_rates_ = true;
            break;
        }
    }
    if (value_idx_ == 0) {
        for (size_t i = 1; i < header.size(); ++i) {
            if (same_name(header[i], index_column)) {
                value_idx_ = i;
                break;
            }
        }
    }
    if (value_idx_ == 0) {
        throw std::runtime_error("Growth factor CSV has neither a rate column nor column " + index_column);
    }
    column_ = header[value_idx_];
}

bool GrowthFactorReader::next(GrowthFactorRow& row) {
    std::vector<std::string> fields;
    if (!read_fields(fields)) {
        return false;
    }
    if (fields.size() <= value_idx_) {
        throw std::runtime_error("Growth factor CSV " + describe_line() + " has too few columns");
    }

    try {
        size_t consumed = 0;
        row.year = std::stoi(fields[0], &consumed);
        if (consumed != fields[0].size()) {
            throw std::invalid_argument(fields[0]);
        }
        row.value = std::stod(fields[value_idx_]);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Growth factor CSV " + describe_line() + " is not numeric");
    }
    return true;
}

bool GrowthFactorReader::read_fields(std::vector<std::string>& fields) {
    std::string line;
    while (std::getline(is_, line)) {
        ++line_number_;

        // Tolerate CRLF files
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        fields.clear();
        std::stringstream ss(content);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            fields.push_back(clean_cell(cell));
        }
        return true;
    }
    return false;
}

std::string GrowthFactorReader::describe_line() const {
    return "line " + std::to_string(line_number_);
}

} // namespace io
} // namespace taxparam
