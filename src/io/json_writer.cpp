#include "json_writer.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace taxparam {
namespace io {

namespace {

std::string escape(const std::string& str) {
    std::ostringstream oss;
    for (unsigned char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string json_number(double number) {
    if (!std::isfinite(number)) {
        return "null";
    }
    return format_number(number);
}

std::string json_value(const Value& value) {
    if (const auto* columns = std::get_if<std::vector<double>>(&value)) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < columns->size(); ++i) {
            if (i > 0) oss << ", ";
            oss << json_number((*columns)[i]);
        }
        oss << "]";
        return oss.str();
    }
    return json_number(std::get<double>(value));
}

} // anonymous namespace

void write_projection_json(std::ostream& os, const ProjectionReport& report,
                           const YearWindow& window, bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << "{" << newline;

    // Window section
    os << indent << "\"window\":" << space << "{"
       << "\"prior_year\":" << space << window.prior_year << "," << space
       << "\"base_year\":" << space << window.base_year << "," << space
       << "\"final_year\":" << space << window.final_year << "}," << newline;

    // Projected values, base year excluded
    os << indent << "\"parameters\":" << space << "{";
    for (size_t i = 0; i < report.results.size(); ++i) {
        const ProjectionResult& result = report.results[i];
        os << (i > 0 ? "," : "") << newline;
        os << indent << indent << "\"" << escape(result.name) << "\":" << space << "{";

        bool first = true;
        for (int year = window.base_year + 1; year <= window.final_year; ++year) {
            if (!first) os << ",";
            os << newline << indent << indent << indent
               << "\"" << year << "\":" << space << json_value(result.at(year));
            first = false;
        }
        os << newline << indent << indent << "}";
    }
    if (!report.results.empty()) {
        os << newline << indent;
    }
    os << "}," << newline;

    // Skipped parameters
    os << indent << "\"skipped\":" << space << "[";
    for (size_t i = 0; i < report.skipped.size(); ++i) {
        os << (i > 0 ? "," : "") << newline << indent << indent
           << "{\"name\":" << space << "\"" << escape(report.skipped[i].name) << "\","
           << space << "\"reason\":" << space << "\"" << escape(report.skipped[i].reason) << "\"}";
    }
    if (!report.skipped.empty()) {
        os << newline << indent;
    }
    os << "]" << newline;

    os << "}" << newline;
}

void write_projection_json(const std::string& filepath, const ProjectionReport& report,
                           const YearWindow& window, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_projection_json(file, report, window, pretty_print);
}

} // namespace io
} // namespace taxparam
