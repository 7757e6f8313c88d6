#include "snapshot_writer.hpp"
#include <fstream>
#include <stdexcept>

namespace taxparam {
namespace io {

namespace {

void write_block_header(std::ostream& os, const std::string& name) {
    os << "*** " << name << " ***\n";
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_history_snapshot(std::ostream& os, const ParameterTable& table,
                            const std::vector<std::string>& names,
                            const YearWindow& window) {
    for (const auto& name : names) {
        const ParameterRecord& record = table.get(name);
        write_block_header(os, name);
        for (int year = window.prior_year; year <= window.final_year; ++year) {
            const Value& value = record.value_at(name, year, table.start_year());
            os << year << ": " << format_value(value) << "\n";
        }
    }
}

void write_history_snapshot(const std::string& filepath, const ParameterTable& table,
                            const std::vector<std::string>& names,
                            const YearWindow& window) {
    std::ofstream file = open_output(filepath);
    write_history_snapshot(file, table, names, window);
}

void write_projected_snapshot(std::ostream& os,
                              const std::vector<ProjectionResult>& results,
                              const YearWindow& window) {
    for (const auto& result : results) {
        write_block_header(os, result.name);
        for (int year = window.prior_year; year <= window.final_year; ++year) {
            os << year << ": " << format_value(result.at(year)) << "\n";
        }
    }
}

void write_projected_snapshot(const std::string& filepath,
                              const std::vector<ProjectionResult>& results,
                              const YearWindow& window) {
    std::ofstream file = open_output(filepath);
    write_projected_snapshot(file, results, window);
}

} // namespace io
} // namespace taxparam
