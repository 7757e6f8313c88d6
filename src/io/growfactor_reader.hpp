#ifndef TAXPARAM_IO_GROWFACTOR_READER_HPP
#define TAXPARAM_IO_GROWFACTOR_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace taxparam {
namespace io {

// One data row of a growth-factor file
struct GrowthFactorRow {
    int year;
    double value;

    GrowthFactorRow() : year(0), value(0.0) {}
};

// Reads a growth-factor CSV:
//
//   YEAR,ACPIU,AWAGE
//   2017,1.0213,1.0347
//   ...
//
// The first column is the year. A column named "rate" (any case) holds
// rates and wins over index_column, which otherwise holds growth factors.
// Blank lines and lines starting with '#' are skipped. Cells are trimmed
// and surrounding double quotes removed.
//
// Throws std::runtime_error with the line number on malformed input.
class GrowthFactorReader {
public:
    GrowthFactorReader(std::istream& is, const std::string& index_column);

    // Reads the next data row. Returns false at end of input.
    bool next(GrowthFactorRow& row);

    // True when values are rates, false when they are growth factors
    bool values_are_rates() const { return values_are_rates_; }

    // Header name of the value column in use
    const std::string& column() const { return column_; }

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    size_t line_number_;
    size_t value_idx_;
    bool values_are_rates_;
    std::string column_;

    bool read_fields(std::vector<std::string>& fields);
    std::string describe_line() const;
};

} // namespace io
} // namespace taxparam

#endif // TAXPARAM_IO_GROWFACTOR_READER_HPP
