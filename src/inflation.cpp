#include "inflation.hpp"
#include "rounding.hpp"
#include "io/growfactor_reader.hpp"
#include <fstream>

namespace taxparam {

namespace {

void require_coverage(const InflationRateSeries& rates, int from_year, int to_year) {
    if (!rates.covers(from_year, to_year)) {
        throw ConfigurationError(
            "Inflation rates cover [" + std::to_string(rates.start_year()) + ", " +
            std::to_string(rates.end_year()) + ") but [" + std::to_string(from_year) +
            ", " + std::to_string(to_year) + ") is required");
    }
}

} // anonymous namespace

// ============================================================================
// YearWindow Implementation
// ============================================================================

YearWindow::YearWindow(int prior, int base, int reverting)
    : prior_year(prior), base_year(base), final_year(reverting) {
    validate();
}

void YearWindow::validate() const {
    if (prior_year >= base_year) {
        throw ConfigurationError("prior_year (" + std::to_string(prior_year) +
                                 ") must be less than base_year (" +
                                 std::to_string(base_year) + ")");
    }
    if (base_year >= final_year) {
        throw ConfigurationError("base_year (" + std::to_string(base_year) +
                                 ") must be less than final_year (" +
                                 std::to_string(final_year) + ")");
    }
}

// ============================================================================
// InflationRateSeries Implementation
// ============================================================================

InflationRateSeries::InflationRateSeries() : start_year_(0) {}

InflationRateSeries::InflationRateSeries(int start_year, std::vector<double> rates)
    : start_year_(start_year), rates_(std::move(rates)) {}

double InflationRateSeries::get_rate(int year) const {
    if (year < start_year_ || year >= end_year()) {
        throw ConfigurationError("No inflation rate for year " + std::to_string(year));
    }
    return rates_[static_cast<size_t>(year - start_year_)];
}

bool InflationRateSeries::covers(int from_year, int to_year) const {
    if (to_year <= from_year) {
        return true;
    }
    return from_year >= start_year_ && to_year <= end_year();
}

InflationRateSeries InflationRateSeries::load_from_csv(const std::string& filepath,
                                                       const std::string& index_column) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open growth factor file: " + filepath);
    }
    return load_from_csv(file, index_column);
}

InflationRateSeries InflationRateSeries::load_from_csv(std::istream& is,
                                                       const std::string& index_column) {
    io::GrowthFactorReader reader(is, index_column);

    int start_year = 0;
    std::vector<double> rates;
    io::GrowthFactorRow row;

    while (reader.next(row)) {
        if (rates.empty()) {
            start_year = row.year;
        } else if (row.year != start_year + static_cast<int>(rates.size())) {
            throw std::runtime_error("Growth factor CSV years must be contiguous: expected " +
                                     std::to_string(start_year + static_cast<int>(rates.size())) +
                                     ", found " + std::to_string(row.year) +
                                     " at line " + std::to_string(reader.line_number()));
        }

        // A growth factor of 1.0245 is a rate of 0.0245
        rates.push_back(reader.values_are_rates() ? row.value : row.value - 1.0);
    }

    if (rates.empty()) {
        throw std::runtime_error("Growth factor CSV contains no rows");
    }

    return InflationRateSeries(start_year, std::move(rates));
}

// ============================================================================
// Factor construction
// ============================================================================

double final_factor(int prior_year, int final_year, const InflationRateSeries& rates) {
    require_coverage(rates, prior_year, final_year);

    // value[t+1] = value[t] * (1 + rate[t])
    double factor = 1.0;
    for (int year = prior_year; year < final_year; ++year) {
        factor *= 1.0 + rates.get_rate(year);
    }
    return factor;
}

std::map<int, double> window_factors(int base_year, int final_year,
                                     const InflationRateSeries& rates) {
    require_coverage(rates, base_year, final_year);

    std::map<int, double> factors;
    double factor = 1.0;
    for (int year = base_year; year < final_year; ++year) {
        factors[year] = factor;
        factor *= 1.0 + rates.get_rate(year);
    }
    return factors;
}

double index_amount(double value, int from_year, int to_year,
                    const InflationRateSeries& rates, int decimals) {
    if (to_year <= from_year) {
        return value;
    }
    return round_decimals(value * final_factor(from_year, to_year, rates), decimals);
}

} // namespace taxparam
