#ifndef TAXPARAM_INFLATION_HPP
#define TAXPARAM_INFLATION_HPP

#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace taxparam {

// Raised for an invalid year window or an inflation series that does not
// cover the years a projection needs. Fatal for the whole run.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// The three years that drive a projection run
// prior_year: last year before the reform regime (source of final-year values)
// base_year:  last year with authoritative historical values
// final_year: year in which indexed values revert
struct YearWindow {
    int prior_year;
    int base_year;
    int final_year;

    // Throws ConfigurationError unless prior_year < base_year < final_year
    YearWindow(int prior, int base, int reverting);

    void validate() const;
};

// InflationRateSeries: per-year inflation rates starting at start_year
// rate(y) = rates_[y - start_year]
class InflationRateSeries {
public:
    InflationRateSeries();
    InflationRateSeries(int start_year, std::vector<double> rates);

    int start_year() const { return start_year_; }

    // One past the last year with a rate
    int end_year() const { return start_year_ + static_cast<int>(rates_.size()); }

    // Throws ConfigurationError if no rate is defined for year
    double get_rate(int year) const;

    // True when a rate exists for every year in [from_year, to_year)
    bool covers(int from_year, int to_year) const;

    size_t size() const { return rates_.size(); }
    bool empty() const { return rates_.empty(); }
    const std::vector<double>& rates() const { return rates_; }

    // Load from a growth-factor CSV. The first column is the year.
    // A "rate" column is used as-is; otherwise index_column holds growth
    // factors and each rate is factor - 1. Years must be contiguous.
    static InflationRateSeries load_from_csv(const std::string& filepath,
                                             const std::string& index_column = "ACPIU");
    static InflationRateSeries load_from_csv(std::istream& is,
                                             const std::string& index_column = "ACPIU");

private:
    int start_year_;
    std::vector<double> rates_;
};

// Product of (1 + rate[y]) for y in [prior_year, final_year)
// Projects a value known at prior_year straight to final_year.
double final_factor(int prior_year, int final_year, const InflationRateSeries& rates);

// For each y in [base_year, final_year): compounded multiplier from base_year
// up to but not including y. window_factors(...)[base_year] == 1.0
std::map<int, double> window_factors(int base_year, int final_year,
                                     const InflationRateSeries& rates);

// Index a single amount from from_year to to_year and round to decimals
// places. Returns value unchanged when to_year <= from_year.
double index_amount(double value, int from_year, int to_year,
                    const InflationRateSeries& rates, int decimals = 2);

} // namespace taxparam

#endif // TAXPARAM_INFLATION_HPP
