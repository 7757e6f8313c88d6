#include "rounding.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>

namespace taxparam {

namespace {

// Remainder with the sign of the divisor (floored modulo)
double floored_mod(double value, double divisor) {
    double m = std::fmod(value, divisor);
    if (m != 0.0 && ((m < 0.0) != (divisor < 0.0))) {
        m += divisor;
    }
    return m;
}

double granularity_for(const std::vector<double>& round_to, size_t idx, size_t columns) {
    if (round_to.empty()) {
        throw std::invalid_argument("round_to must not be empty");
    }
    if (round_to.size() == 1) {
        return round_to[0];
    }
    if (round_to.size() != columns) {
        throw std::invalid_argument("round_to has " + std::to_string(round_to.size()) +
                                    " entries for " + std::to_string(columns) + " columns");
    }
    return round_to[idx];
}

} // anonymous namespace

double round_down(double value, double granularity) {
    double rounded = std::floor(value / granularity) * granularity;
    return std::min(rounded, INFINITY_CAP);
}

double round_nearest(double value, double granularity) {
    double rounded = std::ceil(value / granularity) * granularity;
    double remainder = floored_mod(value, granularity);
    if (remainder > 0.0 && remainder < granularity / 2.0) {
        rounded -= granularity;
    }
    return std::min(rounded, INFINITY_CAP);
}

double round_decimals(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    // Fixed-point formatting rounds the stored binary value, not value * 10^n
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(decimals) << value;
    return std::stod(oss.str());
}

double round_default(double value, ProjectionStage stage) {
    int decimals = (stage == ProjectionStage::Final) ? 0 : 2;
    return std::min(INFINITY_CAP, round_decimals(value, decimals));
}

double round_scalar(double value, RoundingDirection dir, double granularity,
                    ProjectionStage stage) {
    switch (dir) {
        case RoundingDirection::Down:
            return round_down(value, granularity);
        case RoundingDirection::Nearest:
            return round_nearest(value, granularity);
        case RoundingDirection::Default:
        default:
            return round_default(value, stage);
    }
}

Value round_value(const Value& value, RoundingDirection dir,
                  const std::vector<double>& round_to, ProjectionStage stage) {
    if (const auto* columns = std::get_if<std::vector<double>>(&value)) {
        std::vector<double> rounded;
        rounded.reserve(columns->size());
        for (size_t idx = 0; idx < columns->size(); ++idx) {
            double g = granularity_for(round_to, idx, columns->size());
            rounded.push_back(round_scalar((*columns)[idx], dir, g, stage));
        }
        return rounded;
    }
    return round_scalar(std::get<double>(value), dir,
                        granularity_for(round_to, 0, 1), stage);
}

} // namespace taxparam
