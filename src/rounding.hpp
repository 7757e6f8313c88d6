#ifndef TAXPARAM_ROUNDING_HPP
#define TAXPARAM_ROUNDING_HPP

#include "parameter.hpp"
#include <vector>

namespace taxparam {

// Which projected year a value belongs to. Only matters for
// RoundingDirection::Default, which rounds intermediate years to cents
// and the final year to whole units.
enum class ProjectionStage {
    Intermediate,
    Final
};

// floor(value / granularity) * granularity, capped at INFINITY_CAP
double round_down(double value, double granularity);

// ceil(value / granularity) * granularity, pulled back one grid step when
// the remainder lies strictly between 0 and granularity / 2.
// An exact midpoint keeps the ceiling (ties round up). Capped at INFINITY_CAP.
double round_nearest(double value, double granularity);

// Round the exact stored value to a number of decimal places, ties to even.
// Not capped.
double round_decimals(double value, int decimals);

// Default rounding: 2 decimals for intermediate years, 0 for the final
// year, capped at INFINITY_CAP
double round_default(double value, ProjectionStage stage);

// Round one number under a direction
double round_scalar(double value, RoundingDirection dir, double granularity,
                    ProjectionStage stage);

// Round a scalar or per-column value. Column idx uses round_to[idx], or
// round_to[0] for every column when round_to has a single entry.
// Throws std::invalid_argument if round_to cannot cover the columns.
Value round_value(const Value& value, RoundingDirection dir,
                  const std::vector<double>& round_to, ProjectionStage stage);

} // namespace taxparam

#endif // TAXPARAM_ROUNDING_HPP
