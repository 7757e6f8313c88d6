#ifndef TAXPARAM_ELIGIBILITY_HPP
#define TAXPARAM_ELIGIBILITY_HPP

#include "parameter.hpp"
#include <set>
#include <string>
#include <vector>

namespace taxparam {

// Parameters whose values revert in final_year: indexed, with an
// authoritative value recorded for final_year, and not named in exclusions.
// Names are returned sorted.
//
// Exclusion is by name only. Parameters that carry the INFINITY_CAP
// sentinel at final_year by law must be listed by the caller.
std::vector<std::string> select_reverting_parameters(
    const ParameterTable& table,
    int final_year,
    const std::set<std::string>& exclusions
);

} // namespace taxparam

#endif // TAXPARAM_ELIGIBILITY_HPP
