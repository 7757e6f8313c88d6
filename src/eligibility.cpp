#include "eligibility.hpp"

namespace taxparam {

std::vector<std::string> select_reverting_parameters(
    const ParameterTable& table,
    int final_year,
    const std::set<std::string>& exclusions)
{
    std::vector<std::string> names;

    // records() iterates in name order, so the result is already sorted
    for (const auto& [name, record] : table.records()) {
        if (!record.indexed) continue;
        if (record.value_years.count(final_year) == 0) continue;
        if (exclusions.count(name) > 0) continue;
        names.push_back(name);
    }

    return names;
}

} // namespace taxparam
