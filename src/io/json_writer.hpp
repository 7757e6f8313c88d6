#ifndef TAXPARAM_IO_JSON_WRITER_HPP
#define TAXPARAM_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../inflation.hpp"
#include "../projector.hpp"

namespace taxparam {
namespace io {

// Write the projected values for (base_year, final_year] as a parameter
// table update, keyed by parameter then year, with the run window and any
// skipped parameters:
//
// {
//   "window": {"prior_year": 2017, "base_year": 2019, "final_year": 2026},
//   "parameters": {"_II_em": {"2020": 4200, ..., "2026": 4900}},
//   "skipped": [{"name": "...", "reason": "..."}]
// }
void write_projection_json(std::ostream& os, const ProjectionReport& report,
                           const YearWindow& window, bool pretty_print = true);

void write_projection_json(const std::string& filepath, const ProjectionReport& report,
                           const YearWindow& window, bool pretty_print = true);

} // namespace io
} // namespace taxparam

#endif // TAXPARAM_IO_JSON_WRITER_HPP
