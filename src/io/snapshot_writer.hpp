#ifndef TAXPARAM_IO_SNAPSHOT_WRITER_HPP
#define TAXPARAM_IO_SNAPSHOT_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../parameter.hpp"
#include "../inflation.hpp"
#include "../projector.hpp"

namespace taxparam {
namespace io {

// Snapshot format, one block per parameter:
//
//   *** _II_em ***
//   2017: 4050
//   2018: 0
//   ...
//
// Scalars print as plain numbers, per-column values as [a, b, c].

// Historical values for [prior_year, final_year] straight from the table
void write_history_snapshot(std::ostream& os, const ParameterTable& table,
                            const std::vector<std::string>& names,
                            const YearWindow& window);

void write_history_snapshot(const std::string& filepath, const ParameterTable& table,
                            const std::vector<std::string>& names,
                            const YearWindow& window);

// Projected values for [prior_year, final_year], one block per result
void write_projected_snapshot(std::ostream& os,
                              const std::vector<ProjectionResult>& results,
                              const YearWindow& window);

void write_projected_snapshot(const std::string& filepath,
                              const std::vector<ProjectionResult>& results,
                              const YearWindow& window);

} // namespace io
} // namespace taxparam

#endif // TAXPARAM_IO_SNAPSHOT_WRITER_HPP
