#ifndef TAXPARAM_IO_POLICY_READER_HPP
#define TAXPARAM_IO_POLICY_READER_HPP

#include <istream>
#include <stdexcept>
#include <string>
#include "../parameter.hpp"
#include "../inflation.hpp"

namespace taxparam {
namespace io {

/**
 * @brief Exception thrown when a parameter-table document is malformed
 */
class PolicyParseError : public std::runtime_error {
public:
    explicit PolicyParseError(const std::string& message)
        : std::runtime_error(message) {}
};

// Contents of a parameter-table document
struct PolicyDocument {
    ParameterTable table;
    InflationRateSeries rates;      // empty unless the document carries rates
    bool has_rates;

    PolicyDocument();
};

// Read a parameter-table JSON document:
//
// {
//   "start_year": 2013,
//   "inflation_rates": [0.0148, 0.0159, ...],     (optional, from start_year)
//   "parameters": {
//     "_II_em": {
//       "indexed": true,
//       "value": [3900, 3950, ...],                 (or [[...], [...]] per column)
//       "value_yrs": [2013, 2014, ...],            (optional, defaults to every year)
//       "round_to": [50],                          (optional, defaults to [0.01])
//       "round_dir": "down"                        (optional: "down" | "nearest")
//     }
//   }
// }
//
// "inflation_rates" may also be {"start_year": 2014, "rates": [...]}.
// Throws PolicyParseError naming the offending parameter.
PolicyDocument read_policy_json(const std::string& filepath);
PolicyDocument read_policy_json(std::istream& is);
PolicyDocument parse_policy_json(const std::string& json_string);

} // namespace io
} // namespace taxparam

#endif // TAXPARAM_IO_POLICY_READER_HPP
