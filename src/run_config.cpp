#include "run_config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace taxparam {

RunConfig::RunConfig()
    : index_column("ACPIU"),
      prior_year(2017),
      base_year(2019),
      final_year(2026),
      skip{"_II_brk7", "_PT_brk7"},
      on_invalid(InvalidParameterPolicy::Skip),
      old_path("ppp.old"),
      new_path("ppp.new") {}

YearWindow RunConfig::window() const {
    return YearWindow(prior_year, base_year, final_year);
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++; // Skip '}'
        }

        // A lone '$' is kept as-is
        if (name_end == name_start) {
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty() || config_file_path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

std::string strip_source_scheme(const std::string& source) {
    const std::string local_prefix = "local://";
    if (source.compare(0, local_prefix.size(), local_prefix) == 0) {
        return source.substr(local_prefix.size());
    }
    if (source.find("://") != std::string::npos) {
        throw ConfigParseError("Unsupported source scheme (use local:// or a plain path): " + source);
    }
    return source;
}

namespace {

std::string read_path(const json& j, const std::string& config_file_path) {
    std::string raw = expand_environment_variables(j.get<std::string>());
    return resolve_relative_path(strip_source_scheme(raw), config_file_path);
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& config_file_path) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Run configuration must be a JSON object");
        }

        if (j.contains("policy")) {
            config.policy_path = read_path(j["policy"], config_file_path);
        }

        // Inflation source: plain path or {"source": ..., "column": ...}
        if (j.contains("inflation")) {
            const auto& inflation = j["inflation"];
            if (inflation.is_string()) {
                config.growfactors_path = read_path(inflation, config_file_path);
            } else {
                if (inflation.contains("source")) {
                    config.growfactors_path = read_path(inflation["source"], config_file_path);
                }
                if (inflation.contains("column")) {
                    config.index_column = inflation["column"].get<std::string>();
                }
            }
        }

        if (j.contains("years")) {
            const auto& years = j["years"];
            if (years.contains("prior")) config.prior_year = years["prior"].get<int>();
            if (years.contains("base")) config.base_year = years["base"].get<int>();
            if (years.contains("final")) config.final_year = years["final"].get<int>();
        }

        // An explicit skip list replaces the defaults
        if (j.contains("skip")) {
            config.skip.clear();
            for (const auto& name : j["skip"]) {
                config.skip.insert(name.get<std::string>());
            }
        }

        if (j.contains("on_invalid_parameter")) {
            try {
                config.on_invalid = string_to_policy(j["on_invalid_parameter"].get<std::string>());
            } catch (const std::invalid_argument& e) {
                throw ConfigParseError(e.what());
            }
        }

        if (j.contains("output")) {
            const auto& output = j["output"];
            if (output.contains("old")) config.old_path = read_path(output["old"], config_file_path);
            if (output.contains("new")) config.new_path = read_path(output["new"], config_file_path);
            if (output.contains("json")) config.json_path = read_path(output["json"], config_file_path);
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) config.logging.enable_json = logging["json"].get<bool>();
            if (logging.contains("console")) config.logging.enable_console = logging["console"].get<bool>();
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = read_path(logging["file"], config_file_path);
            }
        }

    } catch (const json::exception& e) {
        throw ConfigParseError("Failed to parse run configuration: " + std::string(e.what()));
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open run configuration: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_run_config_from_string(buffer.str(), file_path);
}

} // namespace taxparam
