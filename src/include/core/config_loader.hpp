#pragma once
#include "compare_config.hpp"
#include <string>
#include <unordered_map>
#include <fstream>
#include <ostream>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace ingen {

/**
 * @brief Configuration section holding key-value pairs
 */
struct ConfigSection {
    std::unordered_map<std::string, std::string> values;

    std::string get(const std::string& key, const std::string& default_val = "") const {
        auto it = values.find(key);
        return (it != values.end()) ? it->second : default_val;
    }

    int get_int(const std::string& key, int default_val = 0) const {
        auto it = values.find(key);
        if (it == values.end()) {
            return default_val;
        }
        try {
            size_t used = 0;
            int v = std::stoi(it->second, &used);
            if (used != it->second.size()) {
                throw std::invalid_argument(it->second);
            }
            return v;
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Config key '" + key + "' is not an integer: " + it->second);
        }
    }

    bool get_bool(const std::string& key, bool default_val = false) const {
        auto it = values.find(key);
        if (it != values.end()) {
            std::string val = it->second;
            std::transform(val.begin(), val.end(), val.begin(), ::tolower);
            return (val == "true" || val == "1" || val == "yes" || val == "on");
        }
        return default_val;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }
};

/**
 * @brief Simple key-value configuration file parser
 *
 * File format (INI-style with sections):
 * ```
 * [compare]
 * n_chunks = 16
 * normalized_distance = true
 *
 * [binning]
 * edges = 0,5,10:0,50,100
 *
 * [logging]
 * level = 2
 * colors = false
 *
 * [report]
 * precision = 6
 * ```
 */
class ConfigLoader {
public:
    std::unordered_map<std::string, ConfigSection> sections;

    /**
     * @brief Load configuration from file
     */
    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        sections.clear();
        std::string current_section = "default";

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);

            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = trim(line.substr(1, line.length() - 2));
                continue;
            }

            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim(line.substr(0, pos));
                std::string value = trim(line.substr(pos + 1));

                // Remove quotes if present
                if (value.size() >= 2 &&
                    ((value.front() == '"' && value.back() == '"') ||
                     (value.front() == '\'' && value.back() == '\''))) {
                    value = value.substr(1, value.length() - 2);
                }

                sections[current_section].values[key] = value;
            }
        }

        return true;
    }

    ConfigSection get_section(const std::string& name) const {
        auto it = sections.find(name);
        if (it != sections.end()) {
            return it->second;
        }
        return ConfigSection{};
    }

    bool has_section(const std::string& name) const {
        return sections.find(name) != sections.end();
    }

    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
            ++start;
        }
        if (start == str.length()) {
            return "";
        }

        size_t end = str.length() - 1;
        while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
            --end;
        }

        return str.substr(start, end - start + 1);
    }
};

/**
 * @brief Load CompareConfig from file
 */
inline CompareConfig load_compare_config(const std::string& filename) {
    ConfigLoader loader;
    if (!loader.load(filename)) {
        throw std::runtime_error("Failed to load configuration file: " + filename);
    }

    CompareConfig config;

    ConfigSection compare_sec = loader.get_section("compare");
    config.n_chunks = compare_sec.get_int("n_chunks", config.n_chunks);
    config.normalized_distance = compare_sec.get_bool("normalized_distance", config.normalized_distance);

    ConfigSection logging_sec = loader.get_section("logging");
    config.log_level = logging_sec.get_int("level", config.log_level);
    config.log_colors = logging_sec.get_bool("colors", config.log_colors);

    ConfigSection report_sec = loader.get_section("report");
    config.precision = report_sec.get_int("precision", config.precision);

    return config;
}

/**
 * @brief Save CompareConfig to file
 */
inline bool save_compare_config(const std::string& filename, const CompareConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# Compare Configuration\n";
    file << "# Auto-generated by INGEN_KPI\n\n";

    file << "[compare]\n";
    file << "n_chunks = " << config.n_chunks << "\n";
    file << "normalized_distance = " << (config.normalized_distance ? "true" : "false") << "\n\n";

    file << "[logging]\n";
    file << "level = " << config.log_level << "\n";
    file << "colors = " << (config.log_colors ? "true" : "false") << "\n\n";

    file << "[report]\n";
    file << "precision = " << config.precision << "\n";

    return true;
}

/**
 * @brief Print configuration summary to stream
 */
inline void print_config_summary(std::ostream& os, const CompareConfig& config) {
    os << "=== Compare Configuration ===\n";
    os << "Distance chunks: " << config.n_chunks << "\n";
    os << "Distance coordinates: " << (config.normalized_distance ? "normalized" : "raw") << "\n";
    os << "Log level: " << config.log_level
       << " (colors " << (config.log_colors ? "on" : "off") << ")\n";
    os << "Report precision: " << config.precision << "\n";
    os << "=============================\n";
}

} // namespace ingen
