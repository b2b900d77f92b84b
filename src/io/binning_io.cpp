#include "io/binning_io.hpp"
#include "io/data_source_io.hpp"
#include "core/config_loader.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ingen {

Binning parse_binning_edges(const std::string& text) {
    std::vector<std::vector<double>> edges;

    std::stringstream groups(text);
    std::string group;
    while (std::getline(groups, group, ':')) {
        std::vector<double> dim_edges;
        std::stringstream ss(group);
        std::string token;
        while (std::getline(ss, token, ',')) {
            token = ConfigLoader::trim(token);
            if (token.empty()) continue;
            double v;
            try {
                size_t used = 0;
                v = std::stod(token, &used);
                if (used != token.size()) {
                    throw std::invalid_argument(token);
                }
            } catch (const std::logic_error&) {
                throw std::invalid_argument("'" + text + "' can not be interpreted as list of positive floats.");
            }
            if (!std::isfinite(v) || v < 0.0) {
                throw std::invalid_argument("'" + text + "' can not be interpreted as list of positive floats.");
            }
            dim_edges.push_back(v);
        }

        std::sort(dim_edges.begin(), dim_edges.end());
        dim_edges.erase(std::unique(dim_edges.begin(), dim_edges.end()), dim_edges.end());
        edges.push_back(std::move(dim_edges));
    }

    return Binning(std::move(edges));
}

Binning load_binning(const std::string& path) {
    ConfigLoader loader;
    if (!loader.load(path)) {
        throw std::runtime_error("Failed to load binning file: " + path);
    }
    ConfigSection sec = loader.get_section("binning");
    if (!sec.has("edges")) {
        throw std::runtime_error(path + ": malformed binning file, missing [binning] edges");
    }
    return parse_binning_edges(sec.get("edges"));
}

Binning resolve_binning(const std::string& arg) {
    if (FileExists(arg)) {
        return load_binning(arg);
    }
    Logger::get().info("File %s does not exist, treating it as bin edges...", arg.c_str());
    return parse_binning_edges(arg);
}

} // namespace ingen
