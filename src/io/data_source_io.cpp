#include "io/data_source_io.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ingen {

DataSource read_data_source(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open data source: " + path);
    }

    PointSet points;
    int dims = -1;
    int line_no = 0;

    std::string line;
    while (std::getline(file, line)) {
        ++line_no;
        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream iss(line);
        std::string token;
        Point p;
        while (iss >> token) {
            if (p.empty() && token[0] == '#') break;
            double v = 0.0;
            try {
                size_t used = 0;
                v = std::stod(token, &used);
                if (used != token.size()) {
                    throw std::invalid_argument(token);
                }
            } catch (const std::logic_error&) {
                throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                         ": not a number: '" + token + "'");
            }
            if (!std::isfinite(v)) {
                throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                         ": coordinate is not finite: '" + token + "'");
            }
            p.push_back(v);
        }
        if (p.empty()) continue;

        if (dims < 0) {
            dims = static_cast<int>(p.size());
        } else if (static_cast<int>(p.size()) != dims) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected " +
                                     std::to_string(dims) + " coordinates, found " +
                                     std::to_string(p.size()));
        }
        points.push_back(std::move(p));
    }

    return DataSource(std::move(points), dims < 0 ? 0 : dims);
}

bool write_data_source(const std::string& path, const DataSource& source) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return false;
    }

    out << "# " << source.size() << " points, " << source.dimensions() << " dimensions\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& p : source.points(false)) {
        for (std::size_t d = 0; d < p.size(); ++d) {
            if (d > 0) out << "\t";
            out << p[d];
        }
        out << "\n";
    }
    return out.good();
}

bool FileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // namespace ingen
