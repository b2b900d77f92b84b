#pragma once
#include "core/data_source.hpp"
#include <string>

namespace ingen {

// One point per line, coordinates separated by whitespace or commas.
// Blank lines and lines starting with '#' are skipped.
// Throws std::runtime_error on unreadable files, bad tokens or ragged rows.
DataSource read_data_source(const std::string& path);

bool write_data_source(const std::string& path, const DataSource& source);

bool FileExists(const std::string& path);

} // namespace ingen
