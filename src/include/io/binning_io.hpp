#pragma once
#include "core/binning.hpp"
#include <string>

namespace ingen {

// "e0,e1,...:e0,e1,...", one colon-separated group per dimension.
// Edges are sorted and de-duplicated; negative edges are rejected.
Binning parse_binning_edges(const std::string& text);

// INI file with the edge text under [binning] edges.
Binning load_binning(const std::string& path);

// File if `arg` names one, edge text otherwise.
Binning resolve_binning(const std::string& arg);

} // namespace ingen
