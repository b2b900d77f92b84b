#pragma once
#include "core/data_source.hpp"
#include "kpi/chunked_reducer.hpp"

namespace ingen {

// Euclidean distance between two points of equal dimensionality
double euclidean_distance(const Point& a, const Point& b);

// Arithmetic mean of the distances from `point` to every point of `set`.
// `set` must not be empty.
double mean_distance(const Point& point, const PointSet& set);

// cross(X, Y) = sum over x in X of mean_distance(x, Y).
// X is chunked across the reducer; every chunk sees all of Y.
double cross_distance(const PointSet& x, const PointSet& y, const ChunkedReducer& reducer);

// (cross(S1, S2) + cross(S2, S1)) / (n1 + n2).
// Throws DegenerateInputError when either set is empty.
double set_to_set_distance(const PointSet& s1, const PointSet& s2, const ChunkedReducer& reducer);

} // namespace ingen
