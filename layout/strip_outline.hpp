#ifndef WASHIWRAP_LAYOUT_STRIP_OUTLINE_HPP
#define WASHIWRAP_LAYOUT_STRIP_OUTLINE_HPP

#include <geometry/polygon2.hpp>
#include <vector>

namespace washiwrap {

// Corners closer than this (mm) are treated as the same point
constexpr double kOutlineTolerance = 1e-6;

// Boundary loops of the union of polygons that meet edge to edge.
// An edge shared by two polygons (traversed once in each direction) is
// dropped, the remaining edges are chained into closed loops and straight
// runs are collapsed. Polygons that do not touch give one loop each.
std::vector<Polygon2> outline_loops(const std::vector<Polygon2>& polygons,
                                    double tolerance = kOutlineTolerance);

}  // namespace washiwrap

#endif // WASHIWRAP_LAYOUT_STRIP_OUTLINE_HPP
