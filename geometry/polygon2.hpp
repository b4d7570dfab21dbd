#ifndef WASHIWRAP_GEOMETRY_POLYGON2_HPP
#define WASHIWRAP_GEOMETRY_POLYGON2_HPP

#include <math/vec2.hpp>
#include <math/transform2.hpp>
#include <vector>

namespace washiwrap {

using Polygon2 = std::vector<Vec2>;

// Axis-aligned bounding box
struct Bounds2 {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

// Narrowest direction of a point set
struct RibbonFit {
    double width = 0.0;   // Perpendicular extent along the narrowest direction
    double angle = 0.0;   // Angle (radians) of the ribbon axis; rotate by -angle to lay it along +x
};

double polygon_signed_area(const Polygon2& poly);
double polygon_area(const Polygon2& poly);
Vec2 polygon_centroid(const Polygon2& poly);
Polygon2 ensure_ccw(Polygon2 poly);

Bounds2 polygon_bounds(const Polygon2& poly);
Bounds2 bounds_of(const std::vector<Polygon2>& polys);

Polygon2 translate_polygon(const Polygon2& poly, double dx, double dy);
Polygon2 transform_polygon(const Polygon2& poly, const Transform2& t);

// Andrew's monotone chain; returns CCW hull without collinear points
Polygon2 convex_hull(std::vector<Vec2> pts, double eps = 1e-12);

// Minimum width over all directions. Exact: the optimum is attained with one
// hull edge on the supporting line.
RibbonFit min_width_fit(const std::vector<Vec2>& pts);
double ribbon_width(const std::vector<Vec2>& pts);

// Drops vertices lying on the segment between their neighbours
Polygon2 remove_collinear(const Polygon2& poly, double eps = 1e-9);

// Moves every edge of a convex CCW polygon inward by distance.
// Returns an empty polygon when nothing is left.
Polygon2 inset_convex(const Polygon2& poly, double distance);

}  // namespace washiwrap

#endif // WASHIWRAP_GEOMETRY_POLYGON2_HPP
