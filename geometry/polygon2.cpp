#include "polygon2.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace washiwrap {

double polygon_signed_area(const Polygon2& poly) {
    if (poly.size() < 3) {
        return 0.0;
    }
    double twice = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        const Vec2& a = poly[i];
        const Vec2& b = poly[(i + 1) % poly.size()];
        twice += a.cross(b);
    }
    return 0.5 * twice;
}

double polygon_area(const Polygon2& poly) {
    return std::abs(polygon_signed_area(poly));
}

Vec2 polygon_centroid(const Polygon2& poly) {
    if (poly.empty()) {
        return {};
    }

    double area = polygon_signed_area(poly);
    if (std::abs(area) <= 1e-15) {
        // Degenerate: fall back to the vertex average
        Vec2 sum;
        for (const auto& p : poly) {
            sum += p;
        }
        return sum / static_cast<double>(poly.size());
    }

    // Relative to the first vertex to limit cancellation far from the origin
    const Vec2 origin = poly[0];
    double cx = 0.0;
    double cy = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        Vec2 a = poly[i] - origin;
        Vec2 b = poly[(i + 1) % poly.size()] - origin;
        double w = a.cross(b);
        cx += (a.x + b.x) * w;
        cy += (a.y + b.y) * w;
    }
    return origin + Vec2(cx, cy) / (6.0 * area);
}

Polygon2 ensure_ccw(Polygon2 poly) {
    if (polygon_signed_area(poly) < 0.0) {
        std::reverse(poly.begin(), poly.end());
    }
    return poly;
}

Bounds2 polygon_bounds(const Polygon2& poly) {
    Bounds2 b;
    if (poly.empty()) {
        return b;
    }
    b.min_x = b.max_x = poly[0].x;
    b.min_y = b.max_y = poly[0].y;
    for (const auto& p : poly) {
        b.min_x = std::min(b.min_x, p.x);
        b.max_x = std::max(b.max_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

Bounds2 bounds_of(const std::vector<Polygon2>& polys) {
    Bounds2 b;
    bool first = true;
    for (const auto& poly : polys) {
        if (poly.empty()) continue;
        Bounds2 pb = polygon_bounds(poly);
        if (first) {
            b = pb;
            first = false;
            continue;
        }
        b.min_x = std::min(b.min_x, pb.min_x);
        b.max_x = std::max(b.max_x, pb.max_x);
        b.min_y = std::min(b.min_y, pb.min_y);
        b.max_y = std::max(b.max_y, pb.max_y);
    }
    return b;
}

Polygon2 translate_polygon(const Polygon2& poly, double dx, double dy) {
    Polygon2 out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.emplace_back(p.x + dx, p.y + dy);
    }
    return out;
}

Polygon2 transform_polygon(const Polygon2& poly, const Transform2& t) {
    Polygon2 out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.push_back(t.apply(p));
    }
    return out;
}

Polygon2 convex_hull(std::vector<Vec2> pts, double eps) {
    if (pts.size() <= 1) {
        return pts;
    }

    std::sort(pts.begin(), pts.end(), [](const Vec2& a, const Vec2& b) {
        if (a.x != b.x) {
            return a.x < b.x;
        }
        return a.y < b.y;
    });

    auto nearly_eq = [&](const Vec2& a, const Vec2& b) {
        return std::abs(a.x - b.x) <= eps && std::abs(a.y - b.y) <= eps;
    };
    pts.erase(std::unique(pts.begin(), pts.end(), nearly_eq), pts.end());

    if (pts.size() <= 2) {
        return pts;
    }

    std::vector<Vec2> lower;
    for (const auto& p : pts) {
        while (lower.size() >= 2 && orient(lower[lower.size() - 2], lower.back(), p) <= eps) {
            lower.pop_back();
        }
        lower.push_back(p);
    }

    std::vector<Vec2> upper;
    for (size_t i = pts.size(); i-- > 0;) {
        const auto& p = pts[i];
        while (upper.size() >= 2 && orient(upper[upper.size() - 2], upper.back(), p) <= eps) {
            upper.pop_back();
        }
        upper.push_back(p);
    }

    lower.pop_back();
    upper.pop_back();
    lower.insert(lower.end(), upper.begin(), upper.end());
    return lower;  // CCW
}

RibbonFit min_width_fit(const std::vector<Vec2>& pts) {
    RibbonFit fit;
    Polygon2 hull = convex_hull(pts);
    if (hull.size() < 2) {
        return fit;
    }
    if (hull.size() == 2) {
        Vec2 d = hull[1] - hull[0];
        fit.angle = std::atan2(d.y, d.x);
        return fit;
    }

    fit.width = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < hull.size(); ++i) {
        const Vec2& a = hull[i];
        const Vec2& b = hull[(i + 1) % hull.size()];
        Vec2 d = (b - a).normalized();
        if (d.length_squared() == 0.0) continue;

        // Hull is CCW, so every point is on the left of the edge
        double extent = 0.0;
        for (const auto& p : hull) {
            extent = std::max(extent, d.cross(p - a));
        }
        if (extent < fit.width) {
            fit.width = extent;
            fit.angle = std::atan2(d.y, d.x);
        }
    }

    // Prefer the representative axis in [-pi/2, pi/2) so strips do not flip
    while (fit.angle >= std::numbers::pi / 2.0) fit.angle -= std::numbers::pi;
    while (fit.angle < -std::numbers::pi / 2.0) fit.angle += std::numbers::pi;
    return fit;
}

double ribbon_width(const std::vector<Vec2>& pts) {
    return min_width_fit(pts).width;
}

Polygon2 remove_collinear(const Polygon2& poly, double eps) {
    if (poly.size() <= 3) {
        return poly;
    }
    Polygon2 out;
    for (size_t i = 0; i < poly.size(); ++i) {
        const Vec2& prev = poly[(i + poly.size() - 1) % poly.size()];
        const Vec2& cur = poly[i];
        const Vec2& next = poly[(i + 1) % poly.size()];
        double len = prev.distance_to(next);
        double dist = len > 0.0 ? std::abs(orient(prev, cur, next)) / len : 0.0;
        bool between = (cur - prev).dot(next - prev) >= 0.0 && (cur - next).dot(prev - next) >= 0.0;
        if (dist <= eps && between) {
            continue;
        }
        out.push_back(cur);
    }
    return out.size() >= 3 ? out : poly;
}

namespace {

// Keeps the part of poly where d.cross(p - a) >= offset
Polygon2 clip_half_plane(const Polygon2& poly, const Vec2& a, const Vec2& d, double offset) {
    Polygon2 out;
    if (poly.empty()) {
        return out;
    }
    auto side = [&](const Vec2& p) { return d.cross(p - a) - offset; };

    for (size_t i = 0; i < poly.size(); ++i) {
        const Vec2& cur = poly[i];
        const Vec2& next = poly[(i + 1) % poly.size()];
        double sc = side(cur);
        double sn = side(next);
        if (sc >= 0.0) {
            out.push_back(cur);
        }
        if ((sc >= 0.0) != (sn >= 0.0)) {
            double t = sc / (sc - sn);
            out.push_back(cur + (next - cur) * t);
        }
    }
    return out;
}

}  // namespace

Polygon2 inset_convex(const Polygon2& poly, double distance) {
    if (distance <= 0.0 || poly.size() < 3) {
        return poly;
    }

    Polygon2 ccw = ensure_ccw(poly);
    Polygon2 result = ccw;
    for (size_t i = 0; i < ccw.size() && !result.empty(); ++i) {
        const Vec2& a = ccw[i];
        const Vec2& b = ccw[(i + 1) % ccw.size()];
        Vec2 d = (b - a).normalized();
        if (d.length_squared() == 0.0) continue;
        result = clip_half_plane(result, a, d, distance);
    }

    if (result.size() < 3 || polygon_area(result) <= 1e-12) {
        return {};
    }
    return result;
}

}  // namespace washiwrap
