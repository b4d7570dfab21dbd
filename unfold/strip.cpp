#include "strip.hpp"
#include <algorithm>

namespace washiwrap {

void Strip::append(PlacedFace face) {
    std::vector<Vec2> pts = hull_;
    pts.insert(pts.end(), face.polygon.begin(), face.polygon.end());
    hull_ = convex_hull(std::move(pts));
    ribbon_width_ = min_width_fit(hull_).width;
    faces_.push_back(std::move(face));
    normalized_ = false;
}

bool Strip::contains(FaceId id) const {
    return std::any_of(faces_.begin(), faces_.end(),
                       [id](const PlacedFace& f) { return f.face_id == id; });
}

std::vector<FaceId> Strip::face_order() const {
    std::vector<FaceId> order;
    order.reserve(faces_.size());
    for (const auto& f : faces_) {
        order.push_back(f.face_id);
    }
    return order;
}

std::vector<Polygon2> Strip::polygons() const {
    std::vector<Polygon2> result;
    result.reserve(faces_.size());
    for (const auto& f : faces_) {
        result.push_back(f.polygon);
    }
    return result;
}

double Strip::ribbon_width_with(const Polygon2& extra) const {
    std::vector<Vec2> pts = hull_;
    pts.insert(pts.end(), extra.begin(), extra.end());
    return washiwrap::ribbon_width(pts);
}

void Strip::normalize() {
    if (faces_.empty()) {
        normalized_ = true;
        return;
    }

    RibbonFit fit = min_width_fit(hull_);
    Transform2 rotate = Transform2::rotation(-fit.angle);
    Bounds2 rotated = polygon_bounds(transform_polygon(hull_, rotate));
    Transform2 to_origin = Transform2::translate({-rotated.min_x, -rotated.min_y}).compose(rotate);

    for (auto& f : faces_) {
        f.polygon = transform_polygon(f.polygon, to_origin);
        f.transform = to_origin.compose(f.transform);
    }
    hull_ = transform_polygon(hull_, to_origin);
    normalized_ = true;
}

Bounds2 Strip::bounds() const {
    return bounds_of(polygons());
}

}  // namespace washiwrap
