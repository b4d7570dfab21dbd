#ifndef WASHIWRAP_UNFOLD_STRIP_HPP
#define WASHIWRAP_UNFOLD_STRIP_HPP

#include "face.hpp"
#include <math/transform2.hpp>
#include <geometry/polygon2.hpp>
#include <vector>

namespace washiwrap {

// Slack allowed on the tape width comparison (mm)
constexpr double kWidthTolerance = 1e-6;

// A face laid into the strip plane
struct PlacedFace {
    FaceId face_id = 0;
    AdjacencyId via_edge = kNoAdjacency;   // Hinge used to attach it, none for the root
    FaceId parent = kNoFace;               // Face it was hinged on
    Transform2 transform;                  // Face-local -> strip coordinates
    Polygon2 polygon;                      // Strip coordinates, CCW
};

// Ordered run of placed faces forming one ribbon of tape.
// The ribbon width is the narrowest perpendicular extent of all placed
// points over every direction; it only grows as faces are appended.
class Strip {
public:
    Strip() = default;

    void append(PlacedFace face);

    const std::vector<PlacedFace>& faces() const { return faces_; }
    const PlacedFace& face(size_t index) const { return faces_.at(index); }
    const PlacedFace& back() const { return faces_.back(); }
    size_t size() const { return faces_.size(); }
    bool empty() const { return faces_.empty(); }

    bool contains(FaceId id) const;
    std::vector<FaceId> face_order() const;
    std::vector<Polygon2> polygons() const;

    double ribbon_width() const { return ribbon_width_; }
    const Polygon2& hull() const { return hull_; }

    // Ribbon width the strip would have with one more polygon
    double ribbon_width_with(const Polygon2& extra) const;

    // Rotate so the narrowest direction is vertical and move the bounding
    // box corner to the origin. Afterwards bounds().height() == ribbon_width().
    void normalize();
    bool is_normalized() const { return normalized_; }

    Bounds2 bounds() const;
    double length() const { return bounds().width(); }

private:
    std::vector<PlacedFace> faces_;
    Polygon2 hull_;
    double ribbon_width_ = 0.0;
    bool normalized_ = false;
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_STRIP_HPP
