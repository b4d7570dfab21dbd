#ifndef WASHIWRAP_LAYOUT_LAYOUT_PACKER_HPP
#define WASHIWRAP_LAYOUT_LAYOUT_PACKER_HPP

#include <geometry/polygon2.hpp>
#include <unfold/strip.hpp>
#include <vector>

namespace washiwrap {

// Configuration for packing strips onto the tape
struct LayoutConfig {
    // Inward offset of every face polygon (mm)
    double shrink = 0.0;

    // Horizontal spacing between strips and between copies (mm)
    double gap = 2.0;

    // Border around the whole sheet (mm)
    double margin = 1.0;

    // Number of copies of the full set of strips
    int duplicates = 1;

    // Sheet limits (mm), 0 = unlimited
    double max_sheet_width = 0.0;
    double max_sheet_height = 0.0;
};

// One face polygon in sheet coordinates
struct LayoutPolygon {
    FaceId face_id = kNoFace;
    size_t strip_index = 0;
    size_t copy_index = 0;
    Polygon2 points;
};

// Cut line of one strip: the boundary of its faces merged along the hinges.
// Faces kept apart by a shrink give one loop each.
struct LayoutOutline {
    size_t strip_index = 0;
    size_t copy_index = 0;
    std::vector<Polygon2> loops;
};

// Final sheet: mm, origin top-left, y down
struct Layout {
    std::vector<LayoutPolygon> polygons;
    std::vector<LayoutOutline> outlines;
    double sheet_width = 0.0;
    double sheet_height = 0.0;
    double copy_width = 0.0;     // Width of one set of strips without gaps around it
    size_t strip_count = 0;
    size_t copy_count = 0;

    std::vector<const LayoutPolygon*> copy(size_t index) const;
    std::vector<const LayoutOutline*> copy_outlines(size_t index) const;
};

// Lays strips left to right in a tape-wide band, repeats the set and adds
// the margin. Deterministic: the same input always gives the same layout.
class LayoutPacker {
public:
    static Layout pack(const std::vector<Strip>& strips, double tape_width,
                       const LayoutConfig& config = LayoutConfig{});

    // Throws std::invalid_argument on out-of-range values
    static void validate(const LayoutConfig& config);
};

}  // namespace washiwrap

#endif // WASHIWRAP_LAYOUT_LAYOUT_PACKER_HPP
