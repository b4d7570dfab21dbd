#ifndef WASHIWRAP_LAYOUT_SVG_WRITER_HPP
#define WASHIWRAP_LAYOUT_SVG_WRITER_HPP

#include "layout_packer.hpp"
#include <string>

namespace washiwrap {

// Presentation settings for the cut/print outline
struct SvgOptions {
    std::string stroke = "#000";
    double stroke_width = 0.1;     // mm
    int precision = 3;             // Decimals in path data
    bool draw_sheet_border = false;  // Light outline of the whole sheet
    bool draw_fold_lines = false;    // Dashed face outlines marking the hinges
    std::string fold_stroke = "#999";
};

// SVG 1.1 document in millimetres, one <g> per copy holding one cut <path>
// per strip and, on request, a dashed <path> per face
class SvgWriter {
public:
    static std::string to_svg(const Layout& layout, const SvgOptions& options = SvgOptions{});

    // Throws std::runtime_error when the file cannot be written
    static void write(const Layout& layout, const std::string& path,
                      const SvgOptions& options = SvgOptions{});

    // "M x,y L x,y ... Z"
    static std::string path_data(const Polygon2& points, int precision = 3);

    // One closed subpath per loop
    static std::string outline_path_data(const std::vector<Polygon2>& loops, int precision = 3);
};

}  // namespace washiwrap

#endif // WASHIWRAP_LAYOUT_SVG_WRITER_HPP
