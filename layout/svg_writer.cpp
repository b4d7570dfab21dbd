#include "svg_writer.hpp"
#include <common/logging.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace washiwrap {

std::string SvgWriter::path_data(const Polygon2& points, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision);
    for (size_t i = 0; i < points.size(); ++i) {
        ss << (i == 0 ? "M " : " L ") << points[i].x << "," << points[i].y;
    }
    if (!points.empty()) {
        ss << " Z";
    }
    return ss.str();
}

std::string SvgWriter::outline_path_data(const std::vector<Polygon2>& loops, int precision) {
    std::string d;
    for (const auto& loop : loops) {
        if (loop.empty()) continue;
        if (!d.empty()) {
            d += ' ';
        }
        d += path_data(loop, precision);
    }
    return d;
}

std::string SvgWriter::to_svg(const Layout& layout, const SvgOptions& options) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(options.precision);

    ss << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n";
    ss << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\""
       << " width=\"" << layout.sheet_width << "mm\""
       << " height=\"" << layout.sheet_height << "mm\""
       << " viewBox=\"0 0 " << layout.sheet_width << " " << layout.sheet_height << "\">\n";
    ss << "  <!-- washiwrap: " << layout.strip_count << " strip(s), "
       << layout.copy_count << " cop(ies) -->\n";

    for (size_t k = 0; k < layout.copy_count; ++k) {
        ss << "  <g id=\"copy-" << k << "\" fill=\"none\" stroke=\"" << options.stroke
           << "\" stroke-width=\"" << options.stroke_width << "\">\n";
        for (const LayoutOutline* o : layout.copy_outlines(k)) {
            ss << "    <path class=\"cut\" data-strip=\"" << o->strip_index
               << "\" fill=\"none\" stroke=\"" << options.stroke
               << "\" stroke-width=\"" << options.stroke_width
               << "\" d=\"" << outline_path_data(o->loops, options.precision) << "\"/>\n";
        }
        if (options.draw_fold_lines) {
            for (const LayoutPolygon* p : layout.copy(k)) {
                ss << "    <path class=\"fold\" data-face=\"" << p->face_id << "\" data-strip=\""
                   << p->strip_index << "\" fill=\"none\" stroke=\"" << options.fold_stroke
                   << "\" stroke-width=\"" << options.stroke_width
                   << "\" stroke-dasharray=\"1,1\" d=\"" << path_data(p->points, options.precision)
                   << "\"/>\n";
            }
        }
        ss << "  </g>\n";
    }

    if (options.draw_sheet_border) {
        ss << "  <rect x=\"0\" y=\"0\" width=\"" << layout.sheet_width << "\" height=\""
           << layout.sheet_height << "\" fill=\"none\" stroke=\"#ccc\" stroke-width=\""
           << options.stroke_width << "\"/>\n";
    }

    ss << "</svg>\n";
    return ss.str();
}

void SvgWriter::write(const Layout& layout, const std::string& path, const SvgOptions& options) {
    auto log = washiwrap::logging::get_logger();

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    out << to_svg(layout, options);
    if (!out) {
        throw std::runtime_error("Failed writing SVG: " + path);
    }
    log->debug("Wrote SVG to {}", path);
}

}  // namespace washiwrap
