#include "layout_packer.hpp"
#include "strip_outline.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <sstream>
#include <stdexcept>

namespace washiwrap {

std::vector<const LayoutPolygon*> Layout::copy(size_t index) const {
    std::vector<const LayoutPolygon*> result;
    for (const auto& p : polygons) {
        if (p.copy_index == index) {
            result.push_back(&p);
        }
    }
    return result;
}

std::vector<const LayoutOutline*> Layout::copy_outlines(size_t index) const {
    std::vector<const LayoutOutline*> result;
    for (const auto& o : outlines) {
        if (o.copy_index == index) {
            result.push_back(&o);
        }
    }
    return result;
}

void LayoutPacker::validate(const LayoutConfig& config) {
    if (config.shrink < 0.0) {
        throw std::invalid_argument("shrink must not be negative");
    }
    if (config.gap < 0.0) {
        throw std::invalid_argument("gap must not be negative");
    }
    if (config.margin < 0.0) {
        throw std::invalid_argument("margin must not be negative");
    }
    if (config.duplicates < 1) {
        throw std::invalid_argument("duplicates must be at least 1");
    }
    if (config.max_sheet_width < 0.0 || config.max_sheet_height < 0.0) {
        throw std::invalid_argument("maximum sheet size must not be negative");
    }
}

Layout LayoutPacker::pack(const std::vector<Strip>& strips, double tape_width, const LayoutConfig& config) {
    auto log = washiwrap::logging::get_logger();

    validate(config);
    if (!(tape_width > 0.0)) {
        throw std::invalid_argument("tape width must be positive");
    }
    if (strips.empty()) {
        throw std::invalid_argument("no strips to lay out");
    }

    // Set of strips for one copy, positioned relative to (0, 0)
    std::vector<LayoutPolygon> set;
    std::vector<LayoutOutline> set_outlines;
    double cursor = 0.0;
    for (size_t s = 0; s < strips.size(); ++s) {
        Strip strip = strips[s];
        if (strip.empty()) {
            throw std::invalid_argument("strip " + std::to_string(s) + " is empty");
        }
        if (!strip.is_normalized()) {
            strip.normalize();
        }
        if (strip.ribbon_width() > tape_width + kWidthTolerance) {
            throw std::invalid_argument("strip " + std::to_string(s) + " is " +
                                        std::to_string(strip.ribbon_width()) +
                                        " mm wide, tape is " + std::to_string(tape_width) + " mm");
        }

        Bounds2 b = strip.bounds();
        double dx = cursor - b.min_x;
        double dy = (tape_width - b.height()) / 2.0 - b.min_y;

        std::vector<Polygon2> strip_polygons;
        for (const auto& placed : strip.faces()) {
            Polygon2 poly = placed.polygon;
            if (config.shrink > 0.0) {
                Polygon2 shrunk = inset_convex(poly, config.shrink);
                if (shrunk.empty()) {
                    log->warn("Shrink of {:.3f} mm removes face {}; keeping it unshrunk",
                              config.shrink, placed.face_id);
                } else {
                    poly = std::move(shrunk);
                }
            }

            LayoutPolygon lp;
            lp.face_id = placed.face_id;
            lp.strip_index = s;
            lp.points = translate_polygon(poly, dx, dy);
            strip_polygons.push_back(lp.points);
            set.push_back(std::move(lp));
        }

        LayoutOutline outline;
        outline.strip_index = s;
        outline.loops = outline_loops(strip_polygons);
        set_outlines.push_back(std::move(outline));

        cursor += b.width() + config.gap;
    }
    double set_width = cursor - config.gap;

    Layout layout;
    layout.strip_count = strips.size();
    layout.copy_count = static_cast<size_t>(config.duplicates);
    layout.copy_width = set_width;
    layout.polygons.reserve(set.size() * layout.copy_count);
    layout.outlines.reserve(set_outlines.size() * layout.copy_count);
    for (size_t k = 0; k < layout.copy_count; ++k) {
        double offset_x = config.margin + static_cast<double>(k) * (set_width + config.gap);
        for (const auto& lp : set) {
            LayoutPolygon copy = lp;
            copy.copy_index = k;
            copy.points = translate_polygon(lp.points, offset_x, config.margin);
            layout.polygons.push_back(std::move(copy));
        }
        for (const auto& outline : set_outlines) {
            LayoutOutline copy;
            copy.strip_index = outline.strip_index;
            copy.copy_index = k;
            for (const auto& loop : outline.loops) {
                copy.loops.push_back(translate_polygon(loop, offset_x, config.margin));
            }
            layout.outlines.push_back(std::move(copy));
        }
    }

    double content_width = static_cast<double>(layout.copy_count) * set_width +
                           static_cast<double>(layout.copy_count - 1) * config.gap;
    layout.sheet_width = content_width + 2.0 * config.margin;
    layout.sheet_height = tape_width + 2.0 * config.margin;

    if (config.max_sheet_width > 0.0 && layout.sheet_width > config.max_sheet_width) {
        std::ostringstream ss;
        ss << "sheet width " << layout.sheet_width << " mm exceeds maximum " << config.max_sheet_width << " mm";
        throw LayoutOverflowError(ss.str());
    }
    if (config.max_sheet_height > 0.0 && layout.sheet_height > config.max_sheet_height) {
        std::ostringstream ss;
        ss << "sheet height " << layout.sheet_height << " mm exceeds maximum " << config.max_sheet_height << " mm";
        throw LayoutOverflowError(ss.str());
    }

    log->info("Layout: {} strip(s) x {} cop(ies), sheet {:.2f} x {:.2f} mm",
              layout.strip_count, layout.copy_count, layout.sheet_width, layout.sheet_height);
    return layout;
}

}  // namespace washiwrap
