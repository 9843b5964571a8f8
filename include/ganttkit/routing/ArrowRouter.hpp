#pragma once
#include <ganttkit/geometry/BarGeometry.hpp>

#include <string>

namespace GK {

struct ArrowOptions {
    double padding     = 18;
    double bar_height  = 20;
    double arrow_curve = 5;
};

struct ArrowPath {
    double      start_x   = 0;
    double      start_y   = 0;
    double      end_x     = 0;
    double      end_y     = 0;
    bool        detour    = false;
    bool        clockwise = false;
    std::string d; // SVG path data, ending in a chevron at the end point
};

/**
 * Routes a dependency arrow from the bottom of `from` to the left edge of
 * `to`. When the dependent starts left of the dependency's start plus
 * padding, the path detours: down, back left past the dependent, then
 * across into it.
 */
[[nodiscard]] auto RouteArrow(BarRect const& from, BarRect const& to, ArrowOptions const& options) -> ArrowPath;

} // namespace GK
