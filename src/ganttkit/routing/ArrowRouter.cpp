#include <ganttkit/routing/ArrowRouter.hpp>

#include <sstream>

namespace GK {

namespace {

constexpr double kStartStep = 10;

} // namespace

auto RouteArrow(BarRect const& from, BarRect const& to, ArrowOptions const& options) -> ArrowPath {
    auto const padding = options.padding;
    auto const curve   = options.arrow_curve;

    ArrowPath path;
    path.start_x = from.center_x();
    while (to.x < path.start_x + padding && path.start_x > from.x + padding)
        path.start_x -= kStartStep;

    path.start_y = from.y + options.bar_height;
    path.end_x   = to.x - padding / 2;
    path.end_y   = to.y + options.bar_height / 2;

    bool const fromIsBelowTo = from.y > to.y;
    path.clockwise           = fromIsBelowTo;
    int const    sweep       = fromIsBelowTo ? 1 : 0;
    double const curveY      = fromIsBelowTo ? -curve : curve;
    double const offset      = fromIsBelowTo ? path.end_y + curve : path.end_y - curve;

    std::ostringstream d;
    if (to.x < from.x + padding) {
        path.detour       = true;
        auto const down1  = padding / 2 - curve;
        auto const down2  = to.y + to.height / 2 - curveY;
        auto const left   = to.x - padding;
        d << "M " << path.start_x << ' ' << path.start_y
          << " v " << down1
          << " a " << curve << ' ' << curve << " 0 0 1 " << -curve << ' ' << curve
          << " H " << left
          << " a " << curve << ' ' << curve << " 0 0 " << sweep << ' ' << -curve << ' ' << curveY
          << " V " << down2
          << " a " << curve << ' ' << curve << " 0 0 " << sweep << ' ' << curve << ' ' << curveY
          << " L " << path.end_x << ' ' << path.end_y;
    } else {
        d << "M " << path.start_x << ' ' << path.start_y
          << " V " << offset
          << " a " << curve << ' ' << curve << " 0 0 " << sweep << ' ' << curve << ' ' << curveY
          << " L " << path.end_x << ' ' << path.end_y;
    }
    d << " m -5 -5 l 5 5 l -5 5";
    path.d = d.str();
    return path;
}

} // namespace GK
