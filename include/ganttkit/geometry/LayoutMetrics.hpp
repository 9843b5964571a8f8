#pragma once
#include <cstddef>

namespace GK {

// Fixed pixel metrics shared by the axis, bars and arrows.
struct LayoutMetrics {
    double header_height     = 50;
    double bar_height        = 20;
    double bar_corner_radius = 3;
    double arrow_curve       = 5;
    double padding           = 18;

    [[nodiscard]] auto row_height() const -> double { return bar_height + padding; }
    [[nodiscard]] auto row_y(std::size_t row) const -> double {
        return header_height + padding + static_cast<double>(row) * row_height();
    }
};

} // namespace GK
