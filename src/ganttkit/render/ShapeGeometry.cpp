#include <ganttkit/render/ShapeGeometry.hpp>

namespace GK::Render {

auto ShapeGeometry::box() const -> BoundingBox {
    if (!valid())
        return BoundingBox{};
    return renderer_->get_bounding_box(handle_);
}

auto ShapeGeometry::x() const -> double {
    return box().x;
}

auto ShapeGeometry::y() const -> double {
    return box().y;
}

auto ShapeGeometry::width() const -> double {
    return box().width;
}

auto ShapeGeometry::height() const -> double {
    return box().height;
}

auto ShapeGeometry::set_x(double value) -> void {
    if (valid())
        renderer_->set_attribute(handle_, "x", value);
}

auto ShapeGeometry::set_y(double value) -> void {
    if (valid())
        renderer_->set_attribute(handle_, "y", value);
}

auto ShapeGeometry::set_width(double value) -> void {
    if (valid())
        renderer_->set_attribute(handle_, "width", value);
}

} // namespace GK::Render
