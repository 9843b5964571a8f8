#pragma once
#include <ganttkit/render/Renderer.hpp>

namespace GK::Render {

// Position and size of one rectangular shape, read and written through the renderer.
class ShapeGeometry {
public:
    ShapeGeometry() = default;
    ShapeGeometry(Renderer& renderer, ShapeHandle handle)
        : renderer_(&renderer), handle_(handle) {}

    [[nodiscard]] auto valid() const -> bool { return renderer_ != nullptr && handle_.valid(); }
    [[nodiscard]] auto handle() const -> ShapeHandle { return handle_; }

    [[nodiscard]] auto x() const -> double;
    [[nodiscard]] auto y() const -> double;
    [[nodiscard]] auto width() const -> double;
    [[nodiscard]] auto height() const -> double;
    [[nodiscard]] auto end_x() const -> double { return x() + width(); }

    auto set_x(double value) -> void;
    auto set_y(double value) -> void;
    auto set_width(double value) -> void;

private:
    [[nodiscard]] auto box() const -> BoundingBox;

    Renderer*   renderer_ = nullptr;
    ShapeHandle handle_{};
};

} // namespace GK::Render
