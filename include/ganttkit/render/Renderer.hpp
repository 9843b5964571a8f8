#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace GK::Render {

enum class ShapeKind {
    Group,
    Rect,
    Text,
    Line,
    Path,
    Polygon
};

enum class Gesture {
    Press,
    Move,
    Release,
    Click,
    DoubleClick,
    Scroll
};

struct ShapeHandle {
    std::uint32_t id = 0;

    [[nodiscard]] auto valid() const -> bool { return id != 0; }
    auto operator==(ShapeHandle const&) const -> bool = default;
};

struct BoundingBox {
    double x      = 0;
    double y      = 0;
    double width  = 0;
    double height = 0;

    [[nodiscard]] auto x2() const -> double { return x + width; }
    [[nodiscard]] auto y2() const -> double { return y + height; }
};

using AttributeValue = std::variant<double, std::string>;
using Attributes     = std::vector<std::pair<std::string, AttributeValue>>;

/**
 * Pointer position in chart coordinates. For Scroll, x carries the
 * horizontal scroll offset of the hosting container.
 */
struct PointerEvent {
    double                                x = 0;
    double                                y = 0;
    std::chrono::steady_clock::time_point timestamp{};
};

using GestureHandler = std::function<void(PointerEvent const&)>;

/**
 * Drawing surface the chart renders into. Shapes are addressed by handle;
 * text content is the "text" attribute and CSS classes the "class"
 * attribute. Gestures on a shape without a listener reach its ancestors.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    [[nodiscard]] virtual auto root() const -> ShapeHandle = 0;
    virtual auto create_shape(ShapeKind kind, ShapeHandle parent, Attributes attributes) -> ShapeHandle = 0;
    virtual auto set_attribute(ShapeHandle handle, std::string_view key, AttributeValue value) -> void = 0;
    [[nodiscard]] virtual auto get_bounding_box(ShapeHandle handle) const -> BoundingBox = 0;
    virtual auto listen(ShapeHandle handle, Gesture gesture, GestureHandler handler) -> void = 0;
    virtual auto remove(ShapeHandle handle) -> void = 0;
    // Removes every shape below the root along with its listeners.
    virtual auto clear() -> void = 0;
};

} // namespace GK::Render
