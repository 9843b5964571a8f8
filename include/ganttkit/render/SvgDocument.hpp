#pragma once
#include <ganttkit/render/Renderer.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace GK::Render {

/**
 * In-memory renderer that keeps the shape tree and serializes it as SVG.
 * Gestures are injected with dispatch(), which hands the event to the
 * nearest shape (the target or an ancestor) that has a listener for it.
 *
 * Text has no font metrics here: a glyph is taken to be 7px wide and 14px
 * tall, which is enough for label placement decisions.
 */
class SvgDocument final : public Renderer {
public:
    static constexpr double kGlyphWidth  = 7;
    static constexpr double kGlyphHeight = 14;

    SvgDocument();

    [[nodiscard]] auto root() const -> ShapeHandle override { return ShapeHandle{kRootId}; }
    auto create_shape(ShapeKind kind, ShapeHandle parent, Attributes attributes) -> ShapeHandle override;
    auto set_attribute(ShapeHandle handle, std::string_view key, AttributeValue value) -> void override;
    [[nodiscard]] auto get_bounding_box(ShapeHandle handle) const -> BoundingBox override;
    auto listen(ShapeHandle handle, Gesture gesture, GestureHandler handler) -> void override;
    auto remove(ShapeHandle handle) -> void override;
    auto clear() -> void override;

    // Returns false when no listener on the target or its ancestors handled the gesture.
    auto dispatch(ShapeHandle target, Gesture gesture, PointerEvent const& event) -> bool;

    [[nodiscard]] auto exists(ShapeHandle handle) const -> bool;
    [[nodiscard]] auto kind(ShapeHandle handle) const -> std::optional<ShapeKind>;
    [[nodiscard]] auto parent(ShapeHandle handle) const -> ShapeHandle;
    [[nodiscard]] auto children(ShapeHandle handle) const -> std::vector<ShapeHandle>;
    [[nodiscard]] auto attribute(ShapeHandle handle, std::string_view key) const -> std::optional<AttributeValue>;
    [[nodiscard]] auto number(ShapeHandle handle, std::string_view key) const -> std::optional<double>;
    [[nodiscard]] auto text(ShapeHandle handle, std::string_view key) const -> std::optional<std::string>;
    // Shapes whose class list contains the given class, in document order.
    [[nodiscard]] auto find_by_class(std::string_view className) const -> std::vector<ShapeHandle>;
    [[nodiscard]] auto find_by_attribute(std::string_view key, std::string_view value) const -> std::vector<ShapeHandle>;
    [[nodiscard]] auto shape_count() const -> std::size_t { return nodes_.size(); }

    [[nodiscard]] auto serialize() const -> std::string;

private:
    static constexpr std::uint32_t kRootId = 1;

    struct Node {
        ShapeKind                                       kind   = ShapeKind::Group;
        std::uint32_t                                   parent = 0;
        std::vector<std::uint32_t>                      children;
        Attributes                                      attributes;
        std::vector<std::pair<Gesture, GestureHandler>> listeners;
    };

    auto find_node(ShapeHandle handle) -> Node*;
    auto find_node(ShapeHandle handle) const -> Node const*;
    auto erase_subtree(std::uint32_t id) -> void;
    auto collect(std::uint32_t id, std::function<bool(Node const&)> const& predicate, std::vector<ShapeHandle>& out) const -> void;
    auto write_node(std::uint32_t id, std::string& out, int depth) const -> void;

    phmap::flat_hash_map<std::uint32_t, Node> nodes_;
    std::uint32_t                             nextId_ = kRootId + 1;
};

[[nodiscard]] auto to_string(ShapeKind kind) -> std::string_view;

} // namespace GK::Render
