#include <ganttkit/render/SvgDocument.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace GK::Render {

namespace {

auto format_number(double value) -> std::string {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

auto value_to_string(AttributeValue const& value) -> std::string {
    if (auto const* number = std::get_if<double>(&value))
        return format_number(*number);
    return std::get<std::string>(value);
}

auto escape_xml(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        default:
            escaped.push_back(ch);
        }
    }
    return escaped;
}

auto codepoint_count(std::string_view text) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
        return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
    }));
}

auto lookup(Attributes const& attributes, std::string_view key) -> AttributeValue const* {
    for (auto const& [name, value] : attributes) {
        if (name == key)
            return &value;
    }
    return nullptr;
}

auto lookup_number(Attributes const& attributes, std::string_view key) -> double {
    auto const* value = lookup(attributes, key);
    if (value == nullptr)
        return 0;
    if (auto const* number = std::get_if<double>(value))
        return *number;
    return std::strtod(std::get<std::string>(*value).c_str(), nullptr);
}

auto lookup_string(Attributes const& attributes, std::string_view key) -> std::string {
    auto const* value = lookup(attributes, key);
    return value == nullptr ? std::string{} : value_to_string(*value);
}

auto has_class(Attributes const& attributes, std::string_view className) -> bool {
    auto const classes = lookup_string(attributes, "class");
    std::istringstream stream(classes);
    std::string        token;
    while (stream >> token) {
        if (token == className)
            return true;
    }
    return false;
}

auto points_box(std::string const& points) -> BoundingBox {
    std::string normalized = points;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');
    std::istringstream stream(normalized);
    double minX = std::numeric_limits<double>::max(), minY = minX;
    double maxX = std::numeric_limits<double>::lowest(), maxY = maxX;
    double px = 0, py = 0;
    bool   any = false;
    while (stream >> px >> py) {
        minX = std::min(minX, px);
        maxX = std::max(maxX, px);
        minY = std::min(minY, py);
        maxY = std::max(maxY, py);
        any  = true;
    }
    if (!any)
        return BoundingBox{};
    return BoundingBox{.x = minX, .y = minY, .width = maxX - minX, .height = maxY - minY};
}

auto is_empty(BoundingBox const& box) -> bool {
    return box.width == 0 && box.height == 0 && box.x == 0 && box.y == 0;
}

auto unite(BoundingBox const& a, BoundingBox const& b) -> BoundingBox {
    auto const x  = std::min(a.x, b.x);
    auto const y  = std::min(a.y, b.y);
    auto const x2 = std::max(a.x2(), b.x2());
    auto const y2 = std::max(a.y2(), b.y2());
    return BoundingBox{.x = x, .y = y, .width = x2 - x, .height = y2 - y};
}

} // namespace

auto to_string(ShapeKind kind) -> std::string_view {
    switch (kind) {
    case ShapeKind::Group:
        return "g";
    case ShapeKind::Rect:
        return "rect";
    case ShapeKind::Text:
        return "text";
    case ShapeKind::Line:
        return "line";
    case ShapeKind::Path:
        return "path";
    case ShapeKind::Polygon:
        return "polygon";
    }
    return "g";
}

SvgDocument::SvgDocument() {
    nodes_.emplace(kRootId, Node{.kind = ShapeKind::Group});
}

auto SvgDocument::find_node(ShapeHandle handle) -> Node* {
    auto it = nodes_.find(handle.id);
    return it == nodes_.end() ? nullptr : &it->second;
}

auto SvgDocument::find_node(ShapeHandle handle) const -> Node const* {
    auto it = nodes_.find(handle.id);
    return it == nodes_.end() ? nullptr : &it->second;
}

auto SvgDocument::create_shape(ShapeKind kind, ShapeHandle parent, Attributes attributes) -> ShapeHandle {
    auto parentId = parent.valid() && nodes_.contains(parent.id) ? parent.id : kRootId;
    auto id       = nextId_++;
    nodes_.emplace(id, Node{.kind = kind, .parent = parentId, .attributes = std::move(attributes)});
    nodes_[parentId].children.push_back(id);
    return ShapeHandle{id};
}

auto SvgDocument::set_attribute(ShapeHandle handle, std::string_view key, AttributeValue value) -> void {
    auto* node = find_node(handle);
    if (node == nullptr)
        return;
    for (auto& [name, existing] : node->attributes) {
        if (name == key) {
            existing = std::move(value);
            return;
        }
    }
    node->attributes.emplace_back(std::string{key}, std::move(value));
}

auto SvgDocument::get_bounding_box(ShapeHandle handle) const -> BoundingBox {
    auto const* node = find_node(handle);
    if (node == nullptr)
        return BoundingBox{};
    auto const& attrs = node->attributes;
    switch (node->kind) {
    case ShapeKind::Rect:
        return BoundingBox{.x      = lookup_number(attrs, "x"),
                           .y      = lookup_number(attrs, "y"),
                           .width  = lookup_number(attrs, "width"),
                           .height = lookup_number(attrs, "height")};
    case ShapeKind::Text: {
        auto const width = static_cast<double>(codepoint_count(lookup_string(attrs, "text"))) * kGlyphWidth;
        auto       x     = lookup_number(attrs, "x");
        if (lookup_string(attrs, "text-anchor") == "middle")
            x -= width / 2;
        return BoundingBox{.x = x, .y = lookup_number(attrs, "y") - kGlyphHeight, .width = width, .height = kGlyphHeight};
    }
    case ShapeKind::Line: {
        auto const x1 = lookup_number(attrs, "x1");
        auto const y1 = lookup_number(attrs, "y1");
        auto const x2 = lookup_number(attrs, "x2");
        auto const y2 = lookup_number(attrs, "y2");
        return BoundingBox{.x = std::min(x1, x2), .y = std::min(y1, y2), .width = std::abs(x2 - x1), .height = std::abs(y2 - y1)};
    }
    case ShapeKind::Polygon:
        return points_box(lookup_string(attrs, "points"));
    case ShapeKind::Path:
        return BoundingBox{};
    case ShapeKind::Group: {
        BoundingBox box{};
        bool        any = false;
        for (auto child : node->children) {
            auto const childBox = get_bounding_box(ShapeHandle{child});
            if (is_empty(childBox))
                continue;
            box = any ? unite(box, childBox) : childBox;
            any = true;
        }
        return box;
    }
    }
    return BoundingBox{};
}

auto SvgDocument::listen(ShapeHandle handle, Gesture gesture, GestureHandler handler) -> void {
    if (auto* node = find_node(handle))
        node->listeners.emplace_back(gesture, std::move(handler));
}

auto SvgDocument::erase_subtree(std::uint32_t id) -> void {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        return;
    auto const children = it->second.children;
    for (auto child : children)
        erase_subtree(child);
    nodes_.erase(id);
}

auto SvgDocument::remove(ShapeHandle handle) -> void {
    if (handle.id == kRootId)
        return;
    auto* node = find_node(handle);
    if (node == nullptr)
        return;
    if (auto* parentNode = find_node(ShapeHandle{node->parent})) {
        auto& siblings = parentNode->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), handle.id), siblings.end());
    }
    erase_subtree(handle.id);
}

auto SvgDocument::clear() -> void {
    auto const children = nodes_[kRootId].children;
    for (auto child : children)
        erase_subtree(child);
    nodes_[kRootId].children.clear();
}

auto SvgDocument::dispatch(ShapeHandle target, Gesture gesture, PointerEvent const& event) -> bool {
    auto id = target.id;
    while (id != 0) {
        auto const* node = find_node(ShapeHandle{id});
        if (node == nullptr)
            return false;
        std::vector<GestureHandler> handlers;
        for (auto const& [kind, handler] : node->listeners) {
            if (kind == gesture)
                handlers.push_back(handler);
        }
        if (!handlers.empty()) {
            // Handlers may rebuild the document; run copies.
            for (auto const& handler : handlers)
                handler(event);
            return true;
        }
        id = node->parent;
    }
    return false;
}

auto SvgDocument::exists(ShapeHandle handle) const -> bool {
    return find_node(handle) != nullptr;
}

auto SvgDocument::kind(ShapeHandle handle) const -> std::optional<ShapeKind> {
    auto const* node = find_node(handle);
    if (node == nullptr)
        return std::nullopt;
    return node->kind;
}

auto SvgDocument::parent(ShapeHandle handle) const -> ShapeHandle {
    auto const* node = find_node(handle);
    return node == nullptr ? ShapeHandle{} : ShapeHandle{node->parent};
}

auto SvgDocument::children(ShapeHandle handle) const -> std::vector<ShapeHandle> {
    std::vector<ShapeHandle> result;
    if (auto const* node = find_node(handle)) {
        for (auto child : node->children)
            result.push_back(ShapeHandle{child});
    }
    return result;
}

auto SvgDocument::attribute(ShapeHandle handle, std::string_view key) const -> std::optional<AttributeValue> {
    auto const* node = find_node(handle);
    if (node == nullptr)
        return std::nullopt;
    if (auto const* value = lookup(node->attributes, key))
        return *value;
    return std::nullopt;
}

auto SvgDocument::number(ShapeHandle handle, std::string_view key) const -> std::optional<double> {
    auto const value = attribute(handle, key);
    if (!value)
        return std::nullopt;
    if (auto const* number = std::get_if<double>(&*value))
        return *number;
    return std::nullopt;
}

auto SvgDocument::text(ShapeHandle handle, std::string_view key) const -> std::optional<std::string> {
    auto const value = attribute(handle, key);
    if (!value)
        return std::nullopt;
    return value_to_string(*value);
}

auto SvgDocument::collect(std::uint32_t id, std::function<bool(Node const&)> const& predicate, std::vector<ShapeHandle>& out) const -> void {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        return;
    if (predicate(it->second))
        out.push_back(ShapeHandle{id});
    for (auto child : it->second.children)
        collect(child, predicate, out);
}

auto SvgDocument::find_by_class(std::string_view className) const -> std::vector<ShapeHandle> {
    std::vector<ShapeHandle> result;
    collect(kRootId, [&](Node const& node) { return has_class(node.attributes, className); }, result);
    return result;
}

auto SvgDocument::find_by_attribute(std::string_view key, std::string_view value) const -> std::vector<ShapeHandle> {
    std::vector<ShapeHandle> result;
    collect(kRootId, [&](Node const& node) {
        auto const* found = lookup(node.attributes, key);
        return found != nullptr && value_to_string(*found) == value;
    }, result);
    return result;
}

auto SvgDocument::write_node(std::uint32_t id, std::string& out, int depth) const -> void {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        return;
    auto const& node = it->second;
    auto const  tag  = id == kRootId ? std::string_view{"svg"} : to_string(node.kind);

    out.append(static_cast<std::size_t>(depth) * 2, ' ');
    out += '<';
    out += tag;
    if (id == kRootId)
        out += " xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\"";
    std::string content;
    for (auto const& [name, value] : node.attributes) {
        if (name == "text") {
            content = value_to_string(value);
            continue;
        }
        out += ' ';
        out += name;
        out += "=\"";
        out += escape_xml(value_to_string(value));
        out += '"';
    }

    if (node.children.empty() && content.empty()) {
        out += "/>\n";
        return;
    }
    out += '>';
    if (!content.empty()) {
        out += escape_xml(content);
    }
    if (!node.children.empty()) {
        out += '\n';
        for (auto child : node.children)
            write_node(child, out, depth + 1);
        out.append(static_cast<std::size_t>(depth) * 2, ' ');
    }
    out += "</";
    out += tag;
    out += ">\n";
}

auto SvgDocument::serialize() const -> std::string {
    std::string out = "<?xml version=\"1.0\" standalone=\"no\"?>\n";
    write_node(kRootId, out, 0);
    return out;
}

} // namespace GK::Render
