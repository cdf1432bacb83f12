#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::components {

/**
 * ComponentType - The kind of content block. The core stores the body as
 * opaque text; the type only selects how a renderer would interpret it.
 */
enum class ComponentType {
    Text,
    Markdown,
    Html,
    Code,
    Image,
    Custom,
    BlogSummary
};

[[nodiscard]] constexpr std::string_view type_name(ComponentType type) {
    switch (type) {
        case ComponentType::Text: return "text";
        case ComponentType::Markdown: return "markdown";
        case ComponentType::Html: return "html";
        case ComponentType::Code: return "code";
        case ComponentType::Image: return "image";
        case ComponentType::Custom: return "custom";
        case ComponentType::BlogSummary: return "blog_summary";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ComponentType> parse_type(std::string_view name) {
    if (name == "text") return ComponentType::Text;
    if (name == "markdown") return ComponentType::Markdown;
    if (name == "html") return ComponentType::Html;
    if (name == "code") return ComponentType::Code;
    if (name == "image") return ComponentType::Image;
    if (name == "custom") return ComponentType::Custom;
    if (name == "blog_summary") return ComponentType::BlogSummary;
    return std::nullopt;
}

inline constexpr std::size_t MAX_TEMPLATE_LENGTH = 50;

/**
 * Component - A content block in a page's draft (or a copy of one in a
 * published snapshot).
 */
struct Component {
    ComponentId id{0};
    PageId page_id{0};
    int position{0};
    ComponentType type{ComponentType::Markdown};
    std::optional<std::string> title;
    std::string body;
    std::string template_name{"default"};
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Component&) const = default;
};

/**
 * Fields supplied when creating a component.
 */
struct NewComponent {
    std::string body;
    std::optional<std::string> title;
    ComponentType type{ComponentType::Markdown};
    std::string template_name{"default"};
};

/**
 * Partial update; unset fields are left alone.
 */
struct ComponentPatch {
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<std::string> template_name;
};

// ============================================================================
// Pure functions
// ============================================================================

/**
 * Check that a template name is usable for a component.
 */
[[nodiscard]] inline Result<void> validate_template(std::string_view template_name) {
    if (template_name.empty()) {
        return Result<void>::err(Error::validation("Template cannot be empty"));
    }
    if (template_name.size() > MAX_TEMPLATE_LENGTH) {
        return Result<void>::err(Error::validation("Template cannot exceed 50 characters"));
    }
    return Result<void>::ok();
}

[[nodiscard]] inline Component with_patch(Component component, const ComponentPatch& patch) {
    if (patch.title) component.title = *patch.title;
    if (patch.body) component.body = *patch.body;
    if (patch.template_name) component.template_name = *patch.template_name;
    component.updated_at = Timestamp::now();
    return component;
}

/**
 * Compare what a reader would see: type, title, body and template.
 * Ids, positions and timestamps are ignored.
 */
[[nodiscard]] inline bool content_equals(const Component& a, const Component& b) {
    return a.type == b.type && a.title == b.title && a.body == b.body &&
           a.template_name == b.template_name;
}

[[nodiscard]] inline bool content_equals(const std::vector<Component>& a,
                                         const std::vector<Component>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!content_equals(a[i], b[i])) return false;
    }
    return true;
}

} // namespace folio::components
