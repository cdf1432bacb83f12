#pragma once

#include "core/types.hpp"
#include <string>
#include <optional>
#include <string_view>
#include <vector>

namespace folio {

inline constexpr std::string_view DEFAULT_TEMPLATE = "default";
inline constexpr std::size_t MAX_KEYWORDS_LENGTH = 255;

/**
 * Page - A node of the site tree.
 *
 * Exactly one page (the root) has no parent. position is the page's dense
 * 0-based index among its siblings and is maintained by PageTree.
 */
struct Page {
    PageId id{0};
    std::optional<PageId> parent_id;
    std::string title;
    std::string slug;
    int position{0};
    std::string template_name{DEFAULT_TEMPLATE};
    std::optional<std::string> description;
    std::optional<std::string> keywords;
    Timestamp created_at;
    Timestamp updated_at;

    [[nodiscard]] bool is_root() const noexcept { return !parent_id.has_value(); }

    bool operator==(const Page&) const = default;
};

/**
 * PageView - A page plus the attributes derived from its place in the tree.
 */
struct PageView {
    Page page;
    std::string path;
    bool has_children{false};

    bool operator==(const PageView&) const = default;
};

/**
 * PageNode - A page with its ordered children, as returned by list_tree.
 */
struct PageNode {
    PageView view;
    std::vector<PageNode> children;

    bool operator==(const PageNode&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Page make_page(
    PageId id,
    std::optional<PageId> parent_id,
    std::string title,
    std::string slug,
    std::string template_name = std::string(DEFAULT_TEMPLATE)
) {
    auto now = Timestamp::now();
    return Page{
        .id = id,
        .parent_id = parent_id,
        .title = std::move(title),
        .slug = std::move(slug),
        .position = 0,
        .template_name = std::move(template_name),
        .description = std::nullopt,
        .keywords = std::nullopt,
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Page with_title(Page page, std::string title) {
    page.title = std::move(title);
    page.updated_at = Timestamp::now();
    return page;
}

[[nodiscard]] inline Page with_template(Page page, std::string template_name) {
    page.template_name = std::move(template_name);
    page.updated_at = Timestamp::now();
    return page;
}

[[nodiscard]] inline Page with_description(Page page, std::optional<std::string> description) {
    page.description = std::move(description);
    page.updated_at = Timestamp::now();
    return page;
}

[[nodiscard]] inline Page with_keywords(Page page, std::optional<std::string> keywords) {
    page.keywords = std::move(keywords);
    page.updated_at = Timestamp::now();
    return page;
}

[[nodiscard]] inline Page with_slug(Page page, std::string slug) {
    page.slug = std::move(slug);
    page.updated_at = Timestamp::now();
    return page;
}

[[nodiscard]] inline Page with_parent(Page page, std::optional<PageId> parent_id) {
    page.parent_id = parent_id;
    page.updated_at = Timestamp::now();
    return page;
}

/**
 * Count the pages in a tree returned by list_tree.
 */
[[nodiscard]] inline std::size_t count_nodes(const PageNode& node) {
    std::size_t n = 1;
    for (const auto& child : node.children) {
        n += count_nodes(child);
    }
    return n;
}

} // namespace folio
