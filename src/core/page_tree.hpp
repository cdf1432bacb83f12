#pragma once

#include "core/page.hpp"
#include "core/result.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace folio {

/**
 * Arguments for PageTree::create.
 */
struct NewPage {
    PageId parent_id{0};
    std::string title;
    std::optional<std::string> slug;
    std::optional<std::string> template_name;
    std::optional<int> position;
    std::optional<std::string> description;
    std::optional<std::string> keywords;
};

/**
 * Partial page update; unset fields are left alone. A new title never
 * changes the slug; only an explicit slug does.
 */
struct PagePatch {
    std::optional<std::string> title;
    std::optional<std::string> slug;
    std::optional<std::string> template_name;
    std::optional<std::string> description;
    std::optional<std::string> keywords;
};

/**
 * PageTree - Owns the parent/child graph of a site.
 *
 * Pages live in an arena keyed by id; each node keeps its parent id and the
 * ordered ids of its children. Paths are derived on read, so moving a page
 * never leaves a stale path behind in its subtree.
 *
 * Invariants:
 * - exactly one root, which can be neither moved nor removed
 * - no page is its own ancestor
 * - slugs are unique among the children of every page
 * - child positions are 0..n-1 without gaps
 *
 * Every mutation validates fully before changing anything. PageTree is not
 * thread-safe; ContentEngine serializes access to it.
 */
class PageTree {
public:
    static constexpr PageId ROOT_ID = 1;

    /**
     * Create a tree holding only the root page ("Home", empty slug).
     */
    PageTree();

    /**
     * Rebuild a tree from stored pages.
     *
     * Children are ordered by their stored position (ties by id) and then
     * renumbered densely. Fails with ValidationError unless the pages form
     * a single rooted tree with unique sibling slugs.
     */
    [[nodiscard]] static Result<PageTree> from_pages(std::vector<Page> pages, PageId next_id);

    /**
     * Insert a page under parent_id.
     *
     * A title-derived slug is made unique among the new siblings; an
     * explicit slug that is already taken fails with SlugConflict.
     */
    [[nodiscard]] Result<PageView> create(const NewPage& request);

    [[nodiscard]] Result<PageView> get(PageId id) const;

    /**
     * Resolve a root-relative path such as "/about-us/team". "" and "/"
     * name the root.
     */
    [[nodiscard]] Result<PageView> get_by_path(std::string_view path) const;

    /**
     * Apply a patch. An explicit slug is sanitized and must not be taken by
     * a sibling (SlugConflict); the root keeps its empty slug.
     */
    [[nodiscard]] Result<PageView> update(PageId id, const PagePatch& patch);

    /**
     * Re-parent a page, inserting it at position (clamped, default end).
     * Moving within the same parent reorders it.
     */
    [[nodiscard]] Result<PageView> move(PageId id, PageId new_parent_id,
                                        std::optional<int> position = std::nullopt);

    /**
     * Remove a page and its whole subtree.
     * Returns the removed ids, the page itself first, in pre-order.
     */
    [[nodiscard]] Result<std::vector<PageId>> remove(PageId id);

    /**
     * The whole tree, rooted at the root page, children in sibling order.
     */
    [[nodiscard]] PageNode list_tree() const;

    [[nodiscard]] Result<std::vector<PageView>> children(PageId id) const;
    [[nodiscard]] Result<std::string> path_of(PageId id) const;

    /**
     * Ids of a page and all its descendants, pre-order. Empty if absent.
     */
    [[nodiscard]] std::vector<PageId> subtree_ids(PageId id) const;

    /**
     * True if ancestor lies on the parent chain of descendant (a page is
     * considered its own ancestor).
     */
    [[nodiscard]] bool is_ancestor(PageId ancestor, PageId descendant) const;

    /**
     * Case-insensitive substring match over titles and slugs, pre-order.
     */
    [[nodiscard]] std::vector<PageView> search(std::string_view query) const;

    /**
     * Every page, pre-order from the root.
     */
    [[nodiscard]] std::vector<Page> all_pages() const;

    [[nodiscard]] bool contains(PageId id) const { return nodes_.contains(id); }
    [[nodiscard]] std::size_t size() const { return nodes_.size(); }
    [[nodiscard]] PageId root_id() const { return root_id_; }
    [[nodiscard]] PageId next_id() const { return next_id_; }

private:
    struct Node {
        Page page;
        std::vector<PageId> children;
    };

    PageTree(std::unordered_map<PageId, Node> nodes, PageId root_id, PageId next_id);

    [[nodiscard]] const Node* find(PageId id) const;
    [[nodiscard]] Node* find(PageId id);
    [[nodiscard]] PageView view_of(const Node& node) const;
    [[nodiscard]] std::string build_path(const Node& node) const;
    [[nodiscard]] std::set<std::string> sibling_slugs(const Node& parent) const;
    [[nodiscard]] std::optional<PageId> child_with_slug(const Node& parent,
                                                        std::string_view slug) const;
    void renumber(Node& parent);
    void collect_subtree(PageId id, std::vector<PageId>& out) const;
    [[nodiscard]] PageNode build_node(const Node& node) const;

    std::unordered_map<PageId, Node> nodes_;
    PageId root_id_{ROOT_ID};
    PageId next_id_{ROOT_ID + 1};
};

} // namespace folio
