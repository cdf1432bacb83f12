#include "core/page_tree.hpp"
#include "core/slug.hpp"

#include <algorithm>
#include <cctype>

namespace folio {

namespace {

[[nodiscard]] std::size_t clamp_position(std::optional<int> position, std::size_t count) {
    if (!position || *position >= static_cast<int>(count)) {
        return count;
    }
    return *position < 0 ? 0 : static_cast<std::size_t>(*position);
}

[[nodiscard]] std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] std::optional<Error> check_keywords(const std::optional<std::string>& keywords) {
    if (keywords && keywords->size() > MAX_KEYWORDS_LENGTH) {
        return Error::validation("Keywords cannot exceed " +
                                 std::to_string(MAX_KEYWORDS_LENGTH) + " characters");
    }
    return std::nullopt;
}

[[nodiscard]] std::string page_label(PageId id) {
    return "Page not found: " + std::to_string(id);
}

} // namespace

PageTree::PageTree() {
    auto root = make_page(ROOT_ID, std::nullopt, "Home", "");
    nodes_.emplace(ROOT_ID, Node{std::move(root), {}});
}

PageTree::PageTree(std::unordered_map<PageId, Node> nodes, PageId root_id, PageId next_id)
    : nodes_(std::move(nodes)), root_id_(root_id), next_id_(next_id) {}

Result<PageTree> PageTree::from_pages(std::vector<Page> pages, PageId next_id) {
    std::unordered_map<PageId, Node> nodes;
    std::optional<PageId> root_id;
    PageId max_id = 0;

    for (auto& page : pages) {
        if (page.id <= 0) {
            return Result<PageTree>::err(Error::validation("Page ids must be positive"));
        }
        if (page.is_root()) {
            if (root_id) {
                return Result<PageTree>::err(Error::validation("More than one root page"));
            }
            root_id = page.id;
        }
        max_id = std::max(max_id, page.id);
        const auto id = page.id;
        if (!nodes.emplace(id, Node{std::move(page), {}}).second) {
            return Result<PageTree>::err(
                Error::validation("Duplicate page id: " + std::to_string(id)));
        }
    }

    if (!root_id) {
        return Result<PageTree>::err(Error::validation("No root page"));
    }

    for (auto& [id, node] : nodes) {
        if (node.page.is_root()) continue;
        if (!slug::is_valid(node.page.slug)) {
            return Result<PageTree>::err(Error::validation(
                "Page " + std::to_string(id) + " has an invalid slug '" + node.page.slug + "'"));
        }
        auto parent = nodes.find(*node.page.parent_id);
        if (parent == nodes.end()) {
            return Result<PageTree>::err(Error::validation(
                "Page " + std::to_string(id) + " references a missing parent"));
        }
        parent->second.children.push_back(id);
    }

    // Every page must reach the root within size() steps.
    for (const auto& [id, node] : nodes) {
        std::optional<PageId> current = node.page.parent_id;
        std::size_t steps = 0;
        while (current) {
            if (++steps > nodes.size()) {
                return Result<PageTree>::err(Error::validation(
                    "Page " + std::to_string(id) + " is part of a cycle"));
            }
            current = nodes.at(*current).page.parent_id;
        }
    }

    PageTree tree(std::move(nodes), *root_id, std::max(next_id, max_id + 1));
    for (auto& [id, node] : tree.nodes_) {
        std::sort(node.children.begin(), node.children.end(),
            [&tree](PageId a, PageId b) {
                const auto& pa = tree.nodes_.at(a).page;
                const auto& pb = tree.nodes_.at(b).page;
                if (pa.position != pb.position) return pa.position < pb.position;
                return a < b;
            });

        std::set<std::string> seen;
        for (auto child : node.children) {
            if (!seen.insert(tree.nodes_.at(child).page.slug).second) {
                return Result<PageTree>::err(Error::validation(
                    "Duplicate slug under page " + std::to_string(id)));
            }
        }
    }
    for (auto& [id, node] : tree.nodes_) {
        tree.renumber(node);
    }

    return Result<PageTree>::ok(std::move(tree));
}

// ============================================================================
// Mutations
// ============================================================================

Result<PageView> PageTree::create(const NewPage& request) {
    auto* parent = find(request.parent_id);
    if (!parent) {
        return Result<PageView>::err(
            Error::not_found("Parent page not found: " + std::to_string(request.parent_id)));
    }

    const auto siblings = sibling_slugs(*parent);
    if (request.slug && siblings.contains(slug::sanitize(*request.slug))) {
        return Result<PageView>::err(Error::slug_conflict(
            "A page with slug '" + slug::sanitize(*request.slug) + "' already exists at this level"));
    }
    if (request.template_name && request.template_name->empty()) {
        return Result<PageView>::err(Error::validation("Template cannot be empty"));
    }
    if (auto error = check_keywords(request.keywords)) {
        return Result<PageView>::err(std::move(*error));
    }

    const auto id = next_id_++;
    auto page = make_page(id, request.parent_id, request.title,
                          slug::generate(request.title, request.slug, siblings),
                          request.template_name.value_or(std::string(DEFAULT_TEMPLATE)));
    page.description = request.description;
    page.keywords = request.keywords;

    const auto index = clamp_position(request.position, parent->children.size());
    parent->children.insert(parent->children.begin() + static_cast<std::ptrdiff_t>(index), id);
    auto& node = nodes_.emplace(id, Node{std::move(page), {}}).first->second;
    renumber(*parent);

    return Result<PageView>::ok(view_of(node));
}

Result<PageView> PageTree::update(PageId id, const PagePatch& patch) {
    auto* node = find(id);
    if (!node) {
        return Result<PageView>::err(Error::not_found(page_label(id)));
    }
    if (patch.template_name && patch.template_name->empty()) {
        return Result<PageView>::err(Error::validation("Template cannot be empty"));
    }
    if (auto error = check_keywords(patch.keywords)) {
        return Result<PageView>::err(std::move(*error));
    }

    std::optional<std::string> new_slug;
    if (patch.slug) {
        if (node->page.is_root()) {
            return Result<PageView>::err(Error::invalid("Cannot change the slug of the root page"));
        }
        new_slug = slug::sanitize(*patch.slug);
        auto clash = child_with_slug(nodes_.at(*node->page.parent_id), *new_slug);
        if (clash && *clash != id) {
            return Result<PageView>::err(Error::slug_conflict(
                "A page with slug '" + *new_slug + "' already exists at this level"));
        }
    }

    auto page = node->page;
    if (new_slug && *new_slug != page.slug) page = with_slug(std::move(page), std::move(*new_slug));
    if (patch.title) page = with_title(std::move(page), *patch.title);
    if (patch.template_name) page = with_template(std::move(page), *patch.template_name);
    if (patch.description) page = with_description(std::move(page), *patch.description);
    if (patch.keywords) page = with_keywords(std::move(page), *patch.keywords);
    node->page = std::move(page);

    return Result<PageView>::ok(view_of(*node));
}

Result<PageView> PageTree::move(PageId id, PageId new_parent_id, std::optional<int> position) {
    auto* node = find(id);
    if (!node) {
        return Result<PageView>::err(Error::not_found(page_label(id)));
    }
    auto* new_parent = find(new_parent_id);
    if (!new_parent) {
        return Result<PageView>::err(
            Error::not_found("New parent page not found: " + std::to_string(new_parent_id)));
    }
    if (node->page.is_root()) {
        return Result<PageView>::err(Error::invalid("Cannot move the root page"));
    }
    if (is_ancestor(id, new_parent_id)) {
        return Result<PageView>::err(Error::cycle("Cannot move page under itself or its own descendant"));
    }
    auto clash = child_with_slug(*new_parent, node->page.slug);
    if (clash && *clash != id) {
        return Result<PageView>::err(Error::slug_conflict(
            "A page with slug '" + node->page.slug + "' already exists under the new parent"));
    }

    auto& old_parent = nodes_.at(*node->page.parent_id);
    std::erase(old_parent.children, id);
    renumber(old_parent);

    const auto index = clamp_position(position, new_parent->children.size());
    new_parent->children.insert(
        new_parent->children.begin() + static_cast<std::ptrdiff_t>(index), id);
    node->page = with_parent(std::move(node->page), new_parent_id);
    renumber(*new_parent);

    return Result<PageView>::ok(view_of(*node));
}

Result<std::vector<PageId>> PageTree::remove(PageId id) {
    const auto* node = find(id);
    if (!node) {
        return Result<std::vector<PageId>>::err(Error::not_found(page_label(id)));
    }
    if (node->page.is_root()) {
        return Result<std::vector<PageId>>::err(Error::invalid("Cannot delete the root page"));
    }

    std::vector<PageId> removed;
    collect_subtree(id, removed);

    auto& parent = nodes_.at(*node->page.parent_id);
    std::erase(parent.children, id);
    renumber(parent);

    for (auto removed_id : removed) {
        nodes_.erase(removed_id);
    }
    return Result<std::vector<PageId>>::ok(std::move(removed));
}

// ============================================================================
// Reads
// ============================================================================

Result<PageView> PageTree::get(PageId id) const {
    const auto* node = find(id);
    if (!node) {
        return Result<PageView>::err(Error::not_found(page_label(id)));
    }
    return Result<PageView>::ok(view_of(*node));
}

Result<PageView> PageTree::get_by_path(std::string_view path) const {
    auto rest = path;
    if (rest.starts_with('/')) rest.remove_prefix(1);
    if (rest.ends_with('/')) rest.remove_suffix(1);

    const auto* current = find(root_id_);
    if (rest.empty()) {
        return Result<PageView>::ok(view_of(*current));
    }

    // A malformed path is rejected as a whole before any segment is looked up.
    std::vector<std::string_view> segments;
    while (true) {
        const auto slash = rest.find('/');
        const auto segment = rest.substr(0, slash);
        if (segment.empty()) {
            return Result<PageView>::err(
                Error::validation("Empty path segment in '" + std::string(path) + "'"));
        }
        segments.push_back(segment);
        if (slash == std::string_view::npos) break;
        rest.remove_prefix(slash + 1);
    }

    for (auto segment : segments) {
        const auto child = child_with_slug(*current, segment);
        if (!child) {
            return Result<PageView>::err(
                Error::not_found("Page not found at path: " + std::string(path)));
        }
        current = find(*child);
    }

    return Result<PageView>::ok(view_of(*current));
}

PageNode PageTree::list_tree() const {
    return build_node(nodes_.at(root_id_));
}

Result<std::vector<PageView>> PageTree::children(PageId id) const {
    const auto* node = find(id);
    if (!node) {
        return Result<std::vector<PageView>>::err(Error::not_found(page_label(id)));
    }
    std::vector<PageView> out;
    out.reserve(node->children.size());
    for (auto child : node->children) {
        out.push_back(view_of(nodes_.at(child)));
    }
    return Result<std::vector<PageView>>::ok(std::move(out));
}

Result<std::string> PageTree::path_of(PageId id) const {
    const auto* node = find(id);
    if (!node) {
        return Result<std::string>::err(Error::not_found(page_label(id)));
    }
    return Result<std::string>::ok(build_path(*node));
}

std::vector<PageId> PageTree::subtree_ids(PageId id) const {
    std::vector<PageId> out;
    if (contains(id)) {
        collect_subtree(id, out);
    }
    return out;
}

bool PageTree::is_ancestor(PageId ancestor, PageId descendant) const {
    std::optional<PageId> current = descendant;
    while (current) {
        if (*current == ancestor) return true;
        const auto* node = find(*current);
        if (!node) return false;
        current = node->page.parent_id;
    }
    return false;
}

std::vector<PageView> PageTree::search(std::string_view query) const {
    const auto needle = lowercase(query);
    std::vector<PageView> out;
    for (auto id : subtree_ids(root_id_)) {
        const auto& node = nodes_.at(id);
        if (lowercase(node.page.title).find(needle) != std::string::npos ||
            node.page.slug.find(needle) != std::string::npos) {
            out.push_back(view_of(node));
        }
    }
    return out;
}

std::vector<Page> PageTree::all_pages() const {
    std::vector<Page> out;
    out.reserve(nodes_.size());
    for (auto id : subtree_ids(root_id_)) {
        out.push_back(nodes_.at(id).page);
    }
    return out;
}

// ============================================================================
// Helpers
// ============================================================================

const PageTree::Node* PageTree::find(PageId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

PageTree::Node* PageTree::find(PageId id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

PageView PageTree::view_of(const Node& node) const {
    return PageView{
        .page = node.page,
        .path = build_path(node),
        .has_children = !node.children.empty()
    };
}

std::string PageTree::build_path(const Node& node) const {
    if (node.page.is_root()) {
        return "/";
    }

    std::vector<const std::string*> slugs;
    const Node* current = &node;
    while (!current->page.is_root()) {
        slugs.push_back(&current->page.slug);
        current = &nodes_.at(*current->page.parent_id);
    }

    std::string path;
    for (auto it = slugs.rbegin(); it != slugs.rend(); ++it) {
        path += '/';
        path += **it;
    }
    return path;
}

std::set<std::string> PageTree::sibling_slugs(const Node& parent) const {
    std::set<std::string> out;
    for (auto child : parent.children) {
        out.insert(nodes_.at(child).page.slug);
    }
    return out;
}

std::optional<PageId> PageTree::child_with_slug(const Node& parent, std::string_view slug) const {
    for (auto child : parent.children) {
        if (nodes_.at(child).page.slug == slug) {
            return child;
        }
    }
    return std::nullopt;
}

void PageTree::renumber(Node& parent) {
    int position = 0;
    for (auto child : parent.children) {
        nodes_.at(child).page.position = position++;
    }
}

void PageTree::collect_subtree(PageId id, std::vector<PageId>& out) const {
    out.push_back(id);
    for (auto child : nodes_.at(id).children) {
        collect_subtree(child, out);
    }
}

PageNode PageTree::build_node(const Node& node) const {
    PageNode out{view_of(node), {}};
    out.children.reserve(node.children.size());
    for (auto child : node.children) {
        out.children.push_back(build_node(nodes_.at(child)));
    }
    return out;
}

} // namespace folio
