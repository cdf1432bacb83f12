#pragma once

#include "core/component_store.hpp"
#include "core/page_tree.hpp"
#include "core/result.hpp"
#include "core/version_manager.hpp"

#include <shared_mutex>
#include <string_view>
#include <vector>

namespace folio {

/**
 * SiteSnapshot - Everything needed to rebuild an engine.
 */
struct SiteSnapshot {
    std::vector<Page> pages;
    std::vector<components::Component> draft_components;
    std::vector<PublishedVersion> published;
    PageId next_page_id{PageTree::ROOT_ID + 1};
    ComponentId next_component_id{1};
};

struct DeleteSummary {
    std::size_t deleted_pages{0};
    std::size_t deleted_components{0};
};

/**
 * ContentEngine - Thread-safe facade over one site's pages and content.
 *
 * Holds the page tree, the draft component store and the published
 * versions, and serializes access with one reader/writer lock: reads share
 * it, every mutation holds it exclusively for the check and the change.
 * A call either completes or leaves no visible change.
 *
 * A fresh engine holds only the root page.
 */
class ContentEngine {
public:
    using Component = components::Component;

    ContentEngine();

    ContentEngine(const ContentEngine&) = delete;
    ContentEngine& operator=(const ContentEngine&) = delete;

    // Pages
    [[nodiscard]] Result<PageView> create_page(const NewPage& request);
    [[nodiscard]] Result<PageView> update_page(PageId id, const PagePatch& patch);
    [[nodiscard]] Result<PageView> move_page(PageId id, PageId new_parent_id,
                                             std::optional<int> position = std::nullopt);
    [[nodiscard]] Result<DeleteSummary> delete_page(PageId id);
    [[nodiscard]] Result<PageView> get_page(PageId id) const;
    [[nodiscard]] Result<PageView> get_page_by_path(std::string_view path) const;
    [[nodiscard]] PageNode list_pages() const;
    [[nodiscard]] std::vector<PageView> search_pages(std::string_view query) const;

    // Draft components
    [[nodiscard]] Result<Component> create_component(PageId page_id,
                                                     const components::NewComponent& fields,
                                                     std::optional<int> position = std::nullopt);
    [[nodiscard]] Result<Component> update_component(ComponentId id,
                                                     const components::ComponentPatch& patch);
    [[nodiscard]] Result<void> delete_component(ComponentId id);
    [[nodiscard]] Result<Component> move_component(ComponentId id, int position);
    [[nodiscard]] Result<Component> move_component_before(ComponentId id, ComponentId target_id);
    [[nodiscard]] Result<Component> move_component_after(ComponentId id, ComponentId target_id);
    [[nodiscard]] Result<Component> get_component(ComponentId id) const;
    [[nodiscard]] Result<std::vector<Component>> list_components(PageId page_id) const;

    // Versions
    [[nodiscard]] Result<std::vector<Component>> get_draft_content(PageId page_id) const;
    [[nodiscard]] Result<std::vector<Component>> get_published_content(PageId page_id) const;
    [[nodiscard]] Result<PublishInfo> publish_draft(PageId page_id);
    [[nodiscard]] Result<DiscardInfo> discard_draft(PageId page_id);
    [[nodiscard]] Result<VersionStatus> version_status(PageId page_id) const;

    /**
     * Export the whole state.
     */
    [[nodiscard]] SiteSnapshot snapshot() const;

    /**
     * Replace the whole state with a snapshot.
     *
     * Fails with ValidationError, leaving the engine untouched, unless the
     * pages form a single rooted tree with unique sibling slugs and every
     * component and published version refers to an existing page.
     */
    [[nodiscard]] Result<void> restore(SiteSnapshot snapshot);

private:
    mutable std::shared_mutex mutex_;
    PageTree tree_;
    ComponentStore store_;
    VersionManager versions_;
};

} // namespace folio
