#include "core/content_engine.hpp"

#include <algorithm>
#include <mutex>
#include <set>

namespace folio {

using components::Component;

namespace {

using ReadLock = std::shared_lock<std::shared_mutex>;
using WriteLock = std::unique_lock<std::shared_mutex>;

} // namespace

ContentEngine::ContentEngine() : versions_(tree_, store_) {}

// ============================================================================
// Pages
// ============================================================================

Result<PageView> ContentEngine::create_page(const NewPage& request) {
    WriteLock lock(mutex_);
    return tree_.create(request);
}

Result<PageView> ContentEngine::update_page(PageId id, const PagePatch& patch) {
    WriteLock lock(mutex_);
    return tree_.update(id, patch);
}

Result<PageView> ContentEngine::move_page(PageId id, PageId new_parent_id, std::optional<int> position) {
    WriteLock lock(mutex_);
    return tree_.move(id, new_parent_id, position);
}

Result<DeleteSummary> ContentEngine::delete_page(PageId id) {
    WriteLock lock(mutex_);
    auto removed = tree_.remove(id);
    if (removed.is_err()) {
        return Result<DeleteSummary>::err(removed.unwrap_err());
    }

    DeleteSummary summary{.deleted_pages = removed.unwrap().size()};
    for (auto page_id : removed.unwrap()) {
        summary.deleted_components += store_.remove_page(page_id);
        versions_.forget(page_id);
    }
    return Result<DeleteSummary>::ok(summary);
}

Result<PageView> ContentEngine::get_page(PageId id) const {
    ReadLock lock(mutex_);
    return tree_.get(id);
}

Result<PageView> ContentEngine::get_page_by_path(std::string_view path) const {
    ReadLock lock(mutex_);
    return tree_.get_by_path(path);
}

PageNode ContentEngine::list_pages() const {
    ReadLock lock(mutex_);
    return tree_.list_tree();
}

std::vector<PageView> ContentEngine::search_pages(std::string_view query) const {
    ReadLock lock(mutex_);
    return tree_.search(query);
}

// ============================================================================
// Draft components
// ============================================================================

Result<Component> ContentEngine::create_component(
    PageId page_id,
    const components::NewComponent& fields,
    std::optional<int> position
) {
    WriteLock lock(mutex_);
    if (!tree_.contains(page_id)) {
        return Result<Component>::err(Error::not_found("Page not found: " + std::to_string(page_id)));
    }
    return store_.create(page_id, fields, position);
}

Result<Component> ContentEngine::update_component(ComponentId id, const components::ComponentPatch& patch) {
    WriteLock lock(mutex_);
    return store_.update(id, patch);
}

Result<void> ContentEngine::delete_component(ComponentId id) {
    WriteLock lock(mutex_);
    return store_.remove(id);
}

Result<Component> ContentEngine::move_component(ComponentId id, int position) {
    WriteLock lock(mutex_);
    return store_.move(id, position);
}

Result<Component> ContentEngine::move_component_before(ComponentId id, ComponentId target_id) {
    WriteLock lock(mutex_);
    return store_.move_before(id, target_id);
}

Result<Component> ContentEngine::move_component_after(ComponentId id, ComponentId target_id) {
    WriteLock lock(mutex_);
    return store_.move_after(id, target_id);
}

Result<Component> ContentEngine::get_component(ComponentId id) const {
    ReadLock lock(mutex_);
    return store_.get(id);
}

Result<std::vector<Component>> ContentEngine::list_components(PageId page_id) const {
    ReadLock lock(mutex_);
    return versions_.get_draft(page_id);
}

// ============================================================================
// Versions
// ============================================================================

Result<std::vector<Component>> ContentEngine::get_draft_content(PageId page_id) const {
    ReadLock lock(mutex_);
    return versions_.get_draft(page_id);
}

Result<std::vector<Component>> ContentEngine::get_published_content(PageId page_id) const {
    ReadLock lock(mutex_);
    return versions_.get_published(page_id);
}

Result<PublishInfo> ContentEngine::publish_draft(PageId page_id) {
    WriteLock lock(mutex_);
    return versions_.publish(page_id);
}

Result<DiscardInfo> ContentEngine::discard_draft(PageId page_id) {
    WriteLock lock(mutex_);
    return versions_.discard_draft(page_id);
}

Result<VersionStatus> ContentEngine::version_status(PageId page_id) const {
    ReadLock lock(mutex_);
    return versions_.status(page_id);
}

// ============================================================================
// Snapshots
// ============================================================================

SiteSnapshot ContentEngine::snapshot() const {
    ReadLock lock(mutex_);
    return SiteSnapshot{
        .pages = tree_.all_pages(),
        .draft_components = store_.all_components(),
        .published = versions_.all_published(),
        .next_page_id = tree_.next_id(),
        .next_component_id = store_.next_id()
    };
}

Result<void> ContentEngine::restore(SiteSnapshot snapshot) {
    // Published copies keep the ids of the drafts they came from, so they
    // also bound the next component id.
    ComponentId next_component_id = snapshot.next_component_id;
    for (const auto& version : snapshot.published) {
        for (const auto& component : version.components) {
            next_component_id = std::max(next_component_id, component.id + 1);
        }
    }

    auto tree = PageTree::from_pages(std::move(snapshot.pages), snapshot.next_page_id);
    if (tree.is_err()) {
        return Result<void>::err(tree.unwrap_err());
    }
    for (const auto& component : snapshot.draft_components) {
        if (!tree.unwrap().contains(component.page_id)) {
            return Result<void>::err(Error::validation(
                "Component " + std::to_string(component.id) + " references a missing page"));
        }
    }
    std::set<PageId> published_pages;
    for (const auto& version : snapshot.published) {
        if (!tree.unwrap().contains(version.page_id) || !published_pages.insert(version.page_id).second) {
            return Result<void>::err(Error::validation(
                "Invalid published version for page " + std::to_string(version.page_id)));
        }
    }

    auto store = ComponentStore::from_components(std::move(snapshot.draft_components), next_component_id);
    if (store.is_err()) {
        return Result<void>::err(store.unwrap_err());
    }

    WriteLock lock(mutex_);
    tree_ = std::move(tree).unwrap();
    store_ = std::move(store).unwrap();
    versions_.reset(std::move(snapshot.published));
    return Result<void>::ok();
}

} // namespace folio
