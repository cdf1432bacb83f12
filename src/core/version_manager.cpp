#include "core/version_manager.hpp"

#include <algorithm>

namespace folio {

Result<void> VersionManager::require_page(PageId page_id) const {
    if (!tree_.contains(page_id)) {
        return Result<void>::err(Error::not_found("Page not found: " + std::to_string(page_id)));
    }
    return Result<void>::ok();
}

Result<std::vector<VersionManager::Component>> VersionManager::get_draft(PageId page_id) const {
    using R = Result<std::vector<Component>>;
    auto exists = require_page(page_id);
    if (exists.is_err()) {
        return R::err(exists.unwrap_err());
    }
    return R::ok(store_.list(page_id));
}

Result<std::vector<VersionManager::Component>> VersionManager::get_published(PageId page_id) const {
    using R = Result<std::vector<Component>>;
    auto exists = require_page(page_id);
    if (exists.is_err()) {
        return R::err(exists.unwrap_err());
    }
    auto it = published_.find(page_id);
    if (it == published_.end()) {
        return R::ok({});
    }
    return R::ok(it->second.components);
}

Result<PublishInfo> VersionManager::publish(PageId page_id) {
    auto exists = require_page(page_id);
    if (exists.is_err()) {
        return Result<PublishInfo>::err(exists.unwrap_err());
    }

    PublishedVersion version{
        .page_id = page_id,
        .components = store_.list(page_id),
        .published_at = Timestamp::now()
    };
    PublishInfo info{
        .page_id = page_id,
        .component_count = version.components.size(),
        .published_at = version.published_at
    };
    published_.insert_or_assign(page_id, std::move(version));

    return Result<PublishInfo>::ok(info);
}

Result<DiscardInfo> VersionManager::discard_draft(PageId page_id) {
    auto exists = require_page(page_id);
    if (exists.is_err()) {
        return Result<DiscardInfo>::err(exists.unwrap_err());
    }

    std::vector<Component> restored;
    if (auto it = published_.find(page_id); it != published_.end()) {
        restored = it->second.components;
    }
    const auto count = restored.size();
    store_.replace(page_id, std::move(restored));

    return Result<DiscardInfo>::ok(DiscardInfo{.page_id = page_id, .component_count = count});
}

Result<VersionStatus> VersionManager::status(PageId page_id) const {
    auto exists = require_page(page_id);
    if (exists.is_err()) {
        return Result<VersionStatus>::err(exists.unwrap_err());
    }

    const auto draft = store_.list(page_id);
    VersionStatus status{.page_id = page_id, .draft_count = draft.size()};

    auto it = published_.find(page_id);
    if (it == published_.end()) {
        status.has_draft_changes = !draft.empty();
        return Result<VersionStatus>::ok(status);
    }

    status.has_published = true;
    status.published_count = it->second.components.size();
    status.published_at = it->second.published_at;
    status.has_draft_changes = !components::content_equals(draft, it->second.components);
    return Result<VersionStatus>::ok(status);
}

void VersionManager::forget(PageId page_id) {
    published_.erase(page_id);
}

std::vector<PublishedVersion> VersionManager::all_published() const {
    std::vector<PublishedVersion> out;
    out.reserve(published_.size());
    for (const auto& [page_id, version] : published_) {
        out.push_back(version);
    }
    std::sort(out.begin(), out.end(), [](const PublishedVersion& a, const PublishedVersion& b) {
        return a.page_id < b.page_id;
    });
    return out;
}

void VersionManager::reset(std::vector<PublishedVersion> versions) {
    published_.clear();
    for (auto& version : versions) {
        const auto page_id = version.page_id;
        published_.insert_or_assign(page_id, std::move(version));
    }
}

} // namespace folio
