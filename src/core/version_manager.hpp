#pragma once

#include "core/component.hpp"
#include "core/component_store.hpp"
#include "core/page_tree.hpp"
#include "core/result.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace folio {

/**
 * PublishedVersion - The last content promoted for a page.
 */
struct PublishedVersion {
    PageId page_id{0};
    std::vector<components::Component> components;
    Timestamp published_at;

    bool operator==(const PublishedVersion&) const = default;
};

struct PublishInfo {
    PageId page_id{0};
    std::size_t component_count{0};
    Timestamp published_at;
};

struct DiscardInfo {
    PageId page_id{0};
    std::size_t component_count{0};
};

/**
 * VersionStatus - Where a page stands between draft and published.
 */
struct VersionStatus {
    PageId page_id{0};
    bool has_published{false};
    bool has_draft_changes{false};
    std::size_t draft_count{0};
    std::size_t published_count{0};
    std::optional<Timestamp> published_at;
};

/**
 * VersionManager - Draft/published versioning of page content.
 *
 * The draft of a page is whatever ComponentStore holds for it. Publishing
 * copies that list into a snapshot owned here; the draft is kept, so
 * editing continues from the same state. Discarding replaces the draft with
 * a copy of the snapshot (same component ids), or empties it when the page
 * was never published.
 *
 * The tree is only consulted to check that a page exists.
 */
class VersionManager {
public:
    using Component = components::Component;

    VersionManager(const PageTree& tree, ComponentStore& store)
        : tree_(tree), store_(store) {}

    VersionManager(const VersionManager&) = delete;
    VersionManager& operator=(const VersionManager&) = delete;

    [[nodiscard]] Result<std::vector<Component>> get_draft(PageId page_id) const;

    /**
     * The published snapshot; empty (not an error) if never published.
     */
    [[nodiscard]] Result<std::vector<Component>> get_published(PageId page_id) const;

    [[nodiscard]] Result<PublishInfo> publish(PageId page_id);

    [[nodiscard]] Result<DiscardInfo> discard_draft(PageId page_id);

    [[nodiscard]] Result<VersionStatus> status(PageId page_id) const;

    /**
     * Drop the snapshot of a page that no longer exists.
     */
    void forget(PageId page_id);

    [[nodiscard]] std::vector<PublishedVersion> all_published() const;

    /**
     * Replace every snapshot. Callers validate page ids beforehand.
     */
    void reset(std::vector<PublishedVersion> versions);

private:
    [[nodiscard]] Result<void> require_page(PageId page_id) const;

    const PageTree& tree_;
    ComponentStore& store_;
    std::unordered_map<PageId, PublishedVersion> published_;
};

} // namespace folio
