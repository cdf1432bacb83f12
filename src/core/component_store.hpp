#pragma once

#include "core/component.hpp"
#include "core/result.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace folio {

/**
 * ComponentStore - Owns the ordered draft components of every page.
 *
 * The store does not know which pages exist; callers validate page ids
 * first. Positions within a page are kept dense (0..n-1) after every
 * insert, move and removal.
 */
class ComponentStore {
public:
    using Component = components::Component;

    ComponentStore() = default;

    /**
     * Rebuild a store from stored components. Each page's list is ordered
     * by stored position (ties by id) and renumbered.
     */
    [[nodiscard]] static Result<ComponentStore> from_components(
        std::vector<Component> components, ComponentId next_id);

    /**
     * Add a component to a page's draft at position (clamped, default end).
     */
    [[nodiscard]] Result<Component> create(PageId page_id,
                                           const components::NewComponent& fields,
                                           std::optional<int> position = std::nullopt);

    [[nodiscard]] Result<Component> get(ComponentId id) const;

    [[nodiscard]] Result<Component> update(ComponentId id, const components::ComponentPatch& patch);

    [[nodiscard]] Result<void> remove(ComponentId id);

    /**
     * Move a component to position (clamped to the draft's bounds).
     */
    [[nodiscard]] Result<Component> move(ComponentId id, int position);

    /**
     * Move a component directly before / after another component of the
     * same page.
     */
    [[nodiscard]] Result<Component> move_before(ComponentId id, ComponentId target_id);
    [[nodiscard]] Result<Component> move_after(ComponentId id, ComponentId target_id);

    /**
     * A page's draft in order; empty if the page has no components.
     */
    [[nodiscard]] std::vector<Component> list(PageId page_id) const;

    /**
     * Drop all components of a page. Returns how many were removed.
     */
    std::size_t remove_page(PageId page_id);

    /**
     * Install components as a page's whole draft, keeping their ids.
     * Ids held by other pages are left untouched; see ContentEngine.
     */
    void replace(PageId page_id, std::vector<Component> components);

    /**
     * Every component, grouped by page.
     */
    [[nodiscard]] std::vector<Component> all_components() const;

    [[nodiscard]] std::size_t size() const { return by_id_.size(); }
    [[nodiscard]] ComponentId next_id() const { return next_id_; }

private:
    [[nodiscard]] Result<Component> move_relative(ComponentId id, ComponentId target_id, bool after);
    void renumber(PageId page_id);

    std::unordered_map<ComponentId, Component> by_id_;
    std::unordered_map<PageId, std::vector<ComponentId>> order_;
    ComponentId next_id_{1};
};

} // namespace folio
