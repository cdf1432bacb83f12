#include "core/component_store.hpp"

#include <algorithm>

namespace folio {

using components::Component;

namespace {

[[nodiscard]] std::string component_label(ComponentId id) {
    return "Component not found: " + std::to_string(id);
}

} // namespace

Result<ComponentStore> ComponentStore::from_components(
    std::vector<Component> components, ComponentId next_id
) {
    ComponentStore store;
    ComponentId max_id = 0;

    for (auto& component : components) {
        if (component.id <= 0) {
            return Result<ComponentStore>::err(Error::validation("Component ids must be positive"));
        }
        max_id = std::max(max_id, component.id);
        const auto id = component.id;
        const auto page_id = component.page_id;
        if (!store.by_id_.emplace(id, std::move(component)).second) {
            return Result<ComponentStore>::err(
                Error::validation("Duplicate component id: " + std::to_string(id)));
        }
        store.order_[page_id].push_back(id);
    }

    for (auto& [page_id, ids] : store.order_) {
        std::sort(ids.begin(), ids.end(), [&store](ComponentId a, ComponentId b) {
            const auto& ca = store.by_id_.at(a);
            const auto& cb = store.by_id_.at(b);
            if (ca.position != cb.position) return ca.position < cb.position;
            return a < b;
        });
        store.renumber(page_id);
    }

    store.next_id_ = std::max(next_id, max_id + 1);
    return Result<ComponentStore>::ok(std::move(store));
}

Result<Component> ComponentStore::create(
    PageId page_id,
    const components::NewComponent& fields,
    std::optional<int> position
) {
    auto valid = components::validate_template(fields.template_name);
    if (valid.is_err()) {
        return Result<Component>::err(valid.unwrap_err());
    }

    auto& ids = order_[page_id];
    std::size_t index = ids.size();
    if (position && *position < static_cast<int>(ids.size())) {
        index = *position < 0 ? 0 : static_cast<std::size_t>(*position);
    }

    const auto now = Timestamp::now();
    const auto id = next_id_++;
    by_id_.emplace(id, Component{
        .id = id,
        .page_id = page_id,
        .position = static_cast<int>(index),
        .type = fields.type,
        .title = fields.title,
        .body = fields.body,
        .template_name = fields.template_name,
        .created_at = now,
        .updated_at = now
    });
    ids.insert(ids.begin() + static_cast<std::ptrdiff_t>(index), id);
    renumber(page_id);

    return Result<Component>::ok(by_id_.at(id));
}

Result<Component> ComponentStore::get(ComponentId id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return Result<Component>::err(Error::not_found(component_label(id)));
    }
    return Result<Component>::ok(it->second);
}

Result<Component> ComponentStore::update(ComponentId id, const components::ComponentPatch& patch) {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return Result<Component>::err(Error::not_found(component_label(id)));
    }
    if (patch.template_name) {
        auto valid = components::validate_template(*patch.template_name);
        if (valid.is_err()) {
            return Result<Component>::err(valid.unwrap_err());
        }
    }

    it->second = components::with_patch(std::move(it->second), patch);
    return Result<Component>::ok(it->second);
}

Result<void> ComponentStore::remove(ComponentId id) {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return Result<void>::err(Error::not_found(component_label(id)));
    }

    const auto page_id = it->second.page_id;
    by_id_.erase(it);
    auto& ids = order_[page_id];
    std::erase(ids, id);
    if (ids.empty()) {
        order_.erase(page_id);
    } else {
        renumber(page_id);
    }
    return Result<void>::ok();
}

Result<Component> ComponentStore::move(ComponentId id, int position) {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return Result<Component>::err(Error::not_found(component_label(id)));
    }

    auto& ids = order_.at(it->second.page_id);
    std::erase(ids, id);
    const auto index = std::clamp(position, 0, static_cast<int>(ids.size()));
    ids.insert(ids.begin() + index, id);
    renumber(it->second.page_id);

    return Result<Component>::ok(it->second);
}

Result<Component> ComponentStore::move_before(ComponentId id, ComponentId target_id) {
    return move_relative(id, target_id, false);
}

Result<Component> ComponentStore::move_after(ComponentId id, ComponentId target_id) {
    return move_relative(id, target_id, true);
}

Result<Component> ComponentStore::move_relative(ComponentId id, ComponentId target_id, bool after) {
    if (id == target_id) {
        return Result<Component>::err(Error::invalid(
            after ? "Cannot move component after itself" : "Cannot move component before itself"));
    }
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return Result<Component>::err(Error::not_found(component_label(id)));
    }
    auto target = by_id_.find(target_id);
    if (target == by_id_.end()) {
        return Result<Component>::err(Error::not_found(component_label(target_id)));
    }
    if (it->second.page_id != target->second.page_id) {
        return Result<Component>::err(Error::invalid("Components must belong to the same page"));
    }

    auto& ids = order_.at(it->second.page_id);
    std::erase(ids, id);
    auto anchor = std::find(ids.begin(), ids.end(), target_id);
    ids.insert(after ? anchor + 1 : anchor, id);
    renumber(it->second.page_id);

    return Result<Component>::ok(it->second);
}

std::vector<Component> ComponentStore::list(PageId page_id) const {
    std::vector<Component> out;
    auto it = order_.find(page_id);
    if (it == order_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (auto id : it->second) {
        out.push_back(by_id_.at(id));
    }
    return out;
}

std::size_t ComponentStore::remove_page(PageId page_id) {
    auto it = order_.find(page_id);
    if (it == order_.end()) {
        return 0;
    }
    const auto count = it->second.size();
    for (auto id : it->second) {
        by_id_.erase(id);
    }
    order_.erase(it);
    return count;
}

void ComponentStore::replace(PageId page_id, std::vector<Component> components) {
    remove_page(page_id);
    if (components.empty()) {
        return;
    }

    auto& ids = order_[page_id];
    for (auto& component : components) {
        component.page_id = page_id;
        next_id_ = std::max(next_id_, component.id + 1);
        ids.push_back(component.id);
        by_id_.insert_or_assign(component.id, std::move(component));
    }
    renumber(page_id);
}

std::vector<Component> ComponentStore::all_components() const {
    std::vector<Component> out;
    out.reserve(by_id_.size());
    for (const auto& [page_id, ids] : order_) {
        for (auto id : ids) {
            out.push_back(by_id_.at(id));
        }
    }
    return out;
}

void ComponentStore::renumber(PageId page_id) {
    int position = 0;
    for (auto id : order_.at(page_id)) {
        by_id_.at(id).position = position++;
    }
}

} // namespace folio
