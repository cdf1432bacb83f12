#pragma once

#include "storage/database.hpp"
#include "core/content_engine.hpp"
#include "core/result.hpp"
#include <optional>

namespace folio::storage {

/**
 * SiteRepository - Persists a whole SiteSnapshot.
 *
 * The database holds one site. save() replaces every stored row inside a
 * single transaction, so a reader sees either the previous or the new state.
 * The schema must have been migrated (initialize_database) first.
 */
class SiteRepository {
public:
    explicit SiteRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<void> save(const SiteSnapshot& snapshot);

    /**
     * Load the stored site, or nullopt if nothing was ever saved.
     */
    [[nodiscard]] Result<std::optional<SiteSnapshot>> load();

private:
    Database& db_;

    [[nodiscard]] Result<void> clear();
    [[nodiscard]] Result<void> insert_pages(const std::vector<Page>& pages);
    [[nodiscard]] Result<void> insert_components(const std::vector<components::Component>& list);
    [[nodiscard]] Result<void> insert_published(const std::vector<PublishedVersion>& versions);
    [[nodiscard]] Result<void> write_meta(const SiteSnapshot& snapshot);

    [[nodiscard]] Result<std::optional<int64_t>> read_meta(const std::string& key);
    [[nodiscard]] Result<std::vector<Page>> read_pages();
    [[nodiscard]] Result<std::vector<components::Component>> read_components(const std::string& sql);
    [[nodiscard]] Result<std::vector<PublishedVersion>> read_published();
};

} // namespace folio::storage
