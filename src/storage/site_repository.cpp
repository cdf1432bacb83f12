#include "storage/site_repository.hpp"

#include <map>

namespace folio::storage {

using components::Component;

namespace {

constexpr const char* META_NEXT_PAGE_ID = "next_page_id";
constexpr const char* META_NEXT_COMPONENT_ID = "next_component_id";

constexpr const char* COMPONENT_COLUMNS =
    "page_id, id, position, component_type, title, body, template, created_at, updated_at";

[[nodiscard]] Result<void> bind_optional_text(Statement& stmt, int index,
                                              const std::optional<std::string>& text) {
    return text ? stmt.bind_text(index, *text) : stmt.bind_null(index);
}

[[nodiscard]] std::optional<std::string> column_optional_text(const Statement& stmt, int index) {
    if (stmt.column_is_null(index)) {
        return std::nullopt;
    }
    return stmt.column_text(index);
}

/**
 * Bind a component to a statement whose parameters follow COMPONENT_COLUMNS.
 */
[[nodiscard]] Result<void> bind_component(Statement& stmt, const Component& c) {
    return stmt.bind_int64(1, c.page_id)
        .and_then([&] { return stmt.bind_int64(2, c.id); })
        .and_then([&] { return stmt.bind_int(3, c.position); })
        .and_then([&] { return stmt.bind_text(4, components::type_name(c.type)); })
        .and_then([&] { return bind_optional_text(stmt, 5, c.title); })
        .and_then([&] { return stmt.bind_text(6, c.body); })
        .and_then([&] { return stmt.bind_text(7, c.template_name); })
        .and_then([&] { return stmt.bind_int64(8, c.created_at.millis()); })
        .and_then([&] { return stmt.bind_int64(9, c.updated_at.millis()); });
}

[[nodiscard]] Result<Component> row_to_component(const Statement& stmt) {
    auto type_text = stmt.column_text(3);
    auto type = components::parse_type(type_text);
    if (!type) {
        return Result<Component>::err(Error::storage("Unknown component type in database: " + type_text));
    }
    return Result<Component>::ok(Component{
        .id = stmt.column_int64(1),
        .page_id = stmt.column_int64(0),
        .position = stmt.column_int(2),
        .type = *type,
        .title = column_optional_text(stmt, 4),
        .body = stmt.column_text(5),
        .template_name = stmt.column_text(6),
        .created_at = Timestamp(stmt.column_int64(7)),
        .updated_at = Timestamp(stmt.column_int64(8))
    });
}

/**
 * Step a bound insert statement to completion and reset it for reuse.
 */
[[nodiscard]] Result<void> run_insert(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    return stmt.reset();
}

} // namespace

// ============================================================================
// Save
// ============================================================================

Result<void> SiteRepository::save(const SiteSnapshot& snapshot) {
    return db_.transaction([&]() -> Result<void> {
        return clear()
            .and_then([&] { return insert_pages(snapshot.pages); })
            .and_then([&] { return insert_components(snapshot.draft_components); })
            .and_then([&] { return insert_published(snapshot.published); })
            .and_then([&] { return write_meta(snapshot); });
    });
}

Result<void> SiteRepository::clear() {
    return db_.execute(R"SQL(
        DELETE FROM published_components;
        DELETE FROM published_versions;
        DELETE FROM components;
        DELETE FROM pages;
        DELETE FROM site_meta;
    )SQL");
}

Result<void> SiteRepository::insert_pages(const std::vector<Page>& pages) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO pages (id, parent_id, title, slug, position, template,
                           description, keywords, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    for (const auto& page : pages) {
        auto bound = stmt.bind_int64(1, page.id)
            .and_then([&] {
                return page.parent_id ? stmt.bind_int64(2, *page.parent_id) : stmt.bind_null(2);
            })
            .and_then([&] { return stmt.bind_text(3, page.title); })
            .and_then([&] { return stmt.bind_text(4, page.slug); })
            .and_then([&] { return stmt.bind_int(5, page.position); })
            .and_then([&] { return stmt.bind_text(6, page.template_name); })
            .and_then([&] { return bind_optional_text(stmt, 7, page.description); })
            .and_then([&] { return bind_optional_text(stmt, 8, page.keywords); })
            .and_then([&] { return stmt.bind_int64(9, page.created_at.millis()); })
            .and_then([&] { return stmt.bind_int64(10, page.updated_at.millis()); })
            .and_then([&] { return run_insert(stmt); });
        if (bound.is_err()) {
            return bound;
        }
    }
    return Result<void>::ok();
}

Result<void> SiteRepository::insert_components(const std::vector<Component>& list) {
    auto stmt_result = db_.prepare(std::string("INSERT INTO components (") + COMPONENT_COLUMNS +
                                   ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    for (const auto& component : list) {
        auto inserted = bind_component(stmt, component)
            .and_then([&] { return run_insert(stmt); });
        if (inserted.is_err()) {
            return inserted;
        }
    }
    return Result<void>::ok();
}

Result<void> SiteRepository::insert_published(const std::vector<PublishedVersion>& versions) {
    auto version_result = db_.prepare(
        "INSERT INTO published_versions (page_id, published_at) VALUES (?, ?);");
    if (version_result.is_err()) {
        return Result<void>::err(version_result.unwrap_err());
    }
    auto component_result = db_.prepare(std::string("INSERT INTO published_components (") +
                                         COMPONENT_COLUMNS +
                                         ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (component_result.is_err()) {
        return Result<void>::err(component_result.unwrap_err());
    }
    auto version_stmt = std::move(version_result).unwrap();
    auto component_stmt = std::move(component_result).unwrap();

    for (const auto& version : versions) {
        auto inserted = version_stmt.bind_int64(1, version.page_id)
            .and_then([&] { return version_stmt.bind_int64(2, version.published_at.millis()); })
            .and_then([&] { return run_insert(version_stmt); });
        if (inserted.is_err()) {
            return inserted;
        }
        for (const auto& component : version.components) {
            auto copied = bind_component(component_stmt, component)
                .and_then([&] { return run_insert(component_stmt); });
            if (copied.is_err()) {
                return copied;
            }
        }
    }
    return Result<void>::ok();
}

Result<void> SiteRepository::write_meta(const SiteSnapshot& snapshot) {
    auto stmt_result = db_.prepare("INSERT INTO site_meta (key, value) VALUES (?, ?);");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    return stmt.bind_text(1, META_NEXT_PAGE_ID)
        .and_then([&] { return stmt.bind_int64(2, snapshot.next_page_id); })
        .and_then([&] { return run_insert(stmt); })
        .and_then([&] { return stmt.bind_text(1, META_NEXT_COMPONENT_ID); })
        .and_then([&] { return stmt.bind_int64(2, snapshot.next_component_id); })
        .and_then([&] { return run_insert(stmt); });
}

// ============================================================================
// Load
// ============================================================================

Result<std::optional<SiteSnapshot>> SiteRepository::load() {
    using R = Result<std::optional<SiteSnapshot>>;

    auto next_page_id = read_meta(META_NEXT_PAGE_ID);
    if (next_page_id.is_err()) {
        return R::err(next_page_id.unwrap_err());
    }
    if (!next_page_id.unwrap()) {
        return R::ok(std::nullopt);  // Never saved
    }
    auto next_component_id = read_meta(META_NEXT_COMPONENT_ID);
    if (next_component_id.is_err()) {
        return R::err(next_component_id.unwrap_err());
    }

    auto pages = read_pages();
    if (pages.is_err()) {
        return R::err(pages.unwrap_err());
    }
    auto drafts = read_components(std::string("SELECT ") + COMPONENT_COLUMNS +
                                  " FROM components ORDER BY page_id, position;");
    if (drafts.is_err()) {
        return R::err(drafts.unwrap_err());
    }
    auto published = read_published();
    if (published.is_err()) {
        return R::err(published.unwrap_err());
    }

    return R::ok(SiteSnapshot{
        .pages = std::move(pages).unwrap(),
        .draft_components = std::move(drafts).unwrap(),
        .published = std::move(published).unwrap(),
        .next_page_id = *next_page_id.unwrap(),
        .next_component_id = next_component_id.unwrap().value_or(1)
    });
}

Result<std::optional<int64_t>> SiteRepository::read_meta(const std::string& key) {
    using R = Result<std::optional<int64_t>>;

    auto stmt_result = db_.prepare("SELECT value FROM site_meta WHERE key = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(stmt.column_int64(0));
}

Result<std::vector<Page>> SiteRepository::read_pages() {
    std::vector<Page> pages;
    auto queried = db_.query(R"SQL(
        SELECT id, parent_id, title, slug, position, template,
               description, keywords, created_at, updated_at
        FROM pages ORDER BY parent_id, position;
    )SQL", [&pages](Statement& stmt) {
        std::optional<PageId> parent_id;
        if (!stmt.column_is_null(1)) {
            parent_id = stmt.column_int64(1);
        }
        pages.push_back(Page{
            .id = stmt.column_int64(0),
            .parent_id = parent_id,
            .title = stmt.column_text(2),
            .slug = stmt.column_text(3),
            .position = stmt.column_int(4),
            .template_name = stmt.column_text(5),
            .description = column_optional_text(stmt, 6),
            .keywords = column_optional_text(stmt, 7),
            .created_at = Timestamp(stmt.column_int64(8)),
            .updated_at = Timestamp(stmt.column_int64(9))
        });
    });
    if (queried.is_err()) {
        return Result<std::vector<Page>>::err(queried.unwrap_err());
    }
    return Result<std::vector<Page>>::ok(std::move(pages));
}

Result<std::vector<Component>> SiteRepository::read_components(const std::string& sql) {
    using R = Result<std::vector<Component>>;

    std::vector<Component> list;
    std::optional<Error> bad_row;
    auto queried = db_.query(sql, [&](Statement& stmt) {
        if (bad_row) return;
        auto component = row_to_component(stmt);
        if (component.is_err()) {
            bad_row = component.unwrap_err();
            return;
        }
        list.push_back(std::move(component).unwrap());
    });
    if (queried.is_err()) {
        return R::err(queried.unwrap_err());
    }
    if (bad_row) {
        return R::err(*bad_row);
    }
    return R::ok(std::move(list));
}

Result<std::vector<PublishedVersion>> SiteRepository::read_published() {
    using R = Result<std::vector<PublishedVersion>>;

    std::map<PageId, PublishedVersion> by_page;
    auto queried = db_.query(
        "SELECT page_id, published_at FROM published_versions;",
        [&by_page](Statement& stmt) {
            const auto page_id = stmt.column_int64(0);
            by_page.emplace(page_id, PublishedVersion{
                .page_id = page_id,
                .components = {},
                .published_at = Timestamp(stmt.column_int64(1))
            });
        });
    if (queried.is_err()) {
        return R::err(queried.unwrap_err());
    }

    auto copies = read_components(std::string("SELECT ") + COMPONENT_COLUMNS +
                                  " FROM published_components ORDER BY page_id, position;");
    if (copies.is_err()) {
        return R::err(copies.unwrap_err());
    }
    for (auto& component : copies.unwrap()) {
        auto it = by_page.find(component.page_id);
        if (it == by_page.end()) {
            return R::err(Error::storage(
                "Published component " + std::to_string(component.id) + " has no version row"));
        }
        it->second.components.push_back(std::move(component));
    }

    std::vector<PublishedVersion> out;
    out.reserve(by_page.size());
    for (auto& [page_id, version] : by_page) {
        out.push_back(std::move(version));
    }
    return R::ok(std::move(out));
}

} // namespace folio::storage
