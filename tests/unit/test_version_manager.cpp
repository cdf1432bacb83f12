#include <catch2/catch_test_macros.hpp>
#include "core/version_manager.hpp"

using namespace folio;
using namespace folio::components;

namespace {

struct Fixture {
    PageTree tree;
    ComponentStore store;
    VersionManager versions{tree, store};
    PageId page = tree.create(NewPage{.parent_id = PageTree::ROOT_ID, .title = "About"})
                      .unwrap().page.id;

    ComponentId add(const std::string& body) {
        return store.create(page, NewComponent{.body = body}).unwrap().id;
    }

    std::vector<std::string> bodies(const std::vector<Component>& list) const {
        std::vector<std::string> out;
        for (const auto& component : list) out.push_back(component.body);
        return out;
    }
};

} // namespace

TEST_CASE("VersionManager before the first publish", "[version_manager]") {
    Fixture f;
    f.add("draft");

    REQUIRE(f.versions.get_published(f.page).unwrap().empty());
    REQUIRE(f.versions.get_draft(f.page).unwrap().size() == 1);

    auto status = f.versions.status(f.page).unwrap();
    REQUIRE_FALSE(status.has_published);
    REQUIRE(status.has_draft_changes);
    REQUIRE(status.draft_count == 1);
    REQUIRE_FALSE(status.published_at.has_value());

    REQUIRE(f.versions.get_draft(99).unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(f.versions.get_published(99).unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(f.versions.status(99).unwrap_err().kind == ErrorKind::NotFound);
}

TEST_CASE("VersionManager::publish copies the draft", "[version_manager]") {
    Fixture f;
    auto first = f.add("one");
    f.add("two");

    auto info = f.versions.publish(f.page).unwrap();
    REQUIRE(info.page_id == f.page);
    REQUIRE(info.component_count == 2);

    auto published = f.versions.get_published(f.page).unwrap();
    REQUIRE(published == f.versions.get_draft(f.page).unwrap());

    SECTION("Later draft edits do not leak into the published copy") {
        REQUIRE(f.store.update(first, ComponentPatch{.body = "edited"}).is_ok());
        f.add("three");

        REQUIRE(f.bodies(f.versions.get_published(f.page).unwrap()) ==
                std::vector<std::string>{"one", "two"});
        auto status = f.versions.status(f.page).unwrap();
        REQUIRE(status.has_published);
        REQUIRE(status.has_draft_changes);
        REQUIRE(status.draft_count == 3);
        REQUIRE(status.published_count == 2);
        REQUIRE(status.published_at == info.published_at);
    }

    SECTION("Publishing twice without edits changes nothing visible") {
        auto again = f.versions.publish(f.page).unwrap();
        REQUIRE(again.component_count == 2);
        REQUIRE(f.versions.get_published(f.page).unwrap() == published);
        REQUIRE_FALSE(f.versions.status(f.page).unwrap().has_draft_changes);
    }

    SECTION("Publishing an empty draft publishes an empty page") {
        f.store.replace(f.page, {});
        REQUIRE(f.versions.publish(f.page).unwrap().component_count == 0);
        REQUIRE(f.versions.get_published(f.page).unwrap().empty());
        REQUIRE(f.versions.status(f.page).unwrap().has_published);
    }
}

TEST_CASE("VersionManager::discard_draft", "[version_manager]") {
    Fixture f;

    SECTION("Restores the published content with the same ids") {
        auto kept = f.add("keep me");
        REQUIRE(f.versions.publish(f.page).is_ok());
        REQUIRE(f.store.update(kept, ComponentPatch{.body = "oops"}).is_ok());
        f.add("stray");

        auto info = f.versions.discard_draft(f.page).unwrap();
        REQUIRE(info.component_count == 1);

        auto draft = f.versions.get_draft(f.page).unwrap();
        REQUIRE(draft.size() == 1);
        REQUIRE(draft[0].id == kept);
        REQUIRE(draft[0].body == "keep me");
        REQUIRE(draft == f.versions.get_published(f.page).unwrap());
        REQUIRE_FALSE(f.versions.status(f.page).unwrap().has_draft_changes);
    }

    SECTION("Is idempotent") {
        f.add("a");
        REQUIRE(f.versions.publish(f.page).is_ok());
        f.add("b");

        REQUIRE(f.versions.discard_draft(f.page).is_ok());
        auto once = f.versions.get_draft(f.page).unwrap();
        REQUIRE(f.versions.discard_draft(f.page).is_ok());
        REQUIRE(f.versions.get_draft(f.page).unwrap() == once);
    }

    SECTION("Empties the draft of a never-published page") {
        f.add("a");
        f.add("b");
        REQUIRE(f.versions.discard_draft(f.page).unwrap().component_count == 0);
        REQUIRE(f.versions.get_draft(f.page).unwrap().empty());
    }

    SECTION("Unknown pages are NotFound") {
        REQUIRE(f.versions.discard_draft(99).unwrap_err().kind == ErrorKind::NotFound);
        REQUIRE(f.versions.publish(99).unwrap_err().kind == ErrorKind::NotFound);
    }
}

TEST_CASE("VersionManager::forget and reset", "[version_manager]") {
    Fixture f;
    f.add("a");
    REQUIRE(f.versions.publish(f.page).is_ok());

    auto all = f.versions.all_published();
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].page_id == f.page);

    f.versions.forget(f.page);
    REQUIRE(f.versions.all_published().empty());
    REQUIRE_FALSE(f.versions.status(f.page).unwrap().has_published);

    f.versions.reset(all);
    REQUIRE(f.versions.all_published() == all);
}
