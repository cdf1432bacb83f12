#include <catch2/catch_test_macros.hpp>
#include "core/slug.hpp"

using namespace folio;

TEST_CASE("slug::sanitize", "[slug]") {
    SECTION("Lower-cases and joins words with hyphens") {
        REQUIRE(slug::sanitize("About Us") == "about-us");
    }

    SECTION("Collapses runs of punctuation into one hyphen") {
        REQUIRE(slug::sanitize("What's New? Price: $99.99!") == "what-s-new-price-99-99");
    }

    SECTION("Strips separators at both ends") {
        REQUIRE(slug::sanitize("  --Hello--World--  ") == "hello-world");
    }

    SECTION("Drops non-ASCII bytes") {
        REQUIRE(slug::sanitize("Caf\xC3\xA9 Menu") == "caf-menu");
    }

    SECTION("Falls back when nothing survives") {
        REQUIRE(slug::sanitize("") == "untitled");
        REQUIRE(slug::sanitize("!!! ???") == "untitled");
    }

    SECTION("Truncates to the maximum length") {
        const std::string long_title(150, 'a');
        REQUIRE(slug::sanitize(long_title) == std::string(slug::MAX_LENGTH, 'a'));
    }

    SECTION("Does not leave a hyphen where the cut falls") {
        const std::string title = std::string(99, 'a') + " b";
        const auto result = slug::sanitize(title);
        REQUIRE(result == std::string(99, 'a'));
        REQUIRE(slug::is_valid(result));
    }
}

TEST_CASE("slug::generate", "[slug]") {
    SECTION("Uses the title when no slug is given") {
        REQUIRE(slug::generate("About Us", std::nullopt, {}) == "about-us");
    }

    SECTION("Prefers the explicit slug, sanitized") {
        REQUIRE(slug::generate("About Us", std::string("Team Page"), {}) == "team-page");
    }

    SECTION("Appends the first free numeric suffix") {
        REQUIRE(slug::generate("About Us", std::nullopt, {"about-us"}) == "about-us-2");
        REQUIRE(slug::generate("About Us", std::nullopt, {"about-us", "about-us-2"}) == "about-us-3");
        REQUIRE(slug::generate("About Us", std::nullopt, {"about-us", "about-us-3"}) == "about-us-2");
    }

    SECTION("Only the given siblings count") {
        REQUIRE(slug::generate("About Us", std::nullopt, {"contact"}) == "about-us");
    }

    SECTION("Suffixed slugs stay within the maximum length") {
        const std::string title(slug::MAX_LENGTH, 'x');
        const auto result = slug::generate(title, std::nullopt, {std::string(slug::MAX_LENGTH, 'x')});
        REQUIRE(result.size() == slug::MAX_LENGTH);
        REQUIRE(result == std::string(slug::MAX_LENGTH - 2, 'x') + "-2");
    }

    SECTION("Fallback slugs are suffixed too") {
        REQUIRE(slug::generate("", std::nullopt, {"untitled"}) == "untitled-2");
    }
}

TEST_CASE("slug::is_valid", "[slug]") {
    REQUIRE(slug::is_valid("about-us"));
    REQUIRE(slug::is_valid("a"));
    REQUIRE(slug::is_valid("2024-news"));

    REQUIRE_FALSE(slug::is_valid(""));
    REQUIRE_FALSE(slug::is_valid("-about"));
    REQUIRE_FALSE(slug::is_valid("about-"));
    REQUIRE_FALSE(slug::is_valid("About"));
    REQUIRE_FALSE(slug::is_valid("about us"));
    REQUIRE_FALSE(slug::is_valid(std::string(slug::MAX_LENGTH + 1, 'a')));
}
