#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace folio::slug {

/** Longest slug the generator will produce. */
inline constexpr std::size_t MAX_LENGTH = 100;

/** Base used when a title or explicit slug sanitizes to nothing. */
inline constexpr std::string_view FALLBACK = "untitled";

/**
 * Sanitize free text into a slug base.
 *
 * Lower-cases ASCII letters, collapses every run of characters outside
 * [a-z0-9] into one hyphen, strips hyphens at both ends and truncates to
 * MAX_LENGTH (stripping any hyphen the cut leaves at the end). Returns
 * FALLBACK when nothing survives.
 */
[[nodiscard]] std::string sanitize(std::string_view text);

/**
 * Produce a slug for a new page.
 *
 * The base comes from explicit_slug when given, else from title. If the
 * base collides with a sibling, the first free "-2", "-3", ... suffix is
 * appended, cutting the base so the result stays within MAX_LENGTH.
 */
[[nodiscard]] std::string generate(std::string_view title,
                                   const std::optional<std::string>& explicit_slug,
                                   const std::set<std::string>& sibling_slugs);

/**
 * True if slug is non-empty, at most MAX_LENGTH characters and matches
 * [a-z0-9]([a-z0-9-]*[a-z0-9])?
 */
[[nodiscard]] bool is_valid(std::string_view slug);

} // namespace folio::slug
