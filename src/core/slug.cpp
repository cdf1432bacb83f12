#include "core/slug.hpp"

namespace folio::slug {

namespace {

[[nodiscard]] bool is_slug_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

[[nodiscard]] char to_lower_ascii(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

void strip_trailing_hyphens(std::string& s) {
    while (!s.empty() && s.back() == '-') {
        s.pop_back();
    }
}

[[nodiscard]] std::string truncate(std::string s, std::size_t max_length) {
    if (s.size() > max_length) {
        s.resize(max_length);
        strip_trailing_hyphens(s);
    }
    return s;
}

} // namespace

std::string sanitize(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool pending_hyphen = false;
    for (char raw : text) {
        const char c = to_lower_ascii(raw);
        if (is_slug_char(c)) {
            // Leading separators are dropped by only emitting between kept chars.
            if (pending_hyphen && !out.empty()) {
                out.push_back('-');
            }
            pending_hyphen = false;
            out.push_back(c);
        } else {
            pending_hyphen = true;
        }
    }

    out = truncate(std::move(out), MAX_LENGTH);
    if (out.empty()) {
        return std::string(FALLBACK);
    }
    return out;
}

std::string generate(std::string_view title,
                     const std::optional<std::string>& explicit_slug,
                     const std::set<std::string>& sibling_slugs) {
    const auto base = explicit_slug ? sanitize(*explicit_slug) : sanitize(title);
    if (!sibling_slugs.contains(base)) {
        return base;
    }

    for (std::size_t n = 2;; ++n) {
        const auto suffix = "-" + std::to_string(n);
        auto stem = truncate(base, MAX_LENGTH - suffix.size());
        if (stem.empty()) {
            stem = std::string(FALLBACK);
        }
        auto candidate = stem + suffix;
        if (!sibling_slugs.contains(candidate)) {
            return candidate;
        }
    }
}

bool is_valid(std::string_view slug) {
    if (slug.empty() || slug.size() > MAX_LENGTH) {
        return false;
    }
    if (slug.front() == '-' || slug.back() == '-') {
        return false;
    }
    for (char c : slug) {
        if (!is_slug_char(c) && c != '-') {
            return false;
        }
    }
    return true;
}

} // namespace folio::slug
