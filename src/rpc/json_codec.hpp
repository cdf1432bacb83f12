#pragma once

#include "core/content_engine.hpp"

#include <QJsonArray>
#include <QJsonObject>

namespace folio::rpc {

// Engine values as they appear in responses. Ids are JSON numbers,
// timestamps ISO-8601 UTC strings, absent optionals null.

[[nodiscard]] QJsonObject page_to_json(const PageView& view);

// { ...page, "children": [ ... ] }
[[nodiscard]] QJsonObject tree_to_json(const PageNode& node);

[[nodiscard]] QJsonArray pages_to_json(const std::vector<PageView>& views);

[[nodiscard]] QJsonObject component_to_json(const components::Component& component);

[[nodiscard]] QJsonArray components_to_json(const std::vector<components::Component>& list);

[[nodiscard]] QJsonObject status_to_json(const VersionStatus& status);

[[nodiscard]] QJsonObject publish_to_json(const PublishInfo& info);

[[nodiscard]] QJsonObject discard_to_json(const DiscardInfo& info);

[[nodiscard]] QJsonObject delete_summary_to_json(const DeleteSummary& summary);

// { "kind": "NotFound", "message": "..." }
[[nodiscard]] QJsonObject error_to_json(const Error& error);

} // namespace folio::rpc
