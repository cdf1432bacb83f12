#include "rpc/json_codec.hpp"

#include <QJsonValue>
#include <QString>

namespace folio::rpc {

namespace {

[[nodiscard]] QString qstr(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

[[nodiscard]] QJsonValue optional_text(const std::optional<std::string>& text) {
    return text ? QJsonValue(qstr(*text)) : QJsonValue(QJsonValue::Null);
}

[[nodiscard]] QJsonValue time_to_json(const Timestamp& ts) {
    return qstr(ts.to_iso_string());
}

} // namespace

QJsonObject page_to_json(const PageView& view) {
    const auto& page = view.page;
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(page.id));
    obj.insert(QStringLiteral("title"), qstr(page.title));
    obj.insert(QStringLiteral("slug"), qstr(page.slug));
    obj.insert(QStringLiteral("path"), qstr(view.path));
    obj.insert(QStringLiteral("parent_id"),
               page.parent_id ? QJsonValue(static_cast<qint64>(*page.parent_id))
                              : QJsonValue(QJsonValue::Null));
    obj.insert(QStringLiteral("position"), page.position);
    obj.insert(QStringLiteral("template"), qstr(page.template_name));
    obj.insert(QStringLiteral("description"), optional_text(page.description));
    obj.insert(QStringLiteral("keywords"), optional_text(page.keywords));
    obj.insert(QStringLiteral("has_children"), view.has_children);
    obj.insert(QStringLiteral("created_at"), time_to_json(page.created_at));
    obj.insert(QStringLiteral("updated_at"), time_to_json(page.updated_at));
    return obj;
}

QJsonObject tree_to_json(const PageNode& node) {
    auto obj = page_to_json(node.view);
    QJsonArray children;
    for (const auto& child : node.children) {
        children.append(tree_to_json(child));
    }
    obj.insert(QStringLiteral("children"), children);
    return obj;
}

QJsonArray pages_to_json(const std::vector<PageView>& views) {
    QJsonArray out;
    for (const auto& view : views) {
        out.append(page_to_json(view));
    }
    return out;
}

QJsonObject component_to_json(const components::Component& component) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(component.id));
    obj.insert(QStringLiteral("page_id"), static_cast<qint64>(component.page_id));
    obj.insert(QStringLiteral("position"), component.position);
    obj.insert(QStringLiteral("component_type"), qstr(components::type_name(component.type)));
    obj.insert(QStringLiteral("title"), optional_text(component.title));
    obj.insert(QStringLiteral("body"), qstr(component.body));
    obj.insert(QStringLiteral("template"), qstr(component.template_name));
    obj.insert(QStringLiteral("created_at"), time_to_json(component.created_at));
    obj.insert(QStringLiteral("updated_at"), time_to_json(component.updated_at));
    return obj;
}

QJsonArray components_to_json(const std::vector<components::Component>& list) {
    QJsonArray out;
    for (const auto& component : list) {
        out.append(component_to_json(component));
    }
    return out;
}

QJsonObject status_to_json(const VersionStatus& status) {
    QJsonObject obj;
    obj.insert(QStringLiteral("page_id"), static_cast<qint64>(status.page_id));
    obj.insert(QStringLiteral("has_published"), status.has_published);
    obj.insert(QStringLiteral("has_draft_changes"), status.has_draft_changes);
    obj.insert(QStringLiteral("draft_count"), static_cast<qint64>(status.draft_count));
    obj.insert(QStringLiteral("published_count"), static_cast<qint64>(status.published_count));
    obj.insert(QStringLiteral("published_at"),
               status.published_at ? time_to_json(*status.published_at)
                                   : QJsonValue(QJsonValue::Null));
    return obj;
}

QJsonObject publish_to_json(const PublishInfo& info) {
    QJsonObject obj;
    obj.insert(QStringLiteral("page_id"), static_cast<qint64>(info.page_id));
    obj.insert(QStringLiteral("component_count"), static_cast<qint64>(info.component_count));
    obj.insert(QStringLiteral("published_at"), time_to_json(info.published_at));
    return obj;
}

QJsonObject discard_to_json(const DiscardInfo& info) {
    QJsonObject obj;
    obj.insert(QStringLiteral("page_id"), static_cast<qint64>(info.page_id));
    obj.insert(QStringLiteral("component_count"), static_cast<qint64>(info.component_count));
    return obj;
}

QJsonObject delete_summary_to_json(const DeleteSummary& summary) {
    QJsonObject obj;
    obj.insert(QStringLiteral("deleted_pages"), static_cast<qint64>(summary.deleted_pages));
    obj.insert(QStringLiteral("deleted_components"), static_cast<qint64>(summary.deleted_components));
    return obj;
}

QJsonObject error_to_json(const Error& error) {
    QJsonObject obj;
    obj.insert(QStringLiteral("kind"), qstr(kind_name(error.kind)));
    obj.insert(QStringLiteral("message"), qstr(error.message));
    return obj;
}

} // namespace folio::rpc
