#pragma once

#include "core/content_engine.hpp"
#include "core/result.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <span>

namespace folio::rpc {

/**
 * Dispatcher - Maps named operations with JSON arguments onto a ContentEngine.
 *
 * Every call returns {"ok": true, "result": ...} or
 * {"ok": false, "error": {"kind": ..., "message": ...}}. Malformed arguments
 * and unknown methods are reported as ValidationError; the dispatcher never
 * throws.
 *
 * The dispatcher holds no state of its own and may be shared between threads
 * as far as the engine allows.
 */
class Dispatcher {
public:
    explicit Dispatcher(ContentEngine& engine) : engine_(engine) {}

    [[nodiscard]] QJsonObject call(const QString& method, const QJsonObject& params) const;

    /**
     * True for methods that may change the site (and so need saving).
     */
    [[nodiscard]] static bool is_mutation(const QString& method);

    [[nodiscard]] static QStringList methods();

private:
    using Handler = Result<QJsonValue> (Dispatcher::*)(const QJsonObject&) const;

    struct Method {
        const char* name;
        Handler handler;
        bool mutates;
    };

    [[nodiscard]] static std::span<const Method> method_table();
    [[nodiscard]] static const Method* find_method(const QString& name);

    // Pages
    [[nodiscard]] Result<QJsonValue> create_page(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> update_page(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> move_page(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> delete_page(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> get_page(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> get_page_by_path(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> list_pages(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> search_pages(const QJsonObject& params) const;

    // Components
    [[nodiscard]] Result<QJsonValue> create_component(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> update_component(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> delete_component(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> move_component(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> move_component_before(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> move_component_after(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> list_components(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> get_component(const QJsonObject& params) const;

    // Versions
    [[nodiscard]] Result<QJsonValue> get_draft_content(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> get_published_content(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> get_version_status(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> publish_draft(const QJsonObject& params) const;
    [[nodiscard]] Result<QJsonValue> discard_draft(const QJsonObject& params) const;

    ContentEngine& engine_;
};

} // namespace folio::rpc
