#include "rpc/dispatcher.hpp"

#include "rpc/json_codec.hpp"
#include "rpc/logging.hpp"

#include <QJsonArray>

#include <cmath>
#include <limits>

namespace folio::rpc {

using components::Component;

namespace {

// Largest integer a JSON number (double) holds exactly.
constexpr double kMaxExactInteger = 9007199254740992.0;

/**
 * Reads typed arguments out of a params object, remembering the first
 * problem instead of failing on the spot. Absent and null optionals are
 * the same thing.
 */
class Args {
public:
    explicit Args(const QJsonObject& params) : params_(params) {}

    [[nodiscard]] int64_t id(const char* key) {
        if (!present(key)) {
            missing(key);
            return 0;
        }
        return read_integer(key).value_or(0);
    }

    [[nodiscard]] std::optional<int> optional_int(const char* key) {
        if (!present(key)) return std::nullopt;
        auto value = read_integer(key);
        if (!value) return std::nullopt;
        if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
            fail(std::string("Argument '") + key + "' is out of range");
            return std::nullopt;
        }
        return static_cast<int>(*value);
    }

    [[nodiscard]] int required_int(const char* key) {
        if (!present(key)) {
            missing(key);
            return 0;
        }
        return optional_int(key).value_or(0);
    }

    [[nodiscard]] std::string text(const char* key) {
        if (!present(key)) {
            missing(key);
            return {};
        }
        return read_text(key).value_or(std::string{});
    }

    [[nodiscard]] std::optional<std::string> optional_text(const char* key) {
        if (!present(key)) return std::nullopt;
        return read_text(key);
    }

    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

private:
    [[nodiscard]] bool present(const char* key) const {
        const auto value = params_.value(QLatin1String(key));
        return !value.isUndefined() && !value.isNull();
    }

    [[nodiscard]] std::optional<int64_t> read_integer(const char* key) {
        const auto value = params_.value(QLatin1String(key));
        if (!value.isDouble()) {
            fail(std::string("Argument '") + key + "' must be an integer");
            return std::nullopt;
        }
        const double d = value.toDouble();
        if (std::trunc(d) != d || std::fabs(d) > kMaxExactInteger) {
            fail(std::string("Argument '") + key + "' must be an integer");
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }

    [[nodiscard]] std::optional<std::string> read_text(const char* key) {
        const auto value = params_.value(QLatin1String(key));
        if (!value.isString()) {
            fail(std::string("Argument '") + key + "' must be a string");
            return std::nullopt;
        }
        return value.toString().toStdString();
    }

    void missing(const char* key) {
        fail(std::string("Missing required argument '") + key + "'");
    }

    void fail(std::string message) {
        if (!error_) {
            error_ = Error::validation(std::move(message));
        }
    }

    const QJsonObject& params_;
    std::optional<Error> error_;
};

template<typename T, typename F>
[[nodiscard]] Result<QJsonValue> to_value(Result<T> result, F&& encode) {
    return std::move(result).map([&encode](const T& value) { return QJsonValue(encode(value)); });
}

[[nodiscard]] Result<QJsonValue> argument_error(const Error& error) {
    return Result<QJsonValue>::err(error);
}

[[nodiscard]] QJsonObject success(const QJsonValue& result) {
    QJsonObject response;
    response.insert(QStringLiteral("ok"), true);
    response.insert(QStringLiteral("result"), result);
    return response;
}

[[nodiscard]] QJsonObject failure(const Error& error) {
    QJsonObject response;
    response.insert(QStringLiteral("ok"), false);
    response.insert(QStringLiteral("error"), error_to_json(error));
    return response;
}

} // namespace

// ============================================================================
// Method table
// ============================================================================

std::span<const Dispatcher::Method> Dispatcher::method_table() {
    static const Method kMethods[] = {
        {"create_page", &Dispatcher::create_page, true},
        {"update_page", &Dispatcher::update_page, true},
        {"move_page", &Dispatcher::move_page, true},
        {"delete_page", &Dispatcher::delete_page, true},
        {"get_page", &Dispatcher::get_page, false},
        {"get_page_by_path", &Dispatcher::get_page_by_path, false},
        {"list_pages", &Dispatcher::list_pages, false},
        {"search_pages", &Dispatcher::search_pages, false},
        {"create_component", &Dispatcher::create_component, true},
        {"update_component", &Dispatcher::update_component, true},
        {"delete_component", &Dispatcher::delete_component, true},
        {"move_component", &Dispatcher::move_component, true},
        {"move_component_before", &Dispatcher::move_component_before, true},
        {"move_component_after", &Dispatcher::move_component_after, true},
        {"list_components", &Dispatcher::list_components, false},
        {"get_component", &Dispatcher::get_component, false},
        {"get_draft_content", &Dispatcher::get_draft_content, false},
        {"get_published_content", &Dispatcher::get_published_content, false},
        {"get_version_status", &Dispatcher::get_version_status, false},
        {"publish_draft", &Dispatcher::publish_draft, true},
        {"discard_draft", &Dispatcher::discard_draft, true},
    };
    return kMethods;
}

const Dispatcher::Method* Dispatcher::find_method(const QString& name) {
    for (const auto& method : method_table()) {
        if (name == QLatin1String(method.name)) {
            return &method;
        }
    }
    return nullptr;
}

QStringList Dispatcher::methods() {
    QStringList out;
    for (const auto& method : method_table()) {
        out.append(QString::fromLatin1(method.name));
    }
    return out;
}

bool Dispatcher::is_mutation(const QString& method) {
    const auto* entry = find_method(method);
    return entry && entry->mutates;
}

QJsonObject Dispatcher::call(const QString& method, const QJsonObject& params) const {
    const auto* entry = find_method(method);
    if (!entry) {
        qCDebug(folioRpcLog) << "unknown method" << method;
        return failure(Error::validation("Unknown method: " + method.toStdString()));
    }

    qCDebug(folioRpcLog) << "call" << method << params;
    auto result = (this->*entry->handler)(params);
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        if (error.kind == ErrorKind::StorageError) {
            qCWarning(folioRpcLog) << method << "failed:" << QString::fromStdString(error.message);
        } else {
            qCDebug(folioRpcLog) << method << "->" << QString::fromUtf8(kind_name(error.kind).data())
                                 << QString::fromStdString(error.message);
        }
        return failure(error);
    }
    return success(result.unwrap());
}

// ============================================================================
// Pages
// ============================================================================

Result<QJsonValue> Dispatcher::create_page(const QJsonObject& params) const {
    Args args(params);
    NewPage request{
        .parent_id = args.id("parent_page_id"),
        .title = args.text("title"),
        .slug = args.optional_text("slug"),
        .template_name = args.optional_text("template"),
        .position = args.optional_int("position"),
        .description = args.optional_text("description"),
        .keywords = args.optional_text("keywords")
    };
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.create_page(request), page_to_json);
}

Result<QJsonValue> Dispatcher::update_page(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("page_id");
    PagePatch patch{
        .title = args.optional_text("title"),
        .slug = args.optional_text("slug"),
        .template_name = args.optional_text("template"),
        .description = args.optional_text("description"),
        .keywords = args.optional_text("keywords")
    };
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.update_page(id, patch), page_to_json);
}

Result<QJsonValue> Dispatcher::move_page(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("page_id");
    const auto new_parent_id = args.id("new_parent_id");
    const auto position = args.optional_int("position");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.move_page(id, new_parent_id, position), page_to_json);
}

Result<QJsonValue> Dispatcher::delete_page(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.delete_page(id), delete_summary_to_json);
}

Result<QJsonValue> Dispatcher::get_page(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.get_page(id), page_to_json);
}

Result<QJsonValue> Dispatcher::get_page_by_path(const QJsonObject& params) const {
    Args args(params);
    const auto path = args.text("path");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.get_page_by_path(path), page_to_json);
}

Result<QJsonValue> Dispatcher::list_pages(const QJsonObject&) const {
    return Result<QJsonValue>::ok(tree_to_json(engine_.list_pages()));
}

Result<QJsonValue> Dispatcher::search_pages(const QJsonObject& params) const {
    Args args(params);
    const auto query = args.text("query");
    if (args.error()) return argument_error(*args.error());
    return Result<QJsonValue>::ok(pages_to_json(engine_.search_pages(query)));
}

// ============================================================================
// Components
// ============================================================================

Result<QJsonValue> Dispatcher::create_component(const QJsonObject& params) const {
    Args args(params);
    const auto page_id = args.id("page_id");
    components::NewComponent fields{
        .body = args.text("body"),
        .title = args.optional_text("title"),
    };
    if (auto template_name = args.optional_text("template")) {
        fields.template_name = std::move(*template_name);
    }
    const auto position = args.optional_int("position");
    const auto type_text = args.optional_text("component_type");
    if (args.error()) return argument_error(*args.error());

    if (type_text) {
        auto type = components::parse_type(*type_text);
        if (!type) {
            return Result<QJsonValue>::err(
                Error::validation("Unknown component_type: " + *type_text));
        }
        fields.type = *type;
    }
    return to_value(engine_.create_component(page_id, fields, position), component_to_json);
}

Result<QJsonValue> Dispatcher::update_component(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("component_id");
    components::ComponentPatch patch{
        .title = args.optional_text("title"),
        .body = args.optional_text("body"),
        .template_name = args.optional_text("template")
    };
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.update_component(id, patch), component_to_json);
}

Result<QJsonValue> Dispatcher::delete_component(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("component_id");
    if (args.error()) return argument_error(*args.error());

    auto removed = engine_.delete_component(id);
    if (removed.is_err()) {
        return Result<QJsonValue>::err(removed.unwrap_err());
    }
    QJsonObject result;
    result.insert(QStringLiteral("deleted"), static_cast<qint64>(id));
    return Result<QJsonValue>::ok(result);
}

Result<QJsonValue> Dispatcher::move_component(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("component_id");
    const auto position = args.required_int("position");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.move_component(id, position), component_to_json);
}

Result<QJsonValue> Dispatcher::move_component_before(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("component_id");
    const auto target_id = args.id("target_component_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.move_component_before(id, target_id), component_to_json);
}

Result<QJsonValue> Dispatcher::move_component_after(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("component_id");
    const auto target_id = args.id("target_component_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.move_component_after(id, target_id), component_to_json);
}

Result<QJsonValue> Dispatcher::list_components(const QJsonObject& params) const {
    Args args(params);
    const auto page_id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.list_components(page_id), components_to_json);
}

Result<QJsonValue> Dispatcher::get_component(const QJsonObject& params) const {
    Args args(params);
    const auto id = args.id("component_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.get_component(id), component_to_json);
}

// ============================================================================
// Versions
// ============================================================================

Result<QJsonValue> Dispatcher::get_draft_content(const QJsonObject& params) const {
    Args args(params);
    const auto page_id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.get_draft_content(page_id), components_to_json);
}

Result<QJsonValue> Dispatcher::get_published_content(const QJsonObject& params) const {
    Args args(params);
    const auto page_id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.get_published_content(page_id), components_to_json);
}

Result<QJsonValue> Dispatcher::get_version_status(const QJsonObject& params) const {
    Args args(params);
    const auto page_id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.version_status(page_id), status_to_json);
}

Result<QJsonValue> Dispatcher::publish_draft(const QJsonObject& params) const {
    Args args(params);
    const auto page_id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());

    auto published = engine_.publish_draft(page_id);
    if (published.is_ok()) {
        qCInfo(folioRpcLog) << "published page" << page_id << "with"
                            << published.unwrap().component_count << "components";
    }
    return to_value(std::move(published), publish_to_json);
}

Result<QJsonValue> Dispatcher::discard_draft(const QJsonObject& params) const {
    Args args(params);
    const auto page_id = args.id("page_id");
    if (args.error()) return argument_error(*args.error());
    return to_value(engine_.discard_draft(page_id), discard_to_json);
}

} // namespace folio::rpc
