#include "storage/document_codec.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>

namespace docsync::storage::codec {

namespace {

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

QJsonValue optional_text(const std::optional<std::string>& value) {
    return value ? QJsonValue(q(*value)) : QJsonValue(QJsonValue::Null);
}

QJsonValue optional_millis(const std::optional<Timestamp>& value) {
    return value ? QJsonValue(static_cast<qint64>(value->millis())) : QJsonValue(QJsonValue::Null);
}

std::optional<std::string> read_optional_text(const QJsonObject& obj, const char* key) {
    const auto value = obj.value(QLatin1String(key));
    if (value.isNull() || value.isUndefined()) return std::nullopt;
    return value.toString().toStdString();
}

std::optional<Timestamp> read_optional_millis(const QJsonObject& obj, const char* key) {
    const auto value = obj.value(QLatin1String(key));
    if (value.isNull() || value.isUndefined()) return std::nullopt;
    return Timestamp(value.toInteger());
}

QJsonArray refs_array(const std::vector<std::string>& refs) {
    QJsonArray array;
    for (const auto& ref : refs) {
        array.append(q(ref));
    }
    return array;
}

std::vector<std::string> read_refs(const QJsonArray& array) {
    std::vector<std::string> refs;
    refs.reserve(static_cast<size_t>(array.size()));
    for (const auto& value : array) {
        refs.push_back(value.toString().toStdString());
    }
    return refs;
}

Result<QJsonDocument, Error> parse(std::string_view json) {
    QJsonParseError parse_error{};
    auto doc = QJsonDocument::fromJson(
        QByteArray(json.data(), static_cast<qsizetype>(json.size())), &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<QJsonDocument, Error>::err(Error::storage(
            "Invalid JSON column: " + parse_error.errorString().toStdString()));
    }
    return Result<QJsonDocument, Error>::ok(std::move(doc));
}

} // namespace

std::string encode_refs(const std::vector<std::string>& refs) {
    return QJsonDocument(refs_array(refs)).toJson(QJsonDocument::Compact).toStdString();
}

Result<std::vector<std::string>, Error> decode_refs(std::string_view json) {
    if (json.empty()) {
        return Result<std::vector<std::string>, Error>::ok({});
    }
    auto parsed = parse(json);
    if (parsed.is_err()) return propagate<std::vector<std::string>>(parsed);
    if (!parsed.unwrap().isArray()) {
        return Result<std::vector<std::string>, Error>::err(
            Error::storage("attachment_refs column is not a JSON array"));
    }
    return Result<std::vector<std::string>, Error>::ok(read_refs(parsed.unwrap().array()));
}

std::string encode_document(const Document& doc) {
    QJsonObject obj;
    obj[QStringLiteral("localId")] = static_cast<qint64>(doc.local_id);
    obj[QStringLiteral("syncId")] = optional_text(doc.sync_id);
    obj[QStringLiteral("userId")] = q(doc.user_id);
    obj[QStringLiteral("title")] = q(doc.title);
    obj[QStringLiteral("category")] = q(doc.category);
    obj[QStringLiteral("notes")] = optional_text(doc.notes);
    obj[QStringLiteral("attachmentRefs")] = refs_array(doc.attachment_refs);
    obj[QStringLiteral("renewalDate")] = optional_millis(doc.renewal_date);
    obj[QStringLiteral("version")] = static_cast<qint64>(doc.version);
    obj[QStringLiteral("serverVersion")] = static_cast<qint64>(doc.server_version);
    obj[QStringLiteral("createdAt")] = static_cast<qint64>(doc.created_at.millis());
    obj[QStringLiteral("lastModified")] = static_cast<qint64>(doc.last_modified.millis());
    obj[QStringLiteral("syncState")] = QString::fromLatin1(to_string(doc.sync_state).data(),
                                                           static_cast<qsizetype>(to_string(doc.sync_state).size()));
    obj[QStringLiteral("conflictId")] = optional_text(doc.conflict_id);
    obj[QStringLiteral("deleted")] = doc.deleted;
    obj[QStringLiteral("deletedAt")] = optional_millis(doc.deleted_at);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact).toStdString();
}

Result<Document, Error> decode_document(std::string_view json) {
    auto parsed = parse(json);
    if (parsed.is_err()) return propagate<Document>(parsed);
    if (!parsed.unwrap().isObject()) {
        return Result<Document, Error>::err(Error::storage("document snapshot is not a JSON object"));
    }
    const auto obj = parsed.unwrap().object();

    const auto state_text = obj.value(QStringLiteral("syncState")).toString().toStdString();
    const auto state = parse_sync_state(state_text);
    if (!state) {
        return Result<Document, Error>::err(
            Error::storage("Unknown sync state in snapshot: '" + state_text + "'"));
    }

    return Result<Document, Error>::ok(Document{
        .local_id = obj.value(QStringLiteral("localId")).toInteger(),
        .sync_id = read_optional_text(obj, "syncId"),
        .user_id = obj.value(QStringLiteral("userId")).toString().toStdString(),
        .title = obj.value(QStringLiteral("title")).toString().toStdString(),
        .category = obj.value(QStringLiteral("category")).toString().toStdString(),
        .notes = read_optional_text(obj, "notes"),
        .attachment_refs = read_refs(obj.value(QStringLiteral("attachmentRefs")).toArray()),
        .renewal_date = read_optional_millis(obj, "renewalDate"),
        .version = obj.value(QStringLiteral("version")).toInteger(),
        .server_version = obj.value(QStringLiteral("serverVersion")).toInteger(),
        .created_at = Timestamp(obj.value(QStringLiteral("createdAt")).toInteger()),
        .last_modified = Timestamp(obj.value(QStringLiteral("lastModified")).toInteger()),
        .sync_state = *state,
        .conflict_id = read_optional_text(obj, "conflictId"),
        .deleted = obj.value(QStringLiteral("deleted")).toBool(),
        .deleted_at = read_optional_millis(obj, "deletedAt"),
    });
}

} // namespace docsync::storage::codec
