#include "core/serialization.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace quire::json {

namespace {

Res<Uuid> uuid_field(const QJsonObject& obj, const char* key) {
    auto value = obj.value(QLatin1String(key));
    if (!value.isString()) {
        return Res<Uuid>::err(Error{std::string("Missing field: ") + key, ErrorCode::Parse});
    }
    auto parsed = Uuid::parse(to_std(value.toString()));
    if (!parsed) {
        return Res<Uuid>::err(Error{std::string("Malformed id in field: ") + key, ErrorCode::Parse});
    }
    return Res<Uuid>::ok(*parsed);
}

Timestamp timestamp_field(const QJsonObject& obj, const char* key) {
    return Timestamp(static_cast<int64_t>(obj.value(QLatin1String(key)).toDouble()));
}

std::string string_field(const QJsonObject& obj, const char* key) {
    return to_std(obj.value(QLatin1String(key)).toString());
}

} // anonymous namespace

QString to_qstring(const std::string& s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

std::string to_std(const QString& s) {
    return s.toStdString();
}

QJsonObject to_json(const Entity& entity) {
    QJsonArray tags;
    for (const auto& tag : entity.tags) {
        tags.append(to_qstring(tag));
    }

    QByteArray payload(reinterpret_cast<const char*>(entity.payload.data()),
                       static_cast<qsizetype>(entity.payload.size()));

    QJsonObject obj{
        {"id", to_qstring(entity.id.to_string())},
        {"title", to_qstring(entity.title)},
        {"body", to_qstring(entity.body)},
        {"annotation", to_qstring(entity.annotation)},
        {"tags", tags},
        {"derived_text", to_qstring(entity.derived_text)},
        {"payload", QString::fromLatin1(payload.toBase64())},
        {"created_at", static_cast<double>(entity.created_at.millis())},
        {"updated_at", static_cast<double>(entity.updated_at.millis())},
    };
    if (entity.analyzed_at) {
        obj.insert("analyzed_at", static_cast<double>(entity.analyzed_at->millis()));
    }
    return obj;
}

QJsonObject to_json(const Link& link) {
    return QJsonObject{
        {"id", to_qstring(link.id.to_string())},
        {"source", to_qstring(link.source.to_string())},
        {"target", to_qstring(link.target.to_string())},
        {"relation", to_qstring(link.relation)},
        {"created_at", static_cast<double>(link.created_at.millis())},
    };
}

QJsonObject to_json(const Record& record) {
    QJsonObject obj = std::visit([](const auto& r) { return to_json(r); }, record);
    obj.insert("kind", QLatin1String(record_kind_name(record_kind(record))));
    return obj;
}

QJsonObject to_json(const StoreState& state) {
    QJsonArray entities;
    for (const auto& [id, entity] : state.entities) {
        entities.append(to_json(entity));
    }
    QJsonArray links;
    for (const auto& [id, link] : state.links) {
        links.append(to_json(link));
    }
    return QJsonObject{{"entities", entities}, {"links", links}};
}

Res<Entity> entity_from_json(const QJsonObject& obj) {
    auto id = uuid_field(obj, "id");
    if (id.is_err()) return Res<Entity>::err(id.unwrap_err());

    Entity entity;
    entity.id = id.unwrap();
    entity.title = string_field(obj, "title");
    entity.body = string_field(obj, "body");
    entity.annotation = string_field(obj, "annotation");
    entity.derived_text = string_field(obj, "derived_text");
    for (const auto& tag : obj.value("tags").toArray()) {
        entity.tags.push_back(to_std(tag.toString()));
    }
    auto payload = QByteArray::fromBase64(obj.value("payload").toString().toLatin1());
    entity.payload.assign(payload.begin(), payload.end());
    entity.created_at = timestamp_field(obj, "created_at");
    entity.updated_at = timestamp_field(obj, "updated_at");
    if (obj.contains("analyzed_at")) {
        entity.analyzed_at = timestamp_field(obj, "analyzed_at");
    }
    return Res<Entity>::ok(std::move(entity));
}

Res<Link> link_from_json(const QJsonObject& obj) {
    auto id = uuid_field(obj, "id");
    if (id.is_err()) return Res<Link>::err(id.unwrap_err());
    auto source = uuid_field(obj, "source");
    if (source.is_err()) return Res<Link>::err(source.unwrap_err());
    auto target = uuid_field(obj, "target");
    if (target.is_err()) return Res<Link>::err(target.unwrap_err());

    return Res<Link>::ok(Link{
        .id = id.unwrap(),
        .source = source.unwrap(),
        .target = target.unwrap(),
        .relation = string_field(obj, "relation"),
        .created_at = timestamp_field(obj, "created_at"),
    });
}

Res<Record> record_from_json(const QJsonObject& obj) {
    if (obj.value("kind").toString() == QLatin1String("link")) {
        return link_from_json(obj).map([](Link l) { return Record{std::move(l)}; });
    }
    return entity_from_json(obj).map([](Entity e) { return Record{std::move(e)}; });
}

Res<StoreState> state_from_json(const QJsonObject& obj) {
    if (!obj.value("entities").isArray() || !obj.value("links").isArray()) {
        return Res<StoreState>::err(Error{"State is missing entities or links", ErrorCode::Parse});
    }
    StoreState state;
    for (const auto& value : obj.value("entities").toArray()) {
        auto entity = entity_from_json(value.toObject());
        if (entity.is_err()) return Res<StoreState>::err(entity.unwrap_err());
        auto e = std::move(entity).unwrap();
        state.entities[e.id] = std::move(e);
    }
    for (const auto& value : obj.value("links").toArray()) {
        auto link = link_from_json(value.toObject());
        if (link.is_err()) return Res<StoreState>::err(link.unwrap_err());
        auto l = std::move(link).unwrap();
        state.links[l.id] = std::move(l);
    }
    return Res<StoreState>::ok(std::move(state));
}

QByteArray canonical_bytes(const StoreState& state) {
    return QJsonDocument(to_json(state)).toJson(QJsonDocument::Compact);
}

Res<QJsonObject> parse_object(const QByteArray& bytes) {
    QJsonParseError err{};
    auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError) {
        return Res<QJsonObject>::err(Error{to_std(err.errorString()), ErrorCode::Parse});
    }
    if (!doc.isObject()) {
        return Res<QJsonObject>::err(Error{"Expected a JSON object", ErrorCode::Parse});
    }
    return Res<QJsonObject>::ok(doc.object());
}

} // namespace quire::json
