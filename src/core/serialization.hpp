#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace quire::json {

[[nodiscard]] QString to_qstring(const std::string& s);
[[nodiscard]] std::string to_std(const QString& s);

[[nodiscard]] QJsonObject to_json(const Entity& entity);
[[nodiscard]] QJsonObject to_json(const Link& link);
[[nodiscard]] QJsonObject to_json(const Record& record);
[[nodiscard]] QJsonObject to_json(const StoreState& state);

[[nodiscard]] Res<Entity> entity_from_json(const QJsonObject& obj);
[[nodiscard]] Res<Link> link_from_json(const QJsonObject& obj);
[[nodiscard]] Res<Record> record_from_json(const QJsonObject& obj);
[[nodiscard]] Res<StoreState> state_from_json(const QJsonObject& obj);

/**
 * Compact JSON with sorted keys and id-ordered arrays. Equal states
 * always produce identical bytes.
 */
[[nodiscard]] QByteArray canonical_bytes(const StoreState& state);

[[nodiscard]] Res<QJsonObject> parse_object(const QByteArray& bytes);

} // namespace quire::json
