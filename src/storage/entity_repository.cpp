#include "storage/entity_repository.hpp"
#include "core/checksum.hpp"
#include "core/serialization.hpp"

#include <QJsonArray>
#include <QJsonDocument>

namespace quire::storage {

namespace {

constexpr const char* ENTITY_COLUMNS =
    "id, title, body, annotation, tags_json, derived_text, payload, "
    "created_at, updated_at, analyzed_at";

constexpr const char* LINK_COLUMNS = "id, source_id, target_id, relation, created_at";

std::string tags_to_json(const std::vector<std::string>& tags) {
    QJsonArray array;
    for (const auto& tag : tags) {
        array.append(json::to_qstring(tag));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Compact).toStdString();
}

std::vector<std::string> tags_from_json(const std::string& text) {
    std::vector<std::string> tags;
    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(text));
    for (const auto& value : doc.array()) {
        tags.push_back(json::to_std(value.toString()));
    }
    return tags;
}

template<typename T>
Result<std::vector<T>, Error> collect(Database& db, const std::string& sql,
                                      const std::function<T(Statement&)>& convert) {
    std::vector<T> out;
    auto result = db.query(sql, [&](Statement& stmt) { out.push_back(convert(stmt)); });
    if (result.is_err()) {
        return Result<std::vector<T>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<T>, Error>::ok(std::move(out));
}

} // anonymous namespace

Entity EntityRepository::row_to_entity(Statement& stmt) {
    Entity entity{
        .id = stmt.column_uuid(0),
        .title = stmt.column_text(1),
        .body = stmt.column_text(2),
        .annotation = stmt.column_text(3),
        .tags = tags_from_json(stmt.column_text(4)),
        .derived_text = stmt.column_text(5),
        .payload = stmt.column_blob(6),
        .created_at = stmt.column_timestamp(7),
        .updated_at = stmt.column_timestamp(8),
        .analyzed_at = std::nullopt,
    };
    if (!stmt.column_is_null(9)) {
        entity.analyzed_at = stmt.column_timestamp(9);
    }
    return entity;
}

Link EntityRepository::row_to_link(Statement& stmt) {
    return Link{
        .id = stmt.column_uuid(0),
        .source = stmt.column_uuid(1),
        .target = stmt.column_uuid(2),
        .relation = stmt.column_text(3),
        .created_at = stmt.column_timestamp(4),
    };
}

Result<void, Error> EntityRepository::require_changed(const char* what, const Uuid& id) {
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error::structural(
            std::string(what) + " not found: " + id.to_string(), ErrorCode::NotFound));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Entities
// ============================================================================

Result<std::optional<Entity>, Error> EntityRepository::get_entity(const Uuid& id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + ENTITY_COLUMNS +
                                   " FROM entities WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Entity>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_uuid(1, id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Entity>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Entity>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Entity>, Error>::ok(row_to_entity(stmt));
}

Result<void, Error> EntityRepository::write_entity(const std::string& sql, const Entity& entity) {
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_uuid(1, entity.id);
    stmt.bind_text(2, entity.title);
    stmt.bind_text(3, entity.body);
    stmt.bind_text(4, entity.annotation);
    stmt.bind_text(5, tags_to_json(entity.tags));
    stmt.bind_text(6, entity.derived_text);
    stmt.bind_blob(7, entity.payload.data(), entity.payload.size());
    stmt.bind_timestamp(8, entity.created_at);
    stmt.bind_timestamp(9, entity.updated_at);
    if (entity.analyzed_at) {
        stmt.bind_timestamp(10, *entity.analyzed_at);
    } else {
        stmt.bind_null(10);
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> EntityRepository::insert_entity(const Entity& entity) {
    auto existing = get_entity(entity.id);
    if (existing.is_err()) {
        return Result<void, Error>::err(existing.unwrap_err());
    }
    if (existing.unwrap().has_value()) {
        return Result<void, Error>::err(Error::structural(
            "Entity already exists: " + entity.id.to_string(), ErrorCode::AlreadyExists));
    }
    return write_entity(std::string("INSERT INTO entities (") + ENTITY_COLUMNS +
                        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", entity);
}

Result<void, Error> EntityRepository::update_entity(const Entity& entity) {
    // Parameter order follows ENTITY_COLUMNS so write_entity can bind it.
    auto result = write_entity(R"SQL(
        UPDATE entities SET
            id = ?1, title = ?2, body = ?3, annotation = ?4, tags_json = ?5,
            derived_text = ?6, payload = ?7, created_at = ?8, updated_at = ?9,
            analyzed_at = ?10
        WHERE id = ?1;
    )SQL", entity);
    if (result.is_err()) return result;
    return require_changed("Entity", entity.id);
}

Result<void, Error> EntityRepository::upsert_entity(const Entity& entity) {
    return write_entity(std::string("INSERT INTO entities (") + ENTITY_COLUMNS + R"SQL()
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            title = excluded.title,
            body = excluded.body,
            annotation = excluded.annotation,
            tags_json = excluded.tags_json,
            derived_text = excluded.derived_text,
            payload = excluded.payload,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at,
            analyzed_at = excluded.analyzed_at;
    )SQL", entity);
}

Result<void, Error> EntityRepository::remove_entity(const Uuid& id) {
    auto stmt_result = db_.prepare("DELETE FROM entities WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_uuid(1, id);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return require_changed("Entity", id);
}

Result<std::vector<Entity>, Error> EntityRepository::all_entities() {
    return collect<Entity>(db_,
        std::string("SELECT ") + ENTITY_COLUMNS + " FROM entities ORDER BY created_at, id;",
        [this](Statement& stmt) { return row_to_entity(stmt); });
}

Result<int, Error> EntityRepository::count_entities() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM entities;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

// ============================================================================
// Links
// ============================================================================

Result<std::optional<Link>, Error> EntityRepository::get_link(const Uuid& id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + LINK_COLUMNS +
                                   " FROM links WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Link>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_uuid(1, id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Link>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Link>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Link>, Error>::ok(row_to_link(stmt));
}

Result<void, Error> EntityRepository::write_link(const std::string& sql, const Link& link) {
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_uuid(1, link.id);
    stmt.bind_uuid(2, link.source);
    stmt.bind_uuid(3, link.target);
    stmt.bind_text(4, link.relation);
    stmt.bind_timestamp(5, link.created_at);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> EntityRepository::insert_link(const Link& link) {
    auto existing = get_link(link.id);
    if (existing.is_err()) {
        return Result<void, Error>::err(existing.unwrap_err());
    }
    if (existing.unwrap().has_value()) {
        return Result<void, Error>::err(Error::structural(
            "Link already exists: " + link.id.to_string(), ErrorCode::AlreadyExists));
    }
    return write_link(std::string("INSERT INTO links (") + LINK_COLUMNS +
                      ") VALUES (?, ?, ?, ?, ?);", link);
}

Result<void, Error> EntityRepository::update_link(const Link& link) {
    auto result = write_link(R"SQL(
        UPDATE links SET
            id = ?1, source_id = ?2, target_id = ?3, relation = ?4, created_at = ?5
        WHERE id = ?1;
    )SQL", link);
    if (result.is_err()) return result;
    return require_changed("Link", link.id);
}

Result<void, Error> EntityRepository::remove_link(const Uuid& id) {
    auto stmt_result = db_.prepare("DELETE FROM links WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_uuid(1, id);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return require_changed("Link", id);
}

Result<std::vector<Link>, Error> EntityRepository::links_of(const Uuid& entity_id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + LINK_COLUMNS +
        " FROM links WHERE source_id = ?1 OR target_id = ?1 ORDER BY id;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Link>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_uuid(1, entity_id);

    std::vector<Link> links;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Link>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        links.push_back(row_to_link(stmt));
    }
    return Result<std::vector<Link>, Error>::ok(std::move(links));
}

Result<std::vector<Link>, Error> EntityRepository::all_links() {
    return collect<Link>(db_,
        std::string("SELECT ") + LINK_COLUMNS + " FROM links ORDER BY id;",
        [this](Statement& stmt) { return row_to_link(stmt); });
}

// ============================================================================
// Records
// ============================================================================

Result<std::optional<Record>, Error> EntityRepository::get(const RecordRef& ref) {
    if (ref.kind == RecordKind::Entity) {
        return get_entity(ref.id).map([](std::optional<Entity> e) -> std::optional<Record> {
            if (!e) return std::nullopt;
            return Record{std::move(*e)};
        });
    }
    return get_link(ref.id).map([](std::optional<Link> l) -> std::optional<Record> {
        if (!l) return std::nullopt;
        return Record{std::move(*l)};
    });
}

Result<void, Error> EntityRepository::insert(const Record& record) {
    if (auto* entity = std::get_if<Entity>(&record)) {
        return insert_entity(*entity);
    }
    return insert_link(std::get<Link>(record));
}

Result<void, Error> EntityRepository::update(const Record& record) {
    if (auto* entity = std::get_if<Entity>(&record)) {
        return update_entity(*entity);
    }
    return update_link(std::get<Link>(record));
}

Result<void, Error> EntityRepository::remove(const RecordRef& ref) {
    if (ref.kind == RecordKind::Entity) {
        return remove_entity(ref.id);
    }
    return remove_link(ref.id);
}

// ============================================================================
// Whole store
// ============================================================================

Result<StoreState, Error> EntityRepository::export_state() {
    auto entities = all_entities();
    if (entities.is_err()) {
        return Result<StoreState, Error>::err(entities.unwrap_err());
    }
    auto links = all_links();
    if (links.is_err()) {
        return Result<StoreState, Error>::err(links.unwrap_err());
    }

    StoreState state;
    for (auto& entity : entities.unwrap()) {
        state.entities[entity.id] = std::move(entity);
    }
    for (auto& link : links.unwrap()) {
        state.links[link.id] = std::move(link);
    }
    return Result<StoreState, Error>::ok(std::move(state));
}

Result<void, Error> EntityRepository::replace_all(const StoreState& state) {
    auto cleared = db_.execute("DELETE FROM links; DELETE FROM entities;");
    if (cleared.is_err()) return cleared;

    for (const auto& [id, entity] : state.entities) {
        auto result = upsert_entity(entity);
        if (result.is_err()) return result;
    }
    for (const auto& [id, link] : state.links) {
        auto result = write_link(std::string("INSERT INTO links (") + LINK_COLUMNS +
                                 ") VALUES (?, ?, ?, ?, ?);", link);
        if (result.is_err()) return result;
    }
    return Result<void, Error>::ok();
}

Result<std::string, Error> EntityRepository::checksum() {
    return export_state().map([](const StoreState& state) { return state_checksum(state); });
}

// ============================================================================
// Search cache
// ============================================================================

Result<std::vector<Uuid>, Error> EntityRepository::search(const std::string& query) {
    auto stmt_result = db_.prepare(
        "SELECT entity_id FROM entity_fts WHERE entity_fts MATCH ? ORDER BY rank;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Uuid>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, query);

    std::vector<Uuid> ids;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Uuid>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        ids.push_back(stmt.column_uuid(0));
    }
    return Result<std::vector<Uuid>, Error>::ok(std::move(ids));
}

Result<std::multimap<std::string, SearchRow>, Error> EntityRepository::search_cache_rows() {
    std::multimap<std::string, SearchRow> rows;
    auto result = db_.query(
        "SELECT entity_id, title, body, annotation, derived_text FROM entity_fts;",
        [&](Statement& stmt) {
            rows.emplace(stmt.column_text(0), SearchRow{
                .title = stmt.column_text(1),
                .body = stmt.column_text(2),
                .annotation = stmt.column_text(3),
                .derived_text = stmt.column_text(4),
            });
        });
    if (result.is_err()) {
        return Result<std::multimap<std::string, SearchRow>, Error>::err(result.unwrap_err());
    }
    return Result<std::multimap<std::string, SearchRow>, Error>::ok(std::move(rows));
}

Result<void, Error> EntityRepository::rebuild_search_cache() {
    return db_.execute(R"SQL(
        DELETE FROM entity_fts;
        INSERT INTO entity_fts(entity_id, title, body, annotation, derived_text)
        SELECT id, title, body, annotation, derived_text FROM entities;
    )SQL");
}

} // namespace quire::storage
