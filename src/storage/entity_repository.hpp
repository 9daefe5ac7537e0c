#pragma once

#include "storage/database.hpp"
#include "core/entity.hpp"
#include "core/result.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quire::storage {

/**
 * SearchRow - one row of the full-text search cache.
 */
struct SearchRow {
    std::string title;
    std::string body;
    std::string annotation;
    std::string derived_text;

    bool operator==(const SearchRow&) const = default;
};

/**
 * EntityRepository - Data access layer for entities and links.
 *
 * Plain CRUD without integrity semantics: links may point at missing
 * entities and nothing is cascaded. Those rules live in the
 * consistency layer.
 */
class EntityRepository {
public:
    explicit EntityRepository(Database& db) : db_(db) {}

    [[nodiscard]] Database& database() { return db_; }

    // Entities

    [[nodiscard]] Result<std::optional<Entity>, Error> get_entity(const Uuid& id);

    /**
     * Insert a new entity. Fails with AlreadyExists if the id is taken.
     */
    [[nodiscard]] Result<void, Error> insert_entity(const Entity& entity);

    /**
     * Overwrite an existing entity. Fails with NotFound if it is missing.
     */
    [[nodiscard]] Result<void, Error> update_entity(const Entity& entity);

    [[nodiscard]] Result<void, Error> upsert_entity(const Entity& entity);

    [[nodiscard]] Result<void, Error> remove_entity(const Uuid& id);

    [[nodiscard]] Result<std::vector<Entity>, Error> all_entities();

    [[nodiscard]] Result<int, Error> count_entities();

    // Links

    [[nodiscard]] Result<std::optional<Link>, Error> get_link(const Uuid& id);
    [[nodiscard]] Result<void, Error> insert_link(const Link& link);
    [[nodiscard]] Result<void, Error> update_link(const Link& link);
    [[nodiscard]] Result<void, Error> remove_link(const Uuid& id);

    /**
     * Links with `entity_id` as either endpoint.
     */
    [[nodiscard]] Result<std::vector<Link>, Error> links_of(const Uuid& entity_id);

    [[nodiscard]] Result<std::vector<Link>, Error> all_links();

    // Generic record access used by transactions

    [[nodiscard]] Result<std::optional<Record>, Error> get(const RecordRef& ref);
    [[nodiscard]] Result<void, Error> insert(const Record& record);
    [[nodiscard]] Result<void, Error> update(const Record& record);
    [[nodiscard]] Result<void, Error> remove(const RecordRef& ref);

    // Whole-store operations

    [[nodiscard]] Result<StoreState, Error> export_state();

    /**
     * Make the store hold exactly `state`. Does not open its own
     * transaction; callers wrap it.
     */
    [[nodiscard]] Result<void, Error> replace_all(const StoreState& state);

    [[nodiscard]] Result<std::string, Error> checksum();

    // Search cache

    /**
     * Entity ids whose cached text matches an FTS5 query.
     */
    [[nodiscard]] Result<std::vector<Uuid>, Error> search(const std::string& query);

    [[nodiscard]] Result<std::multimap<std::string, SearchRow>, Error> search_cache_rows();

    [[nodiscard]] Result<void, Error> rebuild_search_cache();

private:
    Database& db_;

    [[nodiscard]] Entity row_to_entity(Statement& stmt);
    [[nodiscard]] Link row_to_link(Statement& stmt);
    [[nodiscard]] Result<void, Error> write_entity(const std::string& sql, const Entity& entity);
    [[nodiscard]] Result<void, Error> write_link(const std::string& sql, const Link& link);
    [[nodiscard]] Result<void, Error> require_changed(const char* what, const Uuid& id);
};

} // namespace quire::storage
