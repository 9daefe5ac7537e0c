#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace quire::storage {

struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS entities (
                id TEXT PRIMARY KEY,
                title TEXT NOT NULL DEFAULT '',
                body TEXT NOT NULL DEFAULT '',
                annotation TEXT NOT NULL DEFAULT '',
                tags_json TEXT NOT NULL DEFAULT '[]',
                derived_text TEXT NOT NULL DEFAULT '',
                payload BLOB NOT NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                analyzed_at INTEGER
            );
            CREATE INDEX IF NOT EXISTS idx_entities_title ON entities(title);

            -- No foreign keys: dangling links are detected and repaired above the store
            CREATE TABLE IF NOT EXISTS links (
                id TEXT PRIMARY KEY,
                source_id TEXT NOT NULL,
                target_id TEXT NOT NULL,
                relation TEXT NOT NULL DEFAULT '',
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_links_source ON links(source_id);
            CREATE INDEX IF NOT EXISTS idx_links_target ON links(target_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS links;
            DROP TABLE IF EXISTS entities;
        )SQL"
    },
    {
        .version = 2,
        .name = "fts5_search",
        .up_sql = R"SQL(
            CREATE VIRTUAL TABLE IF NOT EXISTS entity_fts USING fts5(
                entity_id UNINDEXED,
                title,
                body,
                annotation,
                derived_text,
                tokenize='porter unicode61 remove_diacritics 2'
            );

            CREATE TRIGGER IF NOT EXISTS entities_ai AFTER INSERT ON entities BEGIN
                INSERT INTO entity_fts(entity_id, title, body, annotation, derived_text)
                VALUES (new.id, new.title, new.body, new.annotation, new.derived_text);
            END;

            CREATE TRIGGER IF NOT EXISTS entities_ad AFTER DELETE ON entities BEGIN
                DELETE FROM entity_fts WHERE entity_id = old.id;
            END;

            CREATE TRIGGER IF NOT EXISTS entities_au AFTER UPDATE ON entities BEGIN
                DELETE FROM entity_fts WHERE entity_id = old.id;
                INSERT INTO entity_fts(entity_id, title, body, annotation, derived_text)
                VALUES (new.id, new.title, new.body, new.annotation, new.derived_text);
            END;

            INSERT INTO entity_fts(entity_id, title, body, annotation, derived_text)
            SELECT id, title, body, annotation, derived_text FROM entities;
        )SQL",
        .down_sql = R"SQL(
            DROP TRIGGER IF EXISTS entities_au;
            DROP TRIGGER IF EXISTS entities_ad;
            DROP TRIGGER IF EXISTS entities_ai;
            DROP TABLE IF EXISTS entity_fts;
        )SQL"
    }
};

/**
 * MigrationRunner - applies and reverts schema migrations, tracking the
 * applied set in `schema_migrations`.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

/**
 * Bring a database up to the latest schema.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace quire::storage
