#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/entity_repository.hpp"
#include "storage/migrations.hpp"
#include "core/checksum.hpp"
#include "support/store_fixture.hpp"

#include <algorithm>

using namespace quire;
using namespace quire::storage;
using quire::testing::make_entity;
using quire::testing::make_link;

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 2);
        REQUIRE(stmt.column_text(1) == "Bob");

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto first = db.execute("INSERT INTO test VALUES (1);");
            if (first.is_err()) return first;
            return db.execute("INSERT INTO test VALUES (2);");
        });

        REQUIRE(result.is_ok());
        REQUIRE_FALSE(db.in_transaction());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            REQUIRE(db.in_transaction());
            REQUIRE(db.execute("INSERT INTO test VALUES (2);").is_ok());
            return Result<void, Error>::err(Error{"forced error"});
        });

        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);  // Rollback happened
    }

    SECTION("Failed SQL reports a storage error") {
        auto result = db.execute("SELECT * FROM missing_table;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::Storage);
        REQUIRE(result.unwrap_err().detail != 0);
    }

    SECTION("Quick check of a fresh database is ok") {
        auto rows = db.quick_check();
        REQUIRE(rows.is_ok());
        REQUIRE(rows.unwrap() == std::vector<std::string>{"ok"});
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        auto version = runner.current_version();
        REQUIRE(version.is_ok());
        REQUIRE(version.unwrap() == 0);
    }

    SECTION("Migrate to latest") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Rollback drops the search cache") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.rollback_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute("SELECT * FROM entity_fts;").is_err());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.execute("SELECT * FROM entity_fts;").is_ok());
    }
}

TEST_CASE("EntityRepository entities", "[storage]") {
    quire::testing::Store store;
    auto& repo = store.repo;

    auto entity = make_entity("Groceries");
    entity.tags = {"home", "errands"};
    entity.analyzed_at = Timestamp(1'700'000'100'000);

    SECTION("Insert and get round-trips every field") {
        REQUIRE(repo.insert_entity(entity).is_ok());

        auto loaded = repo.get_entity(entity.id);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap().has_value());
        REQUIRE(*loaded.unwrap() == entity);
    }

    SECTION("Insert of an existing id fails") {
        REQUIRE(repo.insert_entity(entity).is_ok());
        auto again = repo.insert_entity(entity);
        REQUIRE(again.is_err());
        REQUIRE(again.unwrap_err().code == ErrorCode::AlreadyExists);
    }

    SECTION("Update and remove of a missing entity fail with NotFound") {
        REQUIRE(repo.update_entity(entity).unwrap_err().code == ErrorCode::NotFound);
        REQUIRE(repo.remove_entity(entity.id).unwrap_err().code == ErrorCode::NotFound);
    }

    SECTION("Upsert inserts then overwrites") {
        REQUIRE(repo.upsert_entity(entity).is_ok());
        entity.title = "Weekly groceries";
        REQUIRE(repo.upsert_entity(entity).is_ok());

        REQUIRE(repo.count_entities().unwrap() == 1);
        REQUIRE(repo.get_entity(entity.id).unwrap()->title == "Weekly groceries");
    }

    SECTION("Missing entity reads as empty") {
        auto loaded = repo.get_entity(Uuid::generate());
        REQUIRE(loaded.is_ok());
        REQUIRE_FALSE(loaded.unwrap().has_value());
    }
}

TEST_CASE("EntityRepository links", "[storage]") {
    quire::testing::Store store;
    auto& repo = store.repo;

    auto a = make_entity("A");
    auto b = make_entity("B");
    auto c = make_entity("C");
    for (const auto& e : {a, b, c}) REQUIRE(repo.insert_entity(e).is_ok());

    auto ab = make_link(a.id, b.id);
    auto bc = make_link(b.id, c.id);
    REQUIRE(repo.insert_link(ab).is_ok());
    REQUIRE(repo.insert_link(bc).is_ok());

    SECTION("links_of returns both directions") {
        auto links = repo.links_of(b.id).unwrap();
        REQUIRE(links.size() == 2);
        REQUIRE(repo.links_of(a.id).unwrap().size() == 1);
    }

    SECTION("Removing an entity does not cascade") {
        REQUIRE(repo.remove_entity(a.id).is_ok());
        auto dangling = repo.get_link(ab.id).unwrap();
        REQUIRE(dangling.has_value());
        REQUIRE(dangling->source == a.id);
    }

    SECTION("Generic record access dispatches by kind") {
        auto record = repo.get(RecordRef{RecordKind::Link, bc.id}).unwrap();
        REQUIRE(record.has_value());
        REQUIRE(std::get<Link>(*record) == bc);

        REQUIRE(repo.remove(RecordRef{RecordKind::Link, bc.id}).is_ok());
        REQUIRE_FALSE(repo.get(RecordRef{RecordKind::Link, bc.id}).unwrap().has_value());
    }
}

TEST_CASE("EntityRepository whole-store operations", "[storage]") {
    quire::testing::Store store;
    auto& repo = store.repo;

    auto a = make_entity("Alpha");
    auto b = make_entity("Beta");
    REQUIRE(repo.insert_entity(a).is_ok());
    REQUIRE(repo.insert_entity(b).is_ok());
    REQUIRE(repo.insert_link(make_link(a.id, b.id)).is_ok());

    SECTION("Checksum matches the exported state") {
        auto state = repo.export_state().unwrap();
        REQUIRE(state.entities.size() == 2);
        REQUIRE(state.links.size() == 1);
        REQUIRE(repo.checksum().unwrap() == state_checksum(state));
        REQUIRE(repo.checksum().unwrap().size() == 64);
    }

    SECTION("Checksum changes with content") {
        auto before = repo.checksum().unwrap();
        a.title = "Alpha prime";
        REQUIRE(repo.update_entity(a).is_ok());
        REQUIRE(repo.checksum().unwrap() != before);
    }

    SECTION("replace_all installs exactly the given state") {
        auto original = repo.export_state().unwrap();

        StoreState other;
        auto c = make_entity("Gamma");
        other.entities[c.id] = c;
        REQUIRE(repo.replace_all(other).is_ok());
        REQUIRE(repo.export_state().unwrap() == other);

        REQUIRE(repo.replace_all(original).is_ok());
        REQUIRE(repo.export_state().unwrap() == original);
    }
}

TEST_CASE("EntityRepository search cache", "[storage]") {
    quire::testing::Store store;
    auto& repo = store.repo;

    auto note = make_entity("Quarterly report");
    note.body = "Revenue figures for the third quarter";
    REQUIRE(repo.insert_entity(note).is_ok());

    SECTION("Triggers keep the cache in step") {
        auto hits = repo.search("revenue").unwrap();
        REQUIRE(hits == std::vector<Uuid>{note.id});

        note.body = "Nothing about money";
        REQUIRE(repo.update_entity(note).is_ok());
        REQUIRE(repo.search("revenue").unwrap().empty());

        REQUIRE(repo.remove_entity(note.id).is_ok());
        REQUIRE(repo.search_cache_rows().unwrap().empty());
    }

    SECTION("Rebuild repairs a stale cache") {
        REQUIRE(store.db.execute("DELETE FROM entity_fts;").is_ok());
        REQUIRE(repo.search_cache_rows().unwrap().empty());

        REQUIRE(repo.rebuild_search_cache().is_ok());
        auto rows = repo.search_cache_rows().unwrap();
        REQUIRE(rows.size() == 1);
        REQUIRE(rows.begin()->first == note.id.to_string());
        REQUIRE(rows.begin()->second.title == "Quarterly report");
    }
}
