#pragma once

#include "core/entity.hpp"
#include "core/types.hpp"
#include "storage/database.hpp"
#include "storage/entity_repository.hpp"
#include "storage/migrations.hpp"

#include <string>
#include <vector>

namespace quire::testing {

/**
 * In-memory store at the latest schema.
 */
struct Store {
    storage::Database db;
    storage::EntityRepository repo;

    Store() : db(storage::Database::open_memory().unwrap()), repo(db) {
        storage::initialize_database(db).unwrap();
    }

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
};

inline Timestamp at_seconds(int64_t seconds) {
    return Timestamp(1'700'000'000'000 + seconds * 1000);
}

inline Entity make_entity(const std::string& title, int64_t created_second = 0) {
    Entity entity;
    entity.id = Uuid::generate();
    entity.title = title;
    entity.body = "Body of " + title;
    entity.payload = std::vector<uint8_t>(title.begin(), title.end());
    entity.payload.push_back(0x01);
    entity.created_at = at_seconds(created_second);
    entity.updated_at = entity.created_at;
    return entity;
}

inline Link make_link(const Uuid& source, const Uuid& target, const std::string& relation = "related") {
    Link link;
    link.id = Uuid::generate();
    link.source = source;
    link.target = target;
    link.relation = relation;
    link.created_at = at_seconds(0);
    return link;
}

} // namespace quire::testing
