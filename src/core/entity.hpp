#pragma once

#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quire {

/**
 * Entity - one captured note.
 *
 * `payload` holds the captured bytes; an entity without payload has lost
 * its content and is considered orphaned. `derived_text` and `analyzed_at`
 * are written by background analyzers, everything else by the user.
 */
struct Entity {
    Uuid id;
    std::string title;
    std::string body;
    std::string annotation;
    std::vector<std::string> tags;
    std::string derived_text;
    std::vector<uint8_t> payload;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> analyzed_at;

    bool operator==(const Entity&) const = default;
};

/**
 * Link - a directed relationship between two entities.
 */
struct Link {
    Uuid id;
    Uuid source;
    Uuid target;
    std::string relation;
    Timestamp created_at;

    [[nodiscard]] bool touches(const Uuid& entity_id) const noexcept {
        return source == entity_id || target == entity_id;
    }

    bool operator==(const Link&) const = default;
};

/**
 * EntityPatch - the fields an edit sets. Unset fields are left alone.
 */
struct EntityPatch {
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<std::string> annotation;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> derived_text;
    std::optional<std::vector<uint8_t>> payload;
    std::optional<Timestamp> analyzed_at;

    [[nodiscard]] bool empty() const;

    /**
     * Names of the fields this patch sets, in declaration order.
     */
    [[nodiscard]] std::vector<std::string> fields() const;

    /**
     * True when no content field is set by both patches.
     */
    [[nodiscard]] bool disjoint_with(const EntityPatch& other) const;

    /**
     * Combine two patches. Fields set in `other` win.
     */
    [[nodiscard]] EntityPatch merged_with(const EntityPatch& other) const;

    /**
     * Apply the patch and stamp updated_at.
     */
    [[nodiscard]] Entity apply_to(Entity entity, Timestamp now) const;

    bool operator==(const EntityPatch&) const = default;
};

enum class RecordKind {
    Entity,
    Link
};

using Record = std::variant<Entity, Link>;

struct RecordRef {
    RecordKind kind;
    Uuid id;

    bool operator==(const RecordRef&) const = default;
};

[[nodiscard]] Uuid record_id(const Record& record);
[[nodiscard]] RecordKind record_kind(const Record& record);
[[nodiscard]] RecordRef record_ref(const Record& record);
[[nodiscard]] const char* record_kind_name(RecordKind kind);

/**
 * StoreState - the full contents of the store, ordered by id.
 *
 * This is the unit of snapshots, backups and checksums.
 */
struct StoreState {
    std::map<Uuid, Entity> entities;
    std::map<Uuid, Link> links;

    [[nodiscard]] std::vector<Link> links_of(const Uuid& entity_id) const;
    [[nodiscard]] bool contains(const RecordRef& ref) const;
    [[nodiscard]] std::optional<Record> find(const RecordRef& ref) const;

    void put(const Record& record);
    void erase(const RecordRef& ref);

    bool operator==(const StoreState&) const = default;
};

/**
 * Merge an imported copy into an existing entity: non-empty imported
 * fields win, tags are unioned in first-seen order.
 */
[[nodiscard]] Entity merge_entities(const Entity& existing, const Entity& imported, Timestamp now);

} // namespace quire
