#pragma once

#include "core/entity.hpp"
#include "core/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace quire {

namespace changes {

struct EntityCreated {
    Entity entity;
    bool operator==(const EntityCreated&) const = default;
};

struct EntityDeleted {
    Uuid entity_id;
    bool operator==(const EntityDeleted&) const = default;
};

struct EntityModified {
    Uuid entity_id;
    EntityPatch patch;
    bool operator==(const EntityModified&) const = default;
};

struct LinkAdded {
    Link link;
    bool operator==(const LinkAdded&) const = default;
};

struct LinkRemoved {
    Link link;
    bool operator==(const LinkRemoved&) const = default;
};

// Either field may be left unset; a change setting only tags and one
// setting only the annotation touch disjoint fields.
struct AnnotationChanged {
    Uuid entity_id;
    std::optional<std::string> annotation;
    std::optional<std::vector<std::string>> tags;
    bool operator==(const AnnotationChanged&) const = default;
};

struct DerivedAnalysisUpdated {
    Uuid entity_id;
    std::optional<std::string> derived_text;
    std::optional<std::vector<std::string>> tags;
    bool operator==(const DerivedAnalysisUpdated&) const = default;
};

struct BulkImport {
    std::vector<Entity> entities;
    bool operator==(const BulkImport&) const = default;
};

} // namespace changes

using ChangeKind = std::variant<
    changes::EntityCreated,
    changes::EntityDeleted,
    changes::EntityModified,
    changes::LinkAdded,
    changes::LinkRemoved,
    changes::AnnotationChanged,
    changes::DerivedAnalysisUpdated,
    changes::BulkImport
>;

/**
 * Who produced a change. User edits outrank derived (analyzer) output.
 */
enum class Origin {
    User,
    Derived
};

/**
 * ChangeRecord - immutable description of one semantic edit.
 */
struct ChangeRecord {
    Uuid id;
    ChangeKind kind;
    Timestamp timestamp;
    Origin origin{Origin::User};
    std::optional<double> confidence;
    // Version the producer read before computing this change, if known.
    std::optional<Uuid> base_version;

    bool operator==(const ChangeRecord&) const = default;
};

/**
 * Build a change with a fresh id and the default origin for its kind.
 */
[[nodiscard]] ChangeRecord make_change(ChangeKind kind, Timestamp at = Timestamp::now());

[[nodiscard]] ChangeRecord make_change(ChangeKind kind, Origin origin, Timestamp at = Timestamp::now());

[[nodiscard]] Origin default_origin(const ChangeKind& kind);

[[nodiscard]] const char* kind_name(const ChangeKind& kind);

[[nodiscard]] const char* origin_name(Origin origin);

/**
 * Entity and link ids the change touches. Link changes include both
 * endpoints as well as the link id.
 */
[[nodiscard]] std::set<Uuid> affected_ids(const ChangeRecord& change);

/**
 * One-line human description used in history entries and conflict reports.
 */
[[nodiscard]] std::string describe(const ChangeRecord& change);

[[nodiscard]] inline bool is_user_initiated(const ChangeRecord& change) {
    return change.origin == Origin::User;
}

/**
 * The entity-field patch a change implies for `entity_id`, if it
 * modifies fields of an existing entity.
 */
[[nodiscard]] std::optional<EntityPatch> patch_for(const ChangeRecord& change);

[[nodiscard]] bool is_deletion(const ChangeRecord& change);

} // namespace quire
