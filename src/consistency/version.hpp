#pragma once

#include "consistency/operation.hpp"
#include "core/entity.hpp"
#include "core/types.hpp"

#include <QJsonObject>

#include <set>
#include <string>
#include <variant>
#include <vector>

namespace quire::consistency {

namespace delta {

struct Create {
    Record record;
    bool operator==(const Create&) const = default;
};

struct Update {
    Record before;
    Record after;
    bool operator==(const Update&) const = default;
};

struct Delete {
    Record before;
    bool operator==(const Delete&) const = default;
};

// A link re-pointed at different endpoints under the same id.
struct Move {
    Link before;
    Link after;
    bool operator==(const Move&) const = default;
};

// Imported copies folded into an existing entity.
struct Merge {
    Entity before;
    Entity after;
    std::vector<Uuid> absorbed;
    bool operator==(const Merge&) const = default;
};

} // namespace delta

using DeltaOperation = std::variant<delta::Create, delta::Update, delta::Delete, delta::Move, delta::Merge>;

struct Delta {
    std::vector<DeltaOperation> operations;
    bool operator==(const Delta&) const = default;
};

struct Snapshot {
    StoreState state;
    bool operator==(const Snapshot&) const = default;
};

/**
 * DataVersion - one entry of the version history.
 *
 * `checksum` is the store checksum right after this version was applied.
 */
struct DataVersion {
    Uuid id;
    Timestamp timestamp;
    std::string change_kind;
    std::string description;
    std::set<Uuid> affected;
    std::string checksum;
    std::variant<Delta, Snapshot> payload;

    [[nodiscard]] bool is_snapshot() const noexcept {
        return std::holds_alternative<Snapshot>(payload);
    }
};

[[nodiscard]] RecordRef target_of(const DeltaOperation& op);

/**
 * Replay a delta onto an in-memory state.
 */
void apply_forward(const Delta& delta, StoreState& state);

/**
 * Store operations that take the state before `delta` to the state after it.
 */
[[nodiscard]] std::vector<Operation> plan_forward(const Delta& delta);

/**
 * Store operations that undo `delta`, in reverse order.
 */
[[nodiscard]] std::vector<Operation> plan_reverse(const Delta& delta);

/**
 * Store operations that turn `current` into exactly `target`.
 */
[[nodiscard]] std::vector<Operation> plan_replace(const StoreState& current, const StoreState& target);

/**
 * Reduce a delta to its minimal reversible form: successive edits of one
 * record collapse, a create later deleted disappears, no-op edits drop.
 */
[[nodiscard]] Delta compact(const Delta& delta);

[[nodiscard]] QJsonObject to_json(const DeltaOperation& op);

/**
 * Serialized size of the version payload, used for the history byte budget.
 */
[[nodiscard]] size_t payload_bytes(const DataVersion& version);

} // namespace quire::consistency
