#include "consistency/version.hpp"
#include "core/serialization.hpp"

#include <QJsonArray>
#include <QJsonDocument>

#include <map>
#include <optional>
#include <type_traits>

namespace quire::consistency {

RecordRef target_of(const DeltaOperation& op) {
    return std::visit([](const auto& o) -> RecordRef {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, delta::Create>) {
            return record_ref(o.record);
        } else if constexpr (std::is_same_v<T, delta::Update> || std::is_same_v<T, delta::Delete>) {
            return record_ref(o.before);
        } else if constexpr (std::is_same_v<T, delta::Move>) {
            return RecordRef{RecordKind::Link, o.before.id};
        } else {
            return RecordRef{RecordKind::Entity, o.before.id};
        }
    }, op);
}

void apply_forward(const Delta& delta, StoreState& state) {
    for (const auto& op : delta.operations) {
        std::visit([&](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, delta::Create>) {
                state.put(o.record);
            } else if constexpr (std::is_same_v<T, delta::Update>) {
                state.put(o.after);
            } else if constexpr (std::is_same_v<T, delta::Delete>) {
                state.erase(record_ref(o.before));
            } else {
                state.put(Record{o.after});
            }
        }, op);
    }
}

std::vector<Operation> plan_forward(const Delta& delta) {
    std::vector<Operation> out;
    out.reserve(delta.operations.size());
    for (const auto& op : delta.operations) {
        std::visit([&](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, delta::Create>) {
                out.push_back(ops::insert(o.record));
            } else if constexpr (std::is_same_v<T, delta::Update>) {
                out.push_back(ops::update(o.after));
            } else if constexpr (std::is_same_v<T, delta::Delete>) {
                out.push_back(ops::remove(record_ref(o.before)));
            } else {
                out.push_back(ops::update(Record{o.after}));
            }
        }, op);
    }
    return out;
}

std::vector<Operation> plan_reverse(const Delta& delta) {
    std::vector<Operation> out;
    out.reserve(delta.operations.size());
    for (auto it = delta.operations.rbegin(); it != delta.operations.rend(); ++it) {
        std::visit([&](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, delta::Create>) {
                out.push_back(ops::remove(record_ref(o.record)));
            } else if constexpr (std::is_same_v<T, delta::Update>) {
                out.push_back(ops::update(o.before));
            } else if constexpr (std::is_same_v<T, delta::Delete>) {
                out.push_back(ops::insert(o.before));
            } else {
                out.push_back(ops::update(Record{o.before}));
            }
        }, *it);
    }
    return out;
}

std::vector<Operation> plan_replace(const StoreState& current, const StoreState& target) {
    std::vector<Operation> out;

    for (const auto& [id, link] : current.links) {
        if (!target.links.count(id)) out.push_back(ops::remove({RecordKind::Link, id}));
    }
    for (const auto& [id, entity] : current.entities) {
        if (!target.entities.count(id)) out.push_back(ops::remove({RecordKind::Entity, id}));
    }
    for (const auto& [id, entity] : target.entities) {
        auto it = current.entities.find(id);
        if (it == current.entities.end()) {
            out.push_back(ops::insert(entity));
        } else if (!(it->second == entity)) {
            out.push_back(ops::update(entity));
        }
    }
    for (const auto& [id, link] : target.links) {
        auto it = current.links.find(id);
        if (it == current.links.end()) {
            out.push_back(ops::insert(link));
        } else if (!(it->second == link)) {
            out.push_back(ops::update(link));
        }
    }
    return out;
}

namespace {

bool is_noop(const DeltaOperation& op) {
    return std::visit([](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, delta::Create> || std::is_same_v<T, delta::Delete>) {
            return false;
        } else {
            return o.before == o.after;
        }
    }, op);
}

Record after_of(const DeltaOperation& op) {
    return std::visit([](const auto& o) -> Record {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, delta::Create>) {
            return o.record;
        } else if constexpr (std::is_same_v<T, delta::Delete>) {
            return o.before;
        } else {
            return Record{o.after};
        }
    }, op);
}

Record before_of(const DeltaOperation& op) {
    return std::visit([](const auto& o) -> Record {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, delta::Create>) {
            return o.record;
        } else {
            return Record{o.before};
        }
    }, op);
}

} // anonymous namespace

Delta compact(const Delta& input) {
    // Edits to different records commute, so each record can be folded
    // independently into its position of last occurrence.
    std::vector<std::optional<DeltaOperation>> slots;
    std::map<std::pair<int, Uuid>, size_t> last_slot;

    for (const auto& op : input.operations) {
        auto ref = target_of(op);
        auto key = std::make_pair(static_cast<int>(ref.kind), ref.id);
        auto found = last_slot.find(key);

        if (found == last_slot.end() || !slots[found->second]) {
            last_slot[key] = slots.size();
            slots.emplace_back(op);
            continue;
        }

        auto& prev = *slots[found->second];
        const bool prev_create = std::holds_alternative<delta::Create>(prev);
        const bool prev_delete = std::holds_alternative<delta::Delete>(prev);
        const bool cur_create = std::holds_alternative<delta::Create>(op);
        const bool cur_delete = std::holds_alternative<delta::Delete>(op);

        if (prev_delete || cur_create) {
            // delete then re-create: the record's net effect is an update
            if (prev_delete && cur_create) {
                DeltaOperation folded = delta::Update{before_of(prev), after_of(op)};
                slots[found->second].reset();
                last_slot[key] = slots.size();
                slots.emplace_back(std::move(folded));
            } else {
                last_slot[key] = slots.size();
                slots.emplace_back(op);
            }
            continue;
        }

        if (prev_create && cur_delete) {
            slots[found->second].reset();
            last_slot.erase(found);
            continue;
        }

        DeltaOperation folded = prev_create
            ? DeltaOperation{delta::Create{after_of(op)}}
            : cur_delete
                ? DeltaOperation{delta::Delete{before_of(prev)}}
                : DeltaOperation{delta::Update{before_of(prev), after_of(op)}};
        slots[found->second].reset();
        last_slot[key] = slots.size();
        slots.emplace_back(std::move(folded));
    }

    Delta out;
    for (auto& slot : slots) {
        if (slot && !is_noop(*slot)) {
            out.operations.push_back(std::move(*slot));
        }
    }
    return out;
}

QJsonObject to_json(const DeltaOperation& op) {
    return std::visit([](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, delta::Create>) {
            return QJsonObject{{"op", "create"}, {"record", json::to_json(o.record)}};
        } else if constexpr (std::is_same_v<T, delta::Update>) {
            return QJsonObject{{"op", "update"},
                               {"before", json::to_json(o.before)},
                               {"after", json::to_json(o.after)}};
        } else if constexpr (std::is_same_v<T, delta::Delete>) {
            return QJsonObject{{"op", "delete"}, {"before", json::to_json(o.before)}};
        } else if constexpr (std::is_same_v<T, delta::Move>) {
            return QJsonObject{{"op", "move"},
                               {"before", json::to_json(o.before)},
                               {"after", json::to_json(o.after)}};
        } else {
            QJsonArray absorbed;
            for (const auto& id : o.absorbed) {
                absorbed.append(json::to_qstring(id.to_string()));
            }
            return QJsonObject{{"op", "merge"},
                               {"before", json::to_json(o.before)},
                               {"after", json::to_json(o.after)},
                               {"absorbed", absorbed}};
        }
    }, op);
}

size_t payload_bytes(const DataVersion& version) {
    if (auto* snapshot = std::get_if<Snapshot>(&version.payload)) {
        return static_cast<size_t>(json::canonical_bytes(snapshot->state).size());
    }
    QJsonArray array;
    for (const auto& op : std::get<Delta>(version.payload).operations) {
        array.append(to_json(op));
    }
    return static_cast<size_t>(QJsonDocument(array).toJson(QJsonDocument::Compact).size());
}

} // namespace quire::consistency
