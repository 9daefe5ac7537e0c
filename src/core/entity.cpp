#include "core/entity.hpp"

#include <algorithm>
#include <set>
#include <type_traits>

namespace quire {

bool EntityPatch::empty() const {
    return fields().empty();
}

std::vector<std::string> EntityPatch::fields() const {
    std::vector<std::string> out;
    if (title) out.emplace_back("title");
    if (body) out.emplace_back("body");
    if (annotation) out.emplace_back("annotation");
    if (tags) out.emplace_back("tags");
    if (derived_text) out.emplace_back("derived_text");
    if (payload) out.emplace_back("payload");
    if (analyzed_at) out.emplace_back("analyzed_at");
    return out;
}

bool EntityPatch::disjoint_with(const EntityPatch& other) const {
    auto mine = fields();
    auto theirs = other.fields();
    for (const auto& f : mine) {
        // analyzed_at is bookkeeping stamped by every analysis pass
        if (f == "analyzed_at") continue;
        if (std::find(theirs.begin(), theirs.end(), f) != theirs.end()) {
            return false;
        }
    }
    return true;
}

EntityPatch EntityPatch::merged_with(const EntityPatch& other) const {
    EntityPatch out = *this;
    if (other.title) out.title = other.title;
    if (other.body) out.body = other.body;
    if (other.annotation) out.annotation = other.annotation;
    if (other.tags) out.tags = other.tags;
    if (other.derived_text) out.derived_text = other.derived_text;
    if (other.payload) out.payload = other.payload;
    if (other.analyzed_at) out.analyzed_at = other.analyzed_at;
    return out;
}

Entity EntityPatch::apply_to(Entity entity, Timestamp now) const {
    if (title) entity.title = *title;
    if (body) entity.body = *body;
    if (annotation) entity.annotation = *annotation;
    if (tags) entity.tags = *tags;
    if (derived_text) entity.derived_text = *derived_text;
    if (payload) entity.payload = *payload;
    if (analyzed_at) entity.analyzed_at = *analyzed_at;
    entity.updated_at = now;
    return entity;
}

Uuid record_id(const Record& record) {
    return std::visit([](const auto& r) { return r.id; }, record);
}

RecordKind record_kind(const Record& record) {
    return std::holds_alternative<Entity>(record) ? RecordKind::Entity : RecordKind::Link;
}

RecordRef record_ref(const Record& record) {
    return RecordRef{record_kind(record), record_id(record)};
}

const char* record_kind_name(RecordKind kind) {
    return kind == RecordKind::Entity ? "entity" : "link";
}

std::vector<Link> StoreState::links_of(const Uuid& entity_id) const {
    std::vector<Link> out;
    for (const auto& [id, link] : links) {
        if (link.touches(entity_id)) {
            out.push_back(link);
        }
    }
    return out;
}

bool StoreState::contains(const RecordRef& ref) const {
    if (ref.kind == RecordKind::Entity) {
        return entities.count(ref.id) > 0;
    }
    return links.count(ref.id) > 0;
}

std::optional<Record> StoreState::find(const RecordRef& ref) const {
    if (ref.kind == RecordKind::Entity) {
        auto it = entities.find(ref.id);
        if (it == entities.end()) return std::nullopt;
        return Record{it->second};
    }
    auto it = links.find(ref.id);
    if (it == links.end()) return std::nullopt;
    return Record{it->second};
}

void StoreState::put(const Record& record) {
    std::visit([this](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, Entity>) {
            entities[r.id] = r;
        } else {
            links[r.id] = r;
        }
    }, record);
}

void StoreState::erase(const RecordRef& ref) {
    if (ref.kind == RecordKind::Entity) {
        entities.erase(ref.id);
    } else {
        links.erase(ref.id);
    }
}

Entity merge_entities(const Entity& existing, const Entity& imported, Timestamp now) {
    Entity out = existing;
    if (!imported.title.empty()) out.title = imported.title;
    if (!imported.body.empty()) out.body = imported.body;
    if (!imported.annotation.empty()) out.annotation = imported.annotation;
    if (!imported.derived_text.empty()) out.derived_text = imported.derived_text;
    if (!imported.payload.empty()) out.payload = imported.payload;
    if (imported.analyzed_at) out.analyzed_at = imported.analyzed_at;

    std::set<std::string> seen(out.tags.begin(), out.tags.end());
    for (const auto& tag : imported.tags) {
        if (seen.insert(tag).second) {
            out.tags.push_back(tag);
        }
    }
    out.updated_at = now;
    return out;
}

} // namespace quire
