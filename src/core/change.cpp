#include "core/change.hpp"

#include <sstream>
#include <type_traits>

namespace quire {

namespace {

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

Origin default_origin(const ChangeKind& kind) {
    if (std::holds_alternative<changes::DerivedAnalysisUpdated>(kind) ||
        std::holds_alternative<changes::BulkImport>(kind)) {
        return Origin::Derived;
    }
    return Origin::User;
}

ChangeRecord make_change(ChangeKind kind, Timestamp at) {
    auto origin = default_origin(kind);
    return make_change(std::move(kind), origin, at);
}

ChangeRecord make_change(ChangeKind kind, Origin origin, Timestamp at) {
    return ChangeRecord{
        .id = Uuid::generate(),
        .kind = std::move(kind),
        .timestamp = at,
        .origin = origin,
        .confidence = std::nullopt,
        .base_version = std::nullopt,
    };
}

const char* kind_name(const ChangeKind& kind) {
    return std::visit(overloaded{
        [](const changes::EntityCreated&) { return "entity-created"; },
        [](const changes::EntityDeleted&) { return "entity-deleted"; },
        [](const changes::EntityModified&) { return "entity-modified"; },
        [](const changes::LinkAdded&) { return "link-added"; },
        [](const changes::LinkRemoved&) { return "link-removed"; },
        [](const changes::AnnotationChanged&) { return "annotation-changed"; },
        [](const changes::DerivedAnalysisUpdated&) { return "derived-analysis-updated"; },
        [](const changes::BulkImport&) { return "bulk-import"; },
    }, kind);
}

const char* origin_name(Origin origin) {
    return origin == Origin::User ? "user" : "derived";
}

std::set<Uuid> affected_ids(const ChangeRecord& change) {
    return std::visit(overloaded{
        [](const changes::EntityCreated& c) { return std::set<Uuid>{c.entity.id}; },
        [](const changes::EntityDeleted& c) { return std::set<Uuid>{c.entity_id}; },
        [](const changes::EntityModified& c) { return std::set<Uuid>{c.entity_id}; },
        [](const changes::LinkAdded& c) {
            return std::set<Uuid>{c.link.id, c.link.source, c.link.target};
        },
        [](const changes::LinkRemoved& c) {
            return std::set<Uuid>{c.link.id, c.link.source, c.link.target};
        },
        [](const changes::AnnotationChanged& c) { return std::set<Uuid>{c.entity_id}; },
        [](const changes::DerivedAnalysisUpdated& c) { return std::set<Uuid>{c.entity_id}; },
        [](const changes::BulkImport& c) {
            std::set<Uuid> ids;
            for (const auto& e : c.entities) ids.insert(e.id);
            return ids;
        },
    }, change.kind);
}

std::string describe(const ChangeRecord& change) {
    std::ostringstream oss;
    std::visit(overloaded{
        [&](const changes::EntityCreated& c) {
            oss << "Created \"" << c.entity.title << "\"";
        },
        [&](const changes::EntityDeleted& c) {
            oss << "Deleted entity " << c.entity_id.short_hex();
        },
        [&](const changes::EntityModified& c) {
            oss << "Modified entity " << c.entity_id.short_hex() << " (";
            auto fields = c.patch.fields();
            for (size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << fields[i];
            }
            oss << ")";
        },
        [&](const changes::LinkAdded& c) {
            oss << "Linked " << c.link.source.short_hex() << " -> " << c.link.target.short_hex();
        },
        [&](const changes::LinkRemoved& c) {
            oss << "Unlinked " << c.link.source.short_hex() << " -> " << c.link.target.short_hex();
        },
        [&](const changes::AnnotationChanged& c) {
            oss << "Annotated entity " << c.entity_id.short_hex();
        },
        [&](const changes::DerivedAnalysisUpdated& c) {
            oss << "Analysis updated for entity " << c.entity_id.short_hex();
        },
        [&](const changes::BulkImport& c) {
            oss << "Imported " << c.entities.size() << " entities";
        },
    }, change.kind);
    oss << " [" << origin_name(change.origin) << "]";
    return oss.str();
}

std::optional<EntityPatch> patch_for(const ChangeRecord& change) {
    if (auto* m = std::get_if<changes::EntityModified>(&change.kind)) {
        return m->patch;
    }
    if (auto* a = std::get_if<changes::AnnotationChanged>(&change.kind)) {
        EntityPatch patch;
        patch.annotation = a->annotation;
        patch.tags = a->tags;
        return patch;
    }
    if (auto* d = std::get_if<changes::DerivedAnalysisUpdated>(&change.kind)) {
        EntityPatch patch;
        patch.derived_text = d->derived_text;
        patch.tags = d->tags;
        patch.analyzed_at = change.timestamp;
        return patch;
    }
    return std::nullopt;
}

bool is_deletion(const ChangeRecord& change) {
    return std::holds_alternative<changes::EntityDeleted>(change.kind) ||
           std::holds_alternative<changes::LinkRemoved>(change.kind);
}

} // namespace quire
