#include "consistency/validators.hpp"
#include "storage/entity_repository.hpp"
#include "storage/migrations.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <tuple>

namespace quire::consistency {

namespace {

constexpr auto kClockSkew = std::chrono::minutes(1);

IntegrityIssue issue(IssueSeverity severity, IssueCategory category, std::string description,
                     std::set<Uuid> affected, const std::string& validator) {
    return IntegrityIssue{severity, category, std::move(description), std::move(affected), validator};
}

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

// Entities in first-seen order
std::vector<const Entity*> by_creation(const StoreState& state) {
    std::vector<const Entity*> out;
    out.reserve(state.entities.size());
    for (const auto& [id, entity] : state.entities) {
        out.push_back(&entity);
    }
    std::stable_sort(out.begin(), out.end(), [](const Entity* a, const Entity* b) {
        return std::tie(a->created_at, a->id) < std::tie(b->created_at, b->id);
    });
    return out;
}

} // anonymous namespace

const char* issue_severity_name(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::Info: return "info";
        case IssueSeverity::Warning: return "warning";
        case IssueSeverity::Critical: return "critical";
    }
    return "unknown";
}

const char* issue_category_name(IssueCategory category) {
    switch (category) {
        case IssueCategory::OrphanedData: return "orphaned-data";
        case IssueCategory::MissingReference: return "missing-reference";
        case IssueCategory::DuplicateEntry: return "duplicate-entry";
        case IssueCategory::InvalidRelationship: return "invalid-relationship";
        case IssueCategory::SchemaViolation: return "schema-violation";
        case IssueCategory::DataCorruption: return "data-corruption";
        case IssueCategory::DerivedInconsistency: return "derived-inconsistency";
        case IssueCategory::CacheInconsistency: return "cache-inconsistency";
        case IssueCategory::CrossValidation: return "cross-validation";
    }
    return "unknown";
}

// ============================================================================
// EntityValidator
// ============================================================================

Res<std::vector<IntegrityIssue>> EntityValidator::validate(const ValidationContext& ctx) const {
    std::vector<IntegrityIssue> out;
    const bool full = ctx.depth == CheckDepth::Full;
    const auto validator = name();

    for (const auto* entity : by_creation(ctx.state)) {
        const auto& id = entity->id;
        if (id.is_nil()) {
            out.push_back(issue(IssueSeverity::Critical, IssueCategory::SchemaViolation,
                                "Entity " + quoted(entity->title) + " has a nil id", {id}, validator));
        }
        if (entity->payload.empty()) {
            out.push_back(issue(IssueSeverity::Critical, IssueCategory::OrphanedData,
                                "Entity " + id.to_string() + " has no payload", {id}, validator));
        }
        if (entity->title.empty()) {
            out.push_back(issue(IssueSeverity::Critical, IssueCategory::MissingReference,
                                "Entity " + id.to_string() + " has no title", {id}, validator));
        }
        if (entity->created_at.millis() < 0) {
            out.push_back(issue(IssueSeverity::Critical, IssueCategory::MissingReference,
                                "Entity " + id.to_string() + " has an invalid creation time", {id}, validator));
        }
        for (const auto& tag : entity->tags) {
            if (tag.empty() || tag.size() > ctx.max_tag_length) {
                out.push_back(issue(IssueSeverity::Critical, IssueCategory::InvalidRelationship,
                                    "Entity " + id.to_string() + " has invalid tag " + quoted(tag),
                                    {id}, validator));
                break;
            }
        }
        if (full && entity->created_at > ctx.now + kClockSkew) {
            out.push_back(issue(IssueSeverity::Warning, IssueCategory::SchemaViolation,
                                "Entity " + id.to_string() + " was created in the future", {id}, validator));
        }
    }

    // Duplicates: same title and payload is critical, same title alone a warning
    std::map<std::string, std::vector<const Entity*>> by_title;
    for (const auto* entity : by_creation(ctx.state)) {
        if (!entity->title.empty()) {
            by_title[entity->title].push_back(entity);
        }
    }
    for (const auto& [title, group] : by_title) {
        if (group.size() < 2) continue;

        std::map<std::vector<uint8_t>, std::set<Uuid>> by_payload;
        for (const auto* entity : group) {
            if (!entity->payload.empty()) by_payload[entity->payload].insert(entity->id);
        }
        bool exact = false;
        for (const auto& [payload, ids] : by_payload) {
            if (ids.size() < 2) continue;
            exact = true;
            out.push_back(issue(IssueSeverity::Critical, IssueCategory::DuplicateEntry,
                                std::to_string(ids.size()) + " entities share title " + quoted(title) +
                                    " and payload",
                                ids, validator));
        }
        if (!exact && full) {
            std::set<Uuid> ids;
            for (const auto* entity : group) ids.insert(entity->id);
            out.push_back(issue(IssueSeverity::Warning, IssueCategory::DuplicateEntry,
                                std::to_string(ids.size()) + " entities share title " + quoted(title),
                                ids, validator));
        }
    }

    return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
}

// ============================================================================
// RelationshipValidator
// ============================================================================

Res<std::vector<IntegrityIssue>> RelationshipValidator::validate(const ValidationContext& ctx) const {
    std::vector<IntegrityIssue> out;
    const auto validator = name();
    std::map<Uuid, std::vector<Uuid>> edges;

    for (const auto& [id, link] : ctx.state.links) {
        if (link.source == link.target) {
            out.push_back(issue(IssueSeverity::Critical, IssueCategory::InvalidRelationship,
                                "Link " + id.to_string() + " points at its own source",
                                {id, link.source}, validator));
            continue;
        }
        const bool source_ok = ctx.state.entities.count(link.source) > 0;
        const bool target_ok = ctx.state.entities.count(link.target) > 0;
        if (!source_ok || !target_ok) {
            std::set<Uuid> affected{id};
            if (source_ok) affected.insert(link.source);
            if (target_ok) affected.insert(link.target);
            out.push_back(issue(IssueSeverity::Critical, IssueCategory::InvalidRelationship,
                                "Link " + id.to_string() + " has a missing " +
                                    (source_ok ? "target" : "source"),
                                std::move(affected), validator));
            continue;
        }
        edges[link.source].push_back(link.target);
    }

    if (ctx.depth != CheckDepth::Full) {
        return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
    }

    // Depth-first search; a back edge closes a cycle
    enum class Mark { White, Grey, Black };
    std::map<Uuid, Mark> marks;
    std::vector<Uuid> path;

    std::function<void(const Uuid&)> visit = [&](const Uuid& node) {
        marks[node] = Mark::Grey;
        path.push_back(node);
        for (const auto& next : edges[node]) {
            auto mark = marks[next];
            if (mark == Mark::Grey) {
                auto start = std::find(path.begin(), path.end(), next);
                std::set<Uuid> cycle(start, path.end());
                out.push_back(issue(IssueSeverity::Warning, IssueCategory::InvalidRelationship,
                                    "Links form a cycle through " + std::to_string(cycle.size()) + " entities",
                                    std::move(cycle), validator));
            } else if (mark == Mark::White) {
                visit(next);
            }
        }
        path.pop_back();
        marks[node] = Mark::Black;
    };

    for (const auto& entry : ctx.state.entities) {
        if (marks[entry.first] == Mark::White) visit(entry.first);
    }

    return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
}

// ============================================================================
// DerivedDataValidator
// ============================================================================

Res<std::vector<IntegrityIssue>> DerivedDataValidator::validate(const ValidationContext& ctx) const {
    std::vector<IntegrityIssue> out;
    if (ctx.depth != CheckDepth::Full) {
        return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
    }
    const auto validator = name();

    for (const auto& [id, entity] : ctx.state.entities) {
        if (!entity.analyzed_at) {
            if (!entity.derived_text.empty()) {
                out.push_back(issue(IssueSeverity::Warning, IssueCategory::DerivedInconsistency,
                                    "Entity " + id.to_string() + " has derived text but no analysis time",
                                    {id}, validator));
            } else {
                out.push_back(issue(IssueSeverity::Info, IssueCategory::DerivedInconsistency,
                                    "Entity " + id.to_string() + " has not been analyzed", {id}, validator));
            }
            continue;
        }
        if (*entity.analyzed_at < entity.created_at) {
            out.push_back(issue(IssueSeverity::Warning, IssueCategory::DerivedInconsistency,
                                "Entity " + id.to_string() + " was analyzed before it was created",
                                {id}, validator));
        } else if (*entity.analyzed_at > ctx.now + kClockSkew) {
            out.push_back(issue(IssueSeverity::Warning, IssueCategory::DerivedInconsistency,
                                "Entity " + id.to_string() + " has an analysis time in the future",
                                {id}, validator));
        }
    }
    return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
}

// ============================================================================
// CacheValidator
// ============================================================================

Res<std::vector<IntegrityIssue>> CacheValidator::validate(const ValidationContext& ctx) const {
    std::vector<IntegrityIssue> out;
    if (ctx.depth != CheckDepth::Full) {
        return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
    }

    auto rows = ctx.repo.search_cache_rows();
    if (rows.is_err()) {
        return Res<std::vector<IntegrityIssue>>::err(rows.unwrap_err().with_context("Cannot read search cache"));
    }
    const auto& cache = rows.unwrap();
    const auto validator = name();

    for (const auto& [id, entity] : ctx.state.entities) {
        auto [first, last] = cache.equal_range(id.to_string());
        const auto count = std::distance(first, last);
        if (count == 0) {
            out.push_back(issue(IssueSeverity::Warning, IssueCategory::CacheInconsistency,
                                "Entity " + id.to_string() + " is missing from the search cache",
                                {id}, validator));
            continue;
        }
        storage::SearchRow expected{entity.title, entity.body, entity.annotation, entity.derived_text};
        if (count > 1 || !(first->second == expected)) {
            out.push_back(issue(IssueSeverity::Warning, IssueCategory::CacheInconsistency,
                                "Search cache for entity " + id.to_string() + " is stale",
                                {id}, validator));
        }
    }

    for (auto it = cache.begin(); it != cache.end(); it = cache.upper_bound(it->first)) {
        auto id = Uuid::parse(it->first);
        if (!id || !ctx.state.entities.count(*id)) {
            std::set<Uuid> affected;
            if (id) affected.insert(*id);
            out.push_back(issue(IssueSeverity::Warning, IssueCategory::CacheInconsistency,
                                "Search cache holds unknown entity " + it->first,
                                std::move(affected), validator));
        }
    }
    return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
}

// ============================================================================
// StorageValidator
// ============================================================================

Res<std::vector<IntegrityIssue>> StorageValidator::validate(const ValidationContext& ctx) const {
    std::vector<IntegrityIssue> out;
    const auto validator = name();
    auto& db = ctx.repo.database();

    auto check = db.quick_check();
    if (check.is_err()) {
        out.push_back(issue(IssueSeverity::Critical, IssueCategory::DataCorruption,
                            "Integrity check could not run: " + check.unwrap_err().message, {}, validator));
    } else if (check.unwrap() != std::vector<std::string>{"ok"}) {
        std::string detail = check.unwrap().empty() ? std::string("no result") : check.unwrap().front();
        out.push_back(issue(IssueSeverity::Critical, IssueCategory::DataCorruption,
                            "Database integrity check failed: " + detail, {}, validator));
    }

    storage::MigrationRunner runner(db);
    auto version = runner.current_version();
    if (version.is_err()) {
        return Res<std::vector<IntegrityIssue>>::err(version.unwrap_err().with_context("Cannot read schema version"));
    }
    if (version.unwrap() < storage::MigrationRunner::latest_version()) {
        out.push_back(issue(IssueSeverity::Critical, IssueCategory::SchemaViolation,
                            "Schema version " + std::to_string(version.unwrap()) + " is behind " +
                                std::to_string(storage::MigrationRunner::latest_version()),
                            {}, validator));
    }
    return Res<std::vector<IntegrityIssue>>::ok(std::move(out));
}

std::vector<std::unique_ptr<Validator>> default_validators() {
    std::vector<std::unique_ptr<Validator>> out;
    out.push_back(std::make_unique<EntityValidator>());
    out.push_back(std::make_unique<RelationshipValidator>());
    out.push_back(std::make_unique<DerivedDataValidator>());
    out.push_back(std::make_unique<CacheValidator>());
    out.push_back(std::make_unique<StorageValidator>());
    return out;
}

std::vector<IntegrityIssue> cross_validate(const std::vector<IntegrityIssue>& issues) {
    std::map<Uuid, std::set<std::string>> reporters;
    for (const auto& i : issues) {
        if (i.severity == IssueSeverity::Info) continue;
        for (const auto& id : i.affected) {
            reporters[id].insert(i.validator);
        }
    }

    std::vector<IntegrityIssue> out;
    for (const auto& [id, validators] : reporters) {
        if (validators.size() < 2) continue;
        std::string names;
        for (const auto& v : validators) {
            if (!names.empty()) names += ", ";
            names += v;
        }
        out.push_back(issue(IssueSeverity::Warning, IssueCategory::CrossValidation,
                            "Entity " + id.to_string() + " flagged by " + names, {id}, "cross-validation"));
    }
    return out;
}

} // namespace quire::consistency
