#include "consistency/conflict_resolver.hpp"
#include "core/logging.hpp"
#include "storage/entity_repository.hpp"

#include <algorithm>
#include <sstream>

namespace quire::consistency {

namespace {

bool overlaps(const std::set<Uuid>& a, const std::set<Uuid>& b) {
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia == *ib) return true;
        if (*ia < *ib) {
            ++ia;
        } else {
            ++ib;
        }
    }
    return false;
}

bool is_mergeable_kind(const ChangeRecord& change) {
    return std::holds_alternative<changes::AnnotationChanged>(change.kind) ||
           std::holds_alternative<changes::DerivedAnalysisUpdated>(change.kind);
}

std::optional<Uuid> target_entity(const ChangeRecord& change) {
    if (auto* a = std::get_if<changes::AnnotationChanged>(&change.kind)) return a->entity_id;
    if (auto* d = std::get_if<changes::DerivedAnalysisUpdated>(&change.kind)) return d->entity_id;
    return std::nullopt;
}

bool mixed_origins(const std::vector<ChangeRecord>& changes) {
    bool user = false;
    bool derived = false;
    for (const auto& c : changes) {
        (c.origin == Origin::User ? user : derived) = true;
    }
    return user && derived;
}

ConflictSeverity edit_severity(const std::vector<ChangeRecord>& changes) {
    if (mixed_origins(changes)) return ConflictSeverity::Medium;
    return changes.front().origin == Origin::User ? ConflictSeverity::High : ConflictSeverity::Low;
}

template<typename T>
std::optional<T> either(const std::optional<T>& later, const std::optional<T>& earlier) {
    return later ? later : earlier;
}

ChangeRecord merge_pair(const ChangeRecord& a, const ChangeRecord& b) {
    const ChangeRecord& later = a.timestamp >= b.timestamp ? a : b;
    const ChangeRecord& earlier = &later == &a ? b : a;

    ChangeKind kind;
    auto* la = std::get_if<changes::AnnotationChanged>(&later.kind);
    auto* ea = std::get_if<changes::AnnotationChanged>(&earlier.kind);
    auto* ld = std::get_if<changes::DerivedAnalysisUpdated>(&later.kind);
    auto* ed = std::get_if<changes::DerivedAnalysisUpdated>(&earlier.kind);
    if (la && ea) {
        kind = changes::AnnotationChanged{la->entity_id, either(la->annotation, ea->annotation),
                                          either(la->tags, ea->tags)};
    } else if (ld && ed) {
        kind = changes::DerivedAnalysisUpdated{ld->entity_id, either(ld->derived_text, ed->derived_text),
                                               either(ld->tags, ed->tags)};
    } else {
        auto patch = patch_for(earlier).value_or(EntityPatch{}).merged_with(
            patch_for(later).value_or(EntityPatch{}));
        kind = changes::EntityModified{*target_entity(later), std::move(patch)};
    }

    auto merged = make_change(std::move(kind), later.origin, later.timestamp);
    merged.confidence = later.confidence;
    return merged;
}

StrategyOutcome keep_only(const std::vector<ChangeRecord>& changes, size_t winner, std::string message) {
    StrategyOutcome out;
    for (size_t i = 0; i < changes.size(); ++i) {
        (i == winner ? out.accepted : out.rejected).push_back(changes[i]);
    }
    out.success = true;
    out.message = std::move(message);
    return out;
}

StrategyOutcome user_priority(const DataConflict& conflict) {
    StrategyOutcome out;
    for (const auto& change : conflict.changes) {
        (is_user_initiated(change) ? out.accepted : out.rejected).push_back(change);
    }
    out.success = true;
    out.message = "User changes take precedence";
    return out;
}

StrategyOutcome newest_wins(const DataConflict& conflict) {
    size_t winner = 0;
    for (size_t i = 1; i < conflict.changes.size(); ++i) {
        // Ties go to the later entry, which is the incoming change
        if (conflict.changes[i].timestamp >= conflict.changes[winner].timestamp) {
            winner = i;
        }
    }
    return keep_only(conflict.changes, winner, "Most recent change wins");
}

StrategyOutcome content_merge(const DataConflict& conflict) {
    const auto& changes = conflict.changes;
    if (changes.size() == 2 && can_merge(changes[0], changes[1])) {
        StrategyOutcome out;
        out.accepted.push_back(merge_pair(changes[0], changes[1]));
        out.superseded = changes;
        out.success = true;
        out.message = "Changes touch disjoint fields and were merged";
        return out;
    }
    if (mixed_origins(changes)) {
        return user_priority(conflict);
    }
    return newest_wins(conflict);
}

StrategyOutcome highest_confidence(const DataConflict& conflict) {
    size_t winner = 0;
    for (size_t i = 1; i < conflict.changes.size(); ++i) {
        const double candidate = confidence_of(conflict.changes[i]);
        const double best = confidence_of(conflict.changes[winner]);
        if (candidate > best ||
            (candidate == best && conflict.changes[i].timestamp >= conflict.changes[winner].timestamp)) {
            winner = i;
        }
    }
    return keep_only(conflict.changes, winner, "Highest-confidence change wins");
}

StrategyOutcome semantic_merge(const DataConflict& conflict) {
    StrategyOutcome out;
    out.accepted = conflict.changes;

    std::set<Uuid> already_removed;
    for (const auto& change : conflict.changes) {
        if (auto* removed = std::get_if<changes::LinkRemoved>(&change.kind)) {
            already_removed.insert(removed->link.id);
        }
    }

    // Dangling links go first so the delete never leaves them behind
    std::vector<ChangeRecord> removals;
    for (const auto& link : conflict.dangling_links) {
        if (already_removed.count(link.id)) continue;
        const auto& source = conflict.changes.back();
        removals.push_back(make_change(changes::LinkRemoved{link}, source.origin, source.timestamp));
    }
    out.accepted.insert(out.accepted.begin(), removals.begin(), removals.end());

    out.success = true;
    out.message = removals.empty() ? "Changes accepted"
                                   : "Accepted with " + std::to_string(removals.size()) +
                                         " dangling link(s) removed";
    return out;
}

bool contains_change(const std::vector<ChangeRecord>& changes, const Uuid& id) {
    return std::any_of(changes.begin(), changes.end(), [&](const auto& c) { return c.id == id; });
}

void add_unique(std::vector<ChangeRecord>& into, const ChangeRecord& change) {
    if (!contains_change(into, change.id)) {
        into.push_back(change);
    }
}

std::string short_ids(const std::set<Uuid>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ",";
        out += id.short_hex();
    }
    return out;
}

} // anonymous namespace

const char* conflict_type_name(ConflictType type) {
    switch (type) {
        case ConflictType::SimultaneousEdit: return "simultaneous-edit";
        case ConflictType::IntegrityViolation: return "integrity-violation";
        case ConflictType::UserVsDerived: return "user-vs-derived";
        case ConflictType::VersionMismatch: return "version-mismatch";
    }
    return "unknown";
}

const char* severity_name(ConflictSeverity severity) {
    switch (severity) {
        case ConflictSeverity::Low: return "low";
        case ConflictSeverity::Medium: return "medium";
        case ConflictSeverity::High: return "high";
    }
    return "unknown";
}

const char* strategy_name(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::UserPriority: return "user-priority";
        case ResolutionStrategy::Timestamp: return "timestamp";
        case ResolutionStrategy::ContentMerge: return "content-merge";
        case ResolutionStrategy::Confidence: return "confidence";
        case ResolutionStrategy::SemanticMerge: return "semantic-merge";
    }
    return "unknown";
}

bool ConflictResolution::is_accepted(const Uuid& change_id) const {
    return contains_change(accepted, change_id);
}

bool ConflictResolution::is_rejected(const Uuid& change_id) const {
    return contains_change(rejected, change_id);
}

bool ConflictResolution::is_superseded(const Uuid& change_id) const {
    return contains_change(superseded, change_id);
}

double confidence_of(const ChangeRecord& change) {
    if (change.confidence) return *change.confidence;
    return change.origin == Origin::User ? 0.95 : 0.75;
}

bool can_merge(const ChangeRecord& a, const ChangeRecord& b) {
    if (!is_mergeable_kind(a) || !is_mergeable_kind(b)) return false;
    if (target_entity(a) != target_entity(b)) return false;
    auto pa = patch_for(a);
    auto pb = patch_for(b);
    return pa && pb && pa->disjoint_with(*pb);
}

ResolutionStrategy select_strategy(const DataConflict& conflict) {
    switch (conflict.type) {
        case ConflictType::UserVsDerived:
            return ResolutionStrategy::UserPriority;
        case ConflictType::VersionMismatch:
            return ResolutionStrategy::Confidence;
        case ConflictType::IntegrityViolation:
            return ResolutionStrategy::SemanticMerge;
        case ConflictType::SimultaneousEdit:
            break;
    }

    const auto& changes = conflict.changes;
    if (mixed_origins(changes)) {
        return ResolutionStrategy::UserPriority;
    }
    if (changes.size() == 2 && is_mergeable_kind(changes[0]) && is_mergeable_kind(changes[1])) {
        return ResolutionStrategy::ContentMerge;
    }
    return ResolutionStrategy::Timestamp;
}

StrategyOutcome resolve(ResolutionStrategy strategy, const DataConflict& conflict) {
    switch (strategy) {
        case ResolutionStrategy::UserPriority: return user_priority(conflict);
        case ResolutionStrategy::Timestamp: return newest_wins(conflict);
        case ResolutionStrategy::ContentMerge: return content_merge(conflict);
        case ResolutionStrategy::Confidence: return highest_confidence(conflict);
        case ResolutionStrategy::SemanticMerge: return semantic_merge(conflict);
    }
    return StrategyOutcome{};
}

// ============================================================================
// ChangeTracker
// ============================================================================

void ChangeTracker::track(const ChangeRecord& change) {
    if (find(change.id)) return;
    entries_.push_back(TrackedChange{change, affected_ids(change), TrackStatus::Pending, std::nullopt});
    while (entries_.size() > limit_) {
        entries_.pop_front();
    }
}

void ChangeTracker::mark_accepted(const Uuid& change_id, std::optional<Uuid> version_id) {
    if (auto* entry = find_mut(change_id)) {
        entry->status = TrackStatus::Accepted;
        entry->version_id = version_id;
    }
}

void ChangeTracker::mark_rejected(const Uuid& change_id) {
    if (auto* entry = find_mut(change_id)) {
        entry->status = TrackStatus::Rejected;
    }
}

const TrackedChange* ChangeTracker::find(const Uuid& change_id) const {
    for (const auto& entry : entries_) {
        if (entry.change.id == change_id) return &entry;
    }
    return nullptr;
}

TrackedChange* ChangeTracker::find_mut(const Uuid& change_id) {
    for (auto& entry : entries_) {
        if (entry.change.id == change_id) return &entry;
    }
    return nullptr;
}

std::vector<const TrackedChange*> ChangeTracker::accepted() const {
    std::vector<const TrackedChange*> out;
    for (const auto& entry : entries_) {
        if (entry.status == TrackStatus::Accepted) out.push_back(&entry);
    }
    return out;
}

std::vector<const TrackedChange*> ChangeTracker::accepted_since(const Uuid& version_id) const {
    auto base = std::find_if(entries_.begin(), entries_.end(), [&](const auto& entry) {
        return entry.version_id == version_id;
    });
    auto it = base == entries_.end() ? entries_.begin() : std::next(base);

    std::vector<const TrackedChange*> out;
    for (; it != entries_.end(); ++it) {
        if (it->status == TrackStatus::Accepted) out.push_back(&*it);
    }
    return out;
}

// ============================================================================
// ConflictResolver
// ============================================================================

ConflictResolver::ConflictResolver(storage::EntityRepository& repo, Options options)
    : repo_(repo), options_(options), tracker_(options.tracker_limit) {}

Res<std::vector<DataConflict>> ConflictResolver::detect_conflicts(
    const ChangeRecord& change,
    std::optional<Uuid> current_version
) {
    using Out = Res<std::vector<DataConflict>>;
    const auto affected = affected_ids(change);
    const auto now = Timestamp::now();
    std::vector<DataConflict> conflicts;

    auto make_conflict = [&](ConflictType type, std::vector<ChangeRecord> colliding) {
        DataConflict conflict;
        conflict.id = Uuid::generate();
        conflict.type = type;
        conflict.detected_at = now;
        conflict.affected = affected;
        for (const auto& c : colliding) {
            auto ids = affected_ids(c);
            conflict.affected.insert(ids.begin(), ids.end());
        }
        conflict.changes = std::move(colliding);
        conflict.changes.push_back(change);
        return conflict;
    };

    const auto accepted = tracker_.accepted();

    // Simultaneous edits
    std::vector<ChangeRecord> simultaneous;
    for (const auto* tracked : accepted) {
        if (tracked->change.id == change.id) continue;
        auto gap = change.timestamp - tracked->change.timestamp;
        if (gap < std::chrono::milliseconds(0)) gap = -gap;
        if (gap <= options_.simultaneous_edit_window && overlaps(tracked->affected, affected)) {
            simultaneous.push_back(tracked->change);
        }
    }
    if (!simultaneous.empty()) {
        auto conflict = make_conflict(ConflictType::SimultaneousEdit, std::move(simultaneous));
        conflict.severity = edit_severity(conflict.changes);
        conflict.auto_resolvable = true;
        conflict.reason = std::to_string(conflict.changes.size()) + " changes touched the same data within " +
                          std::to_string(options_.simultaneous_edit_window.count()) + " ms";
        conflicts.push_back(std::move(conflict));
    }

    // Derived output must defer to a recent user edit
    if (change.origin == Origin::Derived) {
        std::vector<ChangeRecord> user_edits;
        for (const auto* tracked : accepted) {
            if (tracked->change.origin != Origin::User) continue;
            auto gap = change.timestamp - tracked->change.timestamp;
            if (gap >= std::chrono::milliseconds(0) && gap <= options_.user_precedence_window &&
                overlaps(tracked->affected, affected)) {
                user_edits.push_back(tracked->change);
            }
        }
        if (!user_edits.empty()) {
            auto conflict = make_conflict(ConflictType::UserVsDerived, std::move(user_edits));
            conflict.severity = ConflictSeverity::Medium;
            conflict.auto_resolvable = true;
            conflict.reason = "Derived update arrived within " +
                              std::to_string(options_.user_precedence_window.count()) +
                              " ms of a user edit";
            conflicts.push_back(std::move(conflict));
        }
    }

    auto integrity = check_integrity(change);
    if (integrity.is_err()) {
        return Out::err(integrity.unwrap_err().with_context("Integrity check for change " +
                                                            change.id.to_string()));
    }
    if (integrity.unwrap()) {
        conflicts.push_back(std::move(*integrity.unwrap()));
    }

    // The producer read an older version than the store is at
    if (change.base_version && current_version && *change.base_version != *current_version) {
        std::vector<ChangeRecord> newer;
        for (const auto* tracked : tracker_.accepted_since(*change.base_version)) {
            if (tracked->change.id == change.id) continue;
            if (overlaps(tracked->affected, affected)) {
                newer.push_back(tracked->change);
            }
        }
        if (!newer.empty()) {
            auto conflict = make_conflict(ConflictType::VersionMismatch, std::move(newer));
            conflict.severity = ConflictSeverity::Medium;
            conflict.auto_resolvable = true;
            conflict.reason = "Change was computed against version " + change.base_version->to_string() +
                              " but the store is at " + current_version->to_string();
            conflicts.push_back(std::move(conflict));
        }
    }

    for (const auto& conflict : conflicts) {
        qCDebug(quireConflictLog) << "ConflictResolver: detected" << conflict_type_name(conflict.type)
                                  << "severity" << severity_name(conflict.severity)
                                  << "for" << describe(change).c_str();
    }
    return Out::ok(std::move(conflicts));
}

Res<std::optional<DataConflict>> ConflictResolver::check_integrity(const ChangeRecord& change) {
    using Out = Res<std::optional<DataConflict>>;

    DataConflict conflict;
    conflict.id = Uuid::generate();
    conflict.type = ConflictType::IntegrityViolation;
    conflict.detected_at = Timestamp::now();

    if (auto* deleted = std::get_if<changes::EntityDeleted>(&change.kind)) {
        auto links = repo_.links_of(deleted->entity_id);
        if (links.is_err()) return Out::err(links.unwrap_err());
        if (links.unwrap().empty()) return Out::ok(std::nullopt);

        conflict.affected.insert(deleted->entity_id);
        for (const auto& link : links.unwrap()) {
            conflict.affected.insert(link.id);
            conflict.affected.insert(link.source);
            conflict.affected.insert(link.target);
        }
        // Recent relationship edits on the doomed entity collide with the delete
        for (const auto* tracked : tracker_.accepted()) {
            const Link* link = nullptr;
            if (auto* added = std::get_if<changes::LinkAdded>(&tracked->change.kind)) link = &added->link;
            if (auto* removed = std::get_if<changes::LinkRemoved>(&tracked->change.kind)) link = &removed->link;
            if (link && link->touches(deleted->entity_id)) {
                conflict.changes.push_back(tracked->change);
            }
        }
        conflict.changes.push_back(change);
        conflict.dangling_links = std::move(links).unwrap();
        conflict.severity = ConflictSeverity::High;
        conflict.auto_resolvable = true;
        conflict.reason = "Deleting entity " + deleted->entity_id.to_string() + " would leave " +
                          std::to_string(conflict.dangling_links.size()) + " link(s) dangling";
        return Out::ok(std::move(conflict));
    }

    auto* added = std::get_if<changes::LinkAdded>(&change.kind);
    if (!added) return Out::ok(std::nullopt);

    const Link& link = added->link;
    conflict.affected = {link.id, link.source, link.target};
    conflict.changes.push_back(change);

    if (link.source == link.target) {
        conflict.severity = ConflictSeverity::Medium;
        conflict.auto_resolvable = false;
        conflict.reason = "Link " + link.id.to_string() + " points at its own source";
        return Out::ok(std::move(conflict));
    }

    for (const auto& endpoint : {link.source, link.target}) {
        auto entity = repo_.get_entity(endpoint);
        if (entity.is_err()) return Out::err(entity.unwrap_err());
        if (!entity.unwrap()) {
            conflict.severity = ConflictSeverity::High;
            conflict.auto_resolvable = false;
            conflict.reason = "Link endpoint " + endpoint.to_string() + " does not exist";
            return Out::ok(std::move(conflict));
        }
    }

    auto cycle = reaches(link.target, link.source, link.id);
    if (cycle.is_err()) return Out::err(cycle.unwrap_err());
    if (cycle.unwrap()) {
        conflict.severity = ConflictSeverity::Medium;
        conflict.auto_resolvable = false;
        conflict.reason = "Link " + link.source.short_hex() + " -> " + link.target.short_hex() +
                          " would create a cycle";
        return Out::ok(std::move(conflict));
    }

    return Out::ok(std::nullopt);
}

Res<bool> ConflictResolver::reaches(const Uuid& from, const Uuid& to, const Uuid& ignore_link) {
    std::set<Uuid> visited{from};
    std::vector<Uuid> frontier{from};
    while (!frontier.empty()) {
        auto node = frontier.back();
        frontier.pop_back();

        auto links = repo_.links_of(node);
        if (links.is_err()) return Res<bool>::err(links.unwrap_err());
        for (const auto& link : links.unwrap()) {
            if (link.id == ignore_link || link.source != node) continue;
            if (link.target == to) return Res<bool>::ok(true);
            if (visited.insert(link.target).second) {
                frontier.push_back(link.target);
            }
        }
    }
    return Res<bool>::ok(false);
}

ConflictResolution ConflictResolver::resolve(const std::vector<DataConflict>& conflicts) {
    ConflictResolution resolution;
    resolution.id = Uuid::generate();
    resolution.resolved_at = Timestamp::now();

    std::vector<ChangeRecord> accepted;
    std::vector<std::string> unresolved;

    for (const auto& conflict : conflicts) {
        resolution.conflicts.push_back(conflict.id);
        if (!conflict.auto_resolvable) {
            unresolved.push_back(conflict.reason);
            continue;
        }

        const auto strategy = select_strategy(conflict);
        resolution.strategies.push_back(strategy);
        ++stats_.by_strategy[strategy];

        auto outcome = consistency::resolve(strategy, conflict);
        if (!outcome.success) {
            unresolved.push_back(conflict.reason + " (" + outcome.message + ")");
            continue;
        }
        for (const auto& c : outcome.accepted) add_unique(accepted, c);
        for (const auto& c : outcome.rejected) add_unique(resolution.rejected, c);
        for (const auto& c : outcome.superseded) add_unique(resolution.superseded, c);
    }

    // A rejection by any strategy wins; merged changes replace their sources
    for (const auto& change : accepted) {
        if (!resolution.is_rejected(change.id) && !resolution.is_superseded(change.id)) {
            resolution.accepted.push_back(change);
        }
    }

    resolution.manual_intervention_required = !unresolved.empty();
    resolution.success = unresolved.empty();
    if (resolution.success) {
        resolution.detail = std::to_string(resolution.accepted.size()) + " accepted, " +
                            std::to_string(resolution.rejected.size()) + " rejected";
        qCInfo(quireConflictLog) << "ConflictResolver: resolved" << conflicts.size() << "conflict(s):"
                                 << resolution.detail.c_str();
    } else {
        resolution.accepted.clear();
        for (const auto& reason : unresolved) {
            if (!resolution.detail.empty()) resolution.detail += "; ";
            resolution.detail += reason;
        }
        qCWarning(quireConflictLog) << "ConflictResolver: manual intervention required:"
                                    << resolution.detail.c_str();
    }

    ++stats_.resolutions;
    stats_.conflicts += conflicts.size();
    if (resolution.success) ++stats_.successful;

    history_.push_back(resolution);
    while (history_.size() > options_.history_limit) {
        history_.pop_front();
    }
    return resolution;
}

std::vector<ResolutionSuggestion> ConflictResolver::suggest_resolutions(const DataConflict& conflict) const {
    const bool mergeable = conflict.changes.size() == 2 &&
                           can_merge(conflict.changes[0], conflict.changes[1]);

    std::vector<ResolutionSuggestion> out{
        {ResolutionStrategy::UserPriority, 0.95, "Keep the user's changes and discard automated ones"},
        {ResolutionStrategy::Timestamp, 0.8, "Keep the most recent change"},
        {ResolutionStrategy::ContentMerge, mergeable ? 0.85 : 0.3,
         mergeable ? "Changes touch different fields and can be combined"
                   : "Changes touch the same fields"},
        {ResolutionStrategy::Confidence, 0.75, "Keep the change with the highest confidence"},
        {ResolutionStrategy::SemanticMerge, 0.7, "Accept all changes and repair relationships"},
    };
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.confidence > b.confidence;
    });
    return out;
}

Error unresolved_error(const std::vector<DataConflict>& conflicts) {
    std::ostringstream oss;
    oss << "Manual resolution required";
    for (const auto& conflict : conflicts) {
        if (conflict.auto_resolvable) continue;
        oss << "\n- " << conflict_type_name(conflict.type) << " (" << severity_name(conflict.severity)
            << "): " << conflict.reason;
        for (const auto& change : conflict.changes) {
            oss << "\n  * " << describe(change) << " at " << change.timestamp.to_iso_string()
                << " affecting " << short_ids(affected_ids(change));
        }
    }
    return Error::structural(oss.str(), ErrorCode::ConflictUnresolved);
}

} // namespace quire::consistency
