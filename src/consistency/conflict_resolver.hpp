#pragma once

#include "core/change.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

enum class ConflictType {
    SimultaneousEdit,
    IntegrityViolation,
    UserVsDerived,
    VersionMismatch
};

enum class ConflictSeverity {
    Low,
    Medium,
    High
};

enum class ResolutionStrategy {
    UserPriority,
    Timestamp,
    ContentMerge,
    Confidence,
    SemanticMerge
};

[[nodiscard]] const char* conflict_type_name(ConflictType type);
[[nodiscard]] const char* severity_name(ConflictSeverity severity);
[[nodiscard]] const char* strategy_name(ResolutionStrategy strategy);

/**
 * DataConflict - a collision between an incoming change and changes
 * already applied (or the store's current relationships).
 *
 * Integrity violations may carry the incoming change alone when the
 * collision is with stored data rather than with another change.
 */
struct DataConflict {
    Uuid id;
    std::vector<ChangeRecord> changes;
    ConflictType type{ConflictType::SimultaneousEdit};
    ConflictSeverity severity{ConflictSeverity::Low};
    bool auto_resolvable = true;
    std::set<Uuid> affected;
    std::string reason;
    // Links left dangling if the conflicting delete goes ahead.
    std::vector<Link> dangling_links;
    Timestamp detected_at;
};

/**
 * ConflictResolution - outcome of resolving one conflict set.
 *
 * Every colliding change ends up in exactly one of `accepted`,
 * `rejected` or `superseded` (folded into a merged change that is
 * itself accepted), unless manual intervention is required.
 */
struct ConflictResolution {
    Uuid id;
    std::vector<Uuid> conflicts;
    std::vector<ChangeRecord> accepted;
    std::vector<ChangeRecord> rejected;
    std::vector<ChangeRecord> superseded;
    std::vector<ResolutionStrategy> strategies;
    bool success = false;
    bool manual_intervention_required = false;
    std::string detail;
    Timestamp resolved_at;

    [[nodiscard]] bool is_accepted(const Uuid& change_id) const;
    [[nodiscard]] bool is_rejected(const Uuid& change_id) const;
    [[nodiscard]] bool is_superseded(const Uuid& change_id) const;
};

/**
 * Result of one strategy applied to one conflict.
 */
struct StrategyOutcome {
    std::vector<ChangeRecord> accepted;
    std::vector<ChangeRecord> rejected;
    std::vector<ChangeRecord> superseded;
    bool success = false;
    std::string message;
};

struct ResolutionSuggestion {
    ResolutionStrategy strategy;
    double confidence = 0.0;
    std::string rationale;
};

struct ResolutionStats {
    size_t resolutions = 0;
    size_t successful = 0;
    size_t conflicts = 0;
    std::map<ResolutionStrategy, size_t> by_strategy;

    [[nodiscard]] double success_rate() const {
        return resolutions == 0 ? 0.0 : static_cast<double>(successful) / static_cast<double>(resolutions);
    }
    [[nodiscard]] double average_conflicts() const {
        return resolutions == 0 ? 0.0 : static_cast<double>(conflicts) / static_cast<double>(resolutions);
    }
};

/**
 * Default confidence for a change: explicit score, else by origin.
 */
[[nodiscard]] double confidence_of(const ChangeRecord& change);

/**
 * True for two changes of mergeable kinds that set disjoint fields.
 */
[[nodiscard]] bool can_merge(const ChangeRecord& a, const ChangeRecord& b);

/**
 * The strategy used for a conflict. Each type maps to exactly one
 * strategy; content-merge only for two same-origin mergeable changes.
 */
[[nodiscard]] ResolutionStrategy select_strategy(const DataConflict& conflict);

/**
 * Apply one strategy to one conflict. Does not consult
 * `conflict.auto_resolvable`; callers decide whether to run it.
 */
[[nodiscard]] StrategyOutcome resolve(ResolutionStrategy strategy, const DataConflict& conflict);

enum class TrackStatus {
    Pending,
    Accepted,
    Rejected
};

struct TrackedChange {
    ChangeRecord change;
    std::set<Uuid> affected;
    TrackStatus status{TrackStatus::Pending};
    // Version the change produced once applied.
    std::optional<Uuid> version_id;
};

/**
 * ChangeTracker - bounded window of recently submitted changes, oldest first.
 */
class ChangeTracker {
public:
    explicit ChangeTracker(size_t limit) : limit_(limit) {}

    void track(const ChangeRecord& change);
    void mark_accepted(const Uuid& change_id, std::optional<Uuid> version_id);
    void mark_rejected(const Uuid& change_id);

    [[nodiscard]] const TrackedChange* find(const Uuid& change_id) const;

    /**
     * Accepted changes, oldest first.
     */
    [[nodiscard]] std::vector<const TrackedChange*> accepted() const;

    /**
     * Accepted changes applied after the change that produced
     * `version_id`. All accepted changes if that version is not tracked.
     */
    [[nodiscard]] std::vector<const TrackedChange*> accepted_since(const Uuid& version_id) const;

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    TrackedChange* find_mut(const Uuid& change_id);

    size_t limit_;
    std::deque<TrackedChange> entries_;
};

/**
 * ConflictResolver - detects collisions for an incoming change and
 * resolves them by conflict type.
 *
 * Reads the store for relationship checks but never writes it.
 */
class ConflictResolver {
public:
    struct Options {
        std::chrono::milliseconds simultaneous_edit_window{std::chrono::seconds(5)};
        std::chrono::milliseconds user_precedence_window{std::chrono::seconds(60)};
        size_t history_limit = 100;
        size_t tracker_limit = 256;
    };

    ConflictResolver(storage::EntityRepository& repo, Options options);

    [[nodiscard]] ChangeTracker& tracker() noexcept { return tracker_; }
    [[nodiscard]] const ChangeTracker& tracker() const noexcept { return tracker_; }

    /**
     * Conflicts between `change` and tracked accepted changes or stored
     * relationships. `current_version` is the version the store is at.
     */
    [[nodiscard]] Res<std::vector<DataConflict>> detect_conflicts(
        const ChangeRecord& change,
        std::optional<Uuid> current_version = std::nullopt);

    /**
     * Resolve every conflict and aggregate. A change rejected by any
     * conflict is rejected; a conflict that cannot be resolved
     * automatically makes the whole resolution fail.
     */
    [[nodiscard]] ConflictResolution resolve(const std::vector<DataConflict>& conflicts);

    /**
     * Strategies ranked by confidence, for manual resolution.
     */
    [[nodiscard]] std::vector<ResolutionSuggestion> suggest_resolutions(const DataConflict& conflict) const;

    [[nodiscard]] const std::deque<ConflictResolution>& history() const noexcept { return history_; }
    [[nodiscard]] const ResolutionStats& stats() const noexcept { return stats_; }

private:
    [[nodiscard]] Res<std::optional<DataConflict>> check_integrity(const ChangeRecord& change);
    [[nodiscard]] Res<bool> reaches(const Uuid& from, const Uuid& to, const Uuid& ignore_link);

    storage::EntityRepository& repo_;
    Options options_;
    ChangeTracker tracker_;
    std::deque<ConflictResolution> history_;
    ResolutionStats stats_;
};

/**
 * Error for a conflict set needing manual resolution, listing each
 * colliding change with its timestamp and affected ids.
 */
[[nodiscard]] Error unresolved_error(const std::vector<DataConflict>& conflicts);

} // namespace quire::consistency
