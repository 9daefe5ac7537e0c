#pragma once

#include "consistency/backup_service.hpp"
#include "consistency/conflict_resolver.hpp"
#include "consistency/integrity_monitor.hpp"
#include "consistency/notifier.hpp"
#include "consistency/transaction_manager.hpp"
#include "consistency/version_history.hpp"
#include "core/change.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <future>
#include <optional>
#include <set>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

class OwnerContext;

// Component options drawn from one configuration.
[[nodiscard]] TransactionManager::Options transaction_options(const ConsistencyConfig& config);
[[nodiscard]] ConflictResolver::Options resolver_options(const ConsistencyConfig& config);
[[nodiscard]] VersionHistory::Options history_options(const ConsistencyConfig& config);
[[nodiscard]] IntegrityMonitor::Options monitor_options(const ConsistencyConfig& config);
[[nodiscard]] BackupService::Options backup_options(const ConsistencyConfig& config);

/**
 * ConsistencyResult - what happened to one submitted change.
 */
struct ConsistencyResult {
    // Absent when the change was rejected or changed nothing.
    std::optional<Uuid> version_id;
    std::vector<DataConflict> conflicts;
    std::optional<ConflictResolution> resolution;
    bool accepted = false;
    // Changes written to the store, synthesized relationship removals first.
    std::vector<ChangeRecord> applied;
    std::chrono::milliseconds processing_time{0};
};

struct ConsistencyMetrics {
    size_t total_changes = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t failed = 0;
    size_t conflicts = 0;
    size_t backups_triggered = 0;
    int64_t total_processing_ms = 0;

    [[nodiscard]] double average_processing_ms() const {
        return total_changes == 0 ? 0.0
                                  : static_cast<double>(total_processing_ms) / static_cast<double>(total_changes);
    }
};

/**
 * ConsistencyManager - the single entry point through which collaborators
 * mutate the store.
 *
 * Each submitted change is tracked, checked for conflicts, resolved,
 * committed as one transaction, versioned and announced. Every component
 * is owned by the caller and passed in by reference.
 *
 * Not thread-safe. Once attached to an OwnerContext, call it only from
 * that context's thread (post_change() does this for you).
 */
class ConsistencyManager {
public:
    ConsistencyManager(storage::EntityRepository& repo,
                       TransactionManager& txns,
                       ConflictResolver& resolver,
                       VersionHistory& history,
                       IntegrityMonitor& monitor,
                       BackupService& backups,
                       Notifier& notifier,
                       ConsistencyConfig config);
    ~ConsistencyManager();

    ConsistencyManager(const ConsistencyManager&) = delete;
    ConsistencyManager& operator=(const ConsistencyManager&) = delete;

    /**
     * Record the baseline version and route the monitor's repair
     * requests to the backup service.
     */
    [[nodiscard]] Status open();

    [[nodiscard]] bool is_open() const noexcept { return opened_; }

    /**
     * Validate, resolve, apply and version one change.
     *
     * A change rejected by conflict resolution is not an error: the
     * result reports accepted == false and nothing is written. Conflicts
     * that need a human fail with ConflictUnresolved.
     */
    [[nodiscard]] Res<ConsistencyResult> submit_change(const ChangeRecord& change);

    /**
     * submit_change() on the attached owner context. Without a context the
     * change is processed inline and the future is already ready.
     */
    [[nodiscard]] std::future<Res<ConsistencyResult>> post_change(ChangeRecord change);

    [[nodiscard]] Status undo();
    [[nodiscard]] Status redo();
    [[nodiscard]] Status jump_to_version(const Uuid& version_id);

    [[nodiscard]] std::vector<HistoryEntry> history(size_t limit = 50) const;

    [[nodiscard]] std::optional<Uuid> current_version() const { return history_.current_version_id(); }

    [[nodiscard]] Res<BackupMetadata> create_backup(BackupTrigger trigger = BackupTrigger::Manual);

    /**
     * Restore a backup and start a fresh history from the restored store.
     */
    [[nodiscard]] Status restore_backup(const Uuid& backup_id);

    /**
     * Repair critical findings and start a fresh history from the result.
     */
    [[nodiscard]] Res<RepairReport> repair();

    /**
     * Run the periodic work on `context`: transaction sweeps, integrity
     * checks, and backups with retention when a backup directory is set.
     */
    void attach(OwnerContext& context);

    /**
     * Cancel the periodic work and unhook the notifier. Called off the
     * owner thread, this waits for everything already queued there.
     */
    void detach();

    [[nodiscard]] const ConsistencyMetrics& metrics() const noexcept { return metrics_; }

private:
    [[nodiscard]] Status rebaseline(const char* reason);
    [[nodiscard]] std::set<Uuid> affected_between(const std::optional<Uuid>& from,
                                                  const std::optional<Uuid>& to) const;
    void announce(const std::set<Uuid>& affected);
    void maybe_backup(const ChangeRecord& change);
    void finish(ConsistencyResult& result, std::chrono::steady_clock::time_point started);

    storage::EntityRepository& repo_;
    TransactionManager& txns_;
    ConflictResolver& resolver_;
    VersionHistory& history_;
    IntegrityMonitor& monitor_;
    BackupService& backups_;
    Notifier& notifier_;
    ConsistencyConfig config_;
    OwnerContext* context_ = nullptr;
    bool opened_ = false;
    ConsistencyMetrics metrics_;
};

} // namespace quire::consistency
