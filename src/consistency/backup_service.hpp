#pragma once

#include "consistency/integrity_monitor.hpp"
#include "core/change.hpp"
#include "core/entity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

class TransactionManager;

enum class BackupTrigger {
    Manual,
    Periodic,
    PreRestore,
    Automatic
};

[[nodiscard]] const char* trigger_name(BackupTrigger trigger);
[[nodiscard]] std::optional<BackupTrigger> parse_trigger(const std::string& name);

/**
 * BackupMetadata - header of one backup file. The file itself is
 * immutable once written.
 */
struct BackupMetadata {
    Uuid id;
    Timestamp created_at;
    std::string type = "full";
    BackupTrigger trigger{BackupTrigger::Manual};
    std::string checksum;
    size_t entity_count = 0;
    size_t link_count = 0;
    size_t size_bytes = 0;
    std::string path;
};

/**
 * What detect_and_repair_corruption() found and did.
 */
struct RepairReport {
    std::map<IssueCategory, size_t> repairs;
    std::vector<IntegrityIssue> issues_before;
    std::vector<IntegrityIssue> issues_after;
    bool cache_rebuilt = false;
    bool schema_migrated = false;
    std::optional<Uuid> restored_from;

    [[nodiscard]] size_t total() const;
};

struct BackupStats {
    size_t count = 0;
    size_t total_bytes = 0;
    std::optional<Timestamp> newest;
    std::optional<Timestamp> oldest;
    std::optional<RepairReport> last_repair;
};

/**
 * BackupService - checksummed full exports of the store, restore, and
 * the repair paths the integrity monitor delegates to.
 *
 * Backups live in `<backup_dir>/<id>.backup` and are written atomically.
 * Every restore verifies the checksum against freshly recomputed content
 * before touching the store.
 */
class BackupService {
public:
    struct Options {
        std::string backup_dir;
        std::chrono::milliseconds max_age{std::chrono::hours(24 * 30)};
        size_t max_count = 50;
        size_t bulk_import_threshold = 10;
        size_t max_tag_length = 50;
    };

    BackupService(storage::EntityRepository& repo,
                  TransactionManager& txns,
                  IntegrityMonitor& monitor,
                  Options options);

    /**
     * Export the store and write it. Fails with BackupInProgress while
     * another backup is being written.
     */
    [[nodiscard]] Res<BackupMetadata> create_backup(BackupTrigger trigger = BackupTrigger::Manual);

    /**
     * Readable backups, newest first.
     */
    [[nodiscard]] Res<std::vector<BackupMetadata>> list_backups() const;

    /**
     * Recompute the content checksum. Unparseable files are reported as
     * ChecksumMismatch.
     */
    [[nodiscard]] Status verify_backup(const Uuid& backup_id) const;

    /**
     * Replace the store with a verified backup. A result with critical
     * integrity issues is rolled back to the pre-restore state; if that
     * rollback fails the error is fatal.
     */
    [[nodiscard]] Status restore(const Uuid& backup_id);

    [[nodiscard]] Status delete_backup(const Uuid& backup_id);

    /**
     * Delete backups past the age limit, then the oldest above the count
     * limit. Returns how many were deleted.
     */
    [[nodiscard]] Res<size_t> apply_retention(Timestamp now = Timestamp::now());

    /**
     * Structural repairs for critical findings, in one transaction, with
     * restore from the newest verifying backup as the fallback.
     */
    [[nodiscard]] Res<RepairReport> detect_and_repair_corruption();

    [[nodiscard]] bool should_create_automatic_backup(const ChangeRecord& change) const;

    [[nodiscard]] std::string backup_path(const Uuid& backup_id) const;

    [[nodiscard]] Res<BackupStats> stats() const;

    [[nodiscard]] bool is_busy() const noexcept { return in_flight_.load(); }

private:
    struct LoadedBackup {
        BackupMetadata metadata;
        StoreState state;
    };

    [[nodiscard]] Res<LoadedBackup> load(const std::string& path) const;
    [[nodiscard]] Res<LoadedBackup> load_verified(const Uuid& backup_id) const;
    [[nodiscard]] Status replace_store(const StoreState& target, const StoreState& current);
    [[nodiscard]] Status restore_fallback(RepairReport& report);

    storage::EntityRepository& repo_;
    TransactionManager& txns_;
    IntegrityMonitor& monitor_;
    Options options_;
    std::atomic<bool> in_flight_{false};
    std::optional<RepairReport> last_repair_;
};

/**
 * Apply the structural repairs to `state` and count them per category.
 * Order: orphaned data, duplicates, schema violations, missing
 * references, invalid relationships.
 */
[[nodiscard]] StoreState repair_state(const StoreState& state, size_t max_tag_length, Timestamp now,
                                      std::map<IssueCategory, size_t>& repairs);

} // namespace quire::consistency
