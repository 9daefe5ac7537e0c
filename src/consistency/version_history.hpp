#pragma once

#include "consistency/version.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quire::storage {
class EntityRepository;
}

namespace quire::consistency {

class TransactionManager;

/**
 * HistoryEntry - display form of one version, as listed to the user and
 * written to the history log.
 */
struct HistoryEntry {
    Uuid id;
    Timestamp timestamp;
    std::string change_kind;
    std::string description;
    std::vector<Uuid> affected;
    std::string checksum;
    bool is_snapshot = false;
    bool is_current = false;
};

struct HistoryMetrics {
    size_t recorded = 0;
    size_t undone = 0;
    size_t redone = 0;
    size_t jumps = 0;
    size_t evicted = 0;
    size_t compacted = 0;
    size_t failed_navigations = 0;
};

/**
 * VersionHistory - linear history of store versions with a cursor.
 *
 * Version 0 is always a snapshot; later versions are deltas, with a full
 * snapshot every `snapshot_interval` versions so replay stays short.
 * Undo, redo and jump apply their changes through the transaction
 * manager and verify the store checksum against the target version; a
 * mismatch rolls the store back and leaves the cursor where it was.
 */
class VersionHistory {
public:
    struct Options {
        size_t max_versions = 100;
        size_t max_bytes = 10 * 1024 * 1024;
        size_t snapshot_interval = 10;
        std::string log_path;
    };

    VersionHistory(storage::EntityRepository& repo, TransactionManager& txns, Options options);

    /**
     * Drop any history and record the current store as the baseline snapshot.
     */
    [[nodiscard]] Res<Uuid> initialize(Timestamp at = Timestamp::now());

    [[nodiscard]] bool is_initialized() const noexcept { return !versions_.empty(); }

    /**
     * Record a version for a change that has just been committed. Discards
     * any redo branch and enforces the count and byte ceilings.
     */
    [[nodiscard]] Res<Uuid> record(std::string change_kind,
                                   std::string description,
                                   std::set<Uuid> affected,
                                   Delta delta,
                                   Timestamp at = Timestamp::now());

    /**
     * Step back one version. When `from_version` is given it must be the
     * current version, so a stale caller cannot undo someone else's edit.
     */
    [[nodiscard]] Status undo(std::optional<Uuid> from_version = std::nullopt);

    [[nodiscard]] Status redo();

    [[nodiscard]] Status jump_to_version(const Uuid& version_id);

    [[nodiscard]] bool can_undo() const noexcept { return !versions_.empty() && cursor_ > 0; }
    [[nodiscard]] bool can_redo() const noexcept { return cursor_ + 1 < versions_.size(); }

    [[nodiscard]] std::optional<Uuid> current_version_id() const;

    [[nodiscard]] const DataVersion* find(const Uuid& version_id) const;

    /**
     * Newest first, at most `limit` entries.
     */
    [[nodiscard]] std::vector<HistoryEntry> get_history(size_t limit = 50) const;

    /**
     * Reconstruct the store state as of the version at `index`.
     */
    [[nodiscard]] Res<StoreState> materialize(size_t index) const;

    [[nodiscard]] Res<StoreState> state_at(const Uuid& version_id) const;

    /**
     * Evict versions older than `cutoff`, never past the current one.
     * Returns how many were dropped.
     */
    size_t clear_history_before(Timestamp cutoff);

    [[nodiscard]] size_t size() const noexcept { return versions_.size(); }
    [[nodiscard]] size_t total_bytes() const noexcept { return total_bytes_; }
    [[nodiscard]] const HistoryMetrics& metrics() const noexcept { return metrics_; }

    /**
     * Write version metadata to the history log. Payloads are not
     * written; the log is for inspection and cannot be replayed.
     */
    [[nodiscard]] Status persist_log() const;

    [[nodiscard]] static Res<std::vector<HistoryEntry>> load_history_log(const std::string& path);

private:
    struct Slot {
        DataVersion version;
        size_t bytes = 0;
    };

    [[nodiscard]] Status navigate(size_t target, std::vector<Operation> plan, const char* action);
    [[nodiscard]] HistoryEntry entry_for(size_t index) const;
    [[nodiscard]] std::optional<size_t> index_of(const Uuid& version_id) const;
    void push(DataVersion version);
    void enforce_limits();
    bool evict_oldest(bool require_gain = false);
    void compact_deltas();
    void persist_log_or_warn() const;

    storage::EntityRepository& repo_;
    TransactionManager& txns_;
    Options options_;
    std::deque<Slot> versions_;
    size_t cursor_ = 0;
    size_t sequence_ = 0;
    size_t total_bytes_ = 0;
    HistoryMetrics metrics_;
};

} // namespace quire::consistency
