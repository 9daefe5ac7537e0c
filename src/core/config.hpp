#pragma once

#include <chrono>
#include <cstddef>
#include <string>

class QSettings;

namespace quire {

/**
 * ConsistencyConfig - every tunable of the consistency core.
 *
 * Defaults are usable as-is; load_config() overlays values stored under
 * the "consistency/" settings group.
 */
struct ConsistencyConfig {
    // Transactions
    size_t max_active_transactions = 10;
    std::chrono::milliseconds transaction_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds transaction_sweep_interval{std::chrono::seconds(1)};

    // Conflict detection
    std::chrono::milliseconds simultaneous_edit_window{std::chrono::seconds(5)};
    std::chrono::milliseconds user_precedence_window{std::chrono::seconds(60)};
    size_t resolution_history_limit = 100;
    size_t recent_change_limit = 256;

    // Version history
    size_t max_versions = 100;
    size_t max_history_bytes = 10 * 1024 * 1024;
    size_t snapshot_interval = 10;
    std::string history_log_path;

    // Integrity monitoring
    std::chrono::milliseconds quick_check_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds full_check_interval{std::chrono::seconds(3600)};
    size_t max_tag_length = 50;

    // Backups
    std::string backup_dir;
    std::chrono::milliseconds auto_backup_interval{std::chrono::hours(6)};
    std::chrono::milliseconds backup_max_age{std::chrono::hours(24 * 30)};
    size_t backup_max_count = 50;
    size_t bulk_import_backup_threshold = 10;
};

/**
 * Read settings over the defaults. QUIRE_BACKUP_DIR and QUIRE_HISTORY_LOG
 * override the stored paths.
 */
[[nodiscard]] ConsistencyConfig load_config(QSettings& settings);

/**
 * Defaults with environment overrides applied, for callers without settings.
 */
[[nodiscard]] ConsistencyConfig default_config();

} // namespace quire
