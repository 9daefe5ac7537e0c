#include "core/config.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace quire {

namespace {

std::chrono::milliseconds read_ms(QSettings& settings, const char* key, std::chrono::milliseconds fallback) {
    bool ok = false;
    auto value = settings.value(QLatin1String(key)).toLongLong(&ok);
    if (!ok || value <= 0) return fallback;
    return std::chrono::milliseconds(value);
}

size_t read_count(QSettings& settings, const char* key, size_t fallback) {
    bool ok = false;
    auto value = settings.value(QLatin1String(key)).toULongLong(&ok);
    if (!ok || value == 0) return fallback;
    return static_cast<size_t>(value);
}

QString data_dir() {
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
}

void apply_environment(ConsistencyConfig& config) {
    const auto backup_override = qEnvironmentVariable("QUIRE_BACKUP_DIR");
    if (!backup_override.isEmpty()) {
        config.backup_dir = backup_override.toStdString();
    }
    const auto history_override = qEnvironmentVariable("QUIRE_HISTORY_LOG");
    if (!history_override.isEmpty()) {
        config.history_log_path = history_override.toStdString();
    }
}

void apply_default_paths(ConsistencyConfig& config) {
    const auto base = data_dir();
    if (base.isEmpty()) return;
    if (config.backup_dir.empty()) {
        config.backup_dir = QDir(base).filePath(QStringLiteral("backups")).toStdString();
    }
    if (config.history_log_path.empty()) {
        config.history_log_path = QDir(base).filePath(QStringLiteral("version_history.json")).toStdString();
    }
}

} // anonymous namespace

ConsistencyConfig load_config(QSettings& settings) {
    ConsistencyConfig config;
    settings.beginGroup(QStringLiteral("consistency"));

    config.max_active_transactions = read_count(settings, "maxActiveTransactions", config.max_active_transactions);
    config.transaction_timeout = read_ms(settings, "transactionTimeoutMs", config.transaction_timeout);
    config.transaction_sweep_interval = read_ms(settings, "transactionSweepMs", config.transaction_sweep_interval);
    config.simultaneous_edit_window = read_ms(settings, "simultaneousEditWindowMs", config.simultaneous_edit_window);
    config.user_precedence_window = read_ms(settings, "userPrecedenceWindowMs", config.user_precedence_window);
    config.resolution_history_limit = read_count(settings, "resolutionHistoryLimit", config.resolution_history_limit);
    config.max_versions = read_count(settings, "maxVersions", config.max_versions);
    config.max_history_bytes = read_count(settings, "maxHistoryBytes", config.max_history_bytes);
    config.snapshot_interval = read_count(settings, "snapshotInterval", config.snapshot_interval);
    config.quick_check_interval = read_ms(settings, "quickCheckIntervalMs", config.quick_check_interval);
    config.full_check_interval = read_ms(settings, "fullCheckIntervalMs", config.full_check_interval);
    config.max_tag_length = read_count(settings, "maxTagLength", config.max_tag_length);
    config.auto_backup_interval = read_ms(settings, "autoBackupIntervalMs", config.auto_backup_interval);
    config.backup_max_age = read_ms(settings, "backupMaxAgeMs", config.backup_max_age);
    config.backup_max_count = read_count(settings, "backupMaxCount", config.backup_max_count);
    config.bulk_import_backup_threshold =
        read_count(settings, "bulkImportBackupThreshold", config.bulk_import_backup_threshold);
    config.backup_dir = settings.value(QStringLiteral("backupDir")).toString().toStdString();
    config.history_log_path = settings.value(QStringLiteral("historyLogPath")).toString().toStdString();

    settings.endGroup();

    apply_environment(config);
    apply_default_paths(config);
    return config;
}

ConsistencyConfig default_config() {
    ConsistencyConfig config;
    apply_environment(config);
    apply_default_paths(config);
    return config;
}

} // namespace quire
